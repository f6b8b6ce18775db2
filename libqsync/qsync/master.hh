#pragma once

#include "qsync/backing_queue.hh"
#include "qsync/configuration.hh"
#include "qsync/error.hh"
#include "qsync/round_id.hh"

#include <caf/actor.hpp>
#include <caf/fwd.hpp>

#include <string>
#include <vector>

/// Drives a sync round from the master replica of a queue.
///
/// A round takes two steps. First, @ref prepare spawns the syncer for the
/// round, which announces the round to the candidate slaves and waits for
/// their readiness. Second, @ref run feeds all messages of the master store
/// into the syncer, one message at a time.
///
/// Both functions run inside the actor of the master queue. Since the syncer
/// is linked to this actor, the caller must not turn exit messages into
/// errors while a round is in progress.
namespace qsync::master {

/// Spawns the syncer for the round `ref` and links it to `self`.
/// @param self The actor of the master queue.
/// @param ref The ID of the new round.
/// @param slaves The candidate slaves of the round.
/// @param opts Settings for the syncer.
/// @returns the handle of the syncer.
caf::actor prepare(caf::blocking_actor* self, round_id ref,
                   std::vector<caf::actor> slaves,
                   const sync_options& opts = {});

/// Sends all messages of `store` to `syncer` and waits for an acknowledgement
/// after each message. Afterwards, signals the end of the round to the syncer.
/// @param self The actor of the master queue.
/// @param syncer The handle returned from @ref prepare.
/// @param ref The ID of the round.
/// @param queue_name The name of the queue for logging and metrics.
/// @param store The message store of the master.
/// @param opts Settings for progress reporting and metrics.
/// @returns a default-constructed error on success, an error with code
///          `ec::round_aborted` if `self` received an exit message while
///          waiting for an acknowledgement, or an error with code
///          `ec::backend_failure` if `store` fails to read its messages. In
///          the latter case, `run` also terminates `syncer` with that error.
error run(caf::blocking_actor* self, const caf::actor& syncer, round_id ref,
          const std::string& queue_name, backing_queue& store,
          const sync_options& opts = {});

} // namespace qsync::master
