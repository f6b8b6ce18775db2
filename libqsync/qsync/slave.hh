#pragma once

#include "qsync/backing_queue.hh"
#include "qsync/configuration.hh"
#include "qsync/credit_flow.hh"
#include "qsync/error.hh"
#include "qsync/round_id.hh"

#include <caf/actor.hpp>
#include <caf/actor_addr.hpp>
#include <caf/fwd.hpp>

#include <string>

namespace qsync {

/// Describes how a round ended for a slave.
enum class sync_outcome {
  /// The slave received all messages of the master.
  completed,
  /// The syncer went down before completing the round. The slave purged its
  /// store and requires a new round.
  failed,
  /// The slave received an exit message or its store failed. The caller
  /// should terminate the actor of the slave.
  stopped,
};

/// @relates sync_outcome
std::string to_string(sync_outcome x);

/// The result of @ref slave::run.
struct slave_result {
  sync_outcome outcome;

  /// The exit reason or store error for `stopped`, the exit reason of the
  /// syncer (or the purge error) for `failed`, or a default-constructed error
  /// for `completed`.
  error reason;
};

} // namespace qsync

/// Receives a sync round on a slave replica of a queue.
namespace qsync::slave {

/// Runs the slave side of the round `ref` until it completes, fails, or the
/// slave stops. Purges `store` before receiving the first message and stops
/// with `ec::backend_failure` if the purge fails.
/// @param self The actor of the slave queue.
/// @param ref The ID of the round as announced in the `sync_start_msg`.
/// @param syncer The syncer as announced in the `sync_start_msg`.
/// @param store The message store of the slave.
/// @param credit The credit ledger of `self`.
/// @param opts Hook for `update_ram_duration` and metrics registry.
slave_result run(caf::blocking_actor* self, round_id ref,
                 const caf::actor& syncer, backing_queue& store,
                 credit_flow<caf::actor_addr>& credit,
                 const sync_options& opts = {});

} // namespace qsync::slave
