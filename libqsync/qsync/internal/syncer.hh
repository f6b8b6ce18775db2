#pragma once

#include "qsync/configuration.hh"
#include "qsync/round_id.hh"

#include <caf/actor.hpp>
#include <caf/fwd.hpp>

#include <vector>

namespace qsync::internal {

/// Intermediary between the master and the slaves of a single round. Relays
/// each message from the master to all live slaves while respecting the
/// credit of each slave. Terminates after the master signals the end of the
/// round or when receiving an exit message.
/// @param self The syncer itself.
/// @param ref The ID of the round.
/// @param master The actor of the master queue, linked to `self`.
/// @param slaves The candidate slaves in participant order.
/// @param opts Credit settings, broadcast channel, and metrics registry.
void syncer(caf::blocking_actor* self, round_id ref, caf::actor master,
            std::vector<caf::actor> slaves, sync_options opts);

} // namespace qsync::internal
