#pragma once

#include "qsync/round_id.hh"

#include <caf/actor.hpp>

#include <string>
#include <vector>

namespace qsync {

/// Announces a new sync round over the broadcast channel. Receivers that
/// find themselves in `slaves` enter @ref slave::run for this round.
struct sync_start_msg {
  /// The ID of the announced round.
  round_id ref;

  /// The syncer of the round.
  caf::actor syncer;

  /// All candidate slaves of the round.
  std::vector<caf::actor> slaves;

  /// Returns whether `hdl` is one of the candidate slaves.
  bool includes(const caf::actor& hdl) const;
};

/// @relates sync_start_msg
template <class Inspector>
bool inspect(Inspector& f, sync_start_msg& x) {
  return f.object(x).fields(f.field("ref", x.ref), f.field("syncer", x.syncer),
                            f.field("slaves", x.slaves));
}

/// @relates sync_start_msg
std::string to_string(const sync_start_msg& x);

} // namespace qsync
