#pragma once

#include "qsync/defaults.hh"

#include <cstdint>
#include <map>
#include <optional>
#include <set>

namespace qsync {

/// Configures the credit window of a @ref credit_flow.
struct credit_spec {
  /// Number of messages a sender may emit to a destination before it blocks.
  uint32_t initial = defaults::credit::initial;

  /// Number of acknowledged messages after which a receiver grants new
  /// credit to its sender.
  uint32_t more_after = defaults::credit::more_after;
};

/// @relates credit_spec
inline bool operator==(const credit_spec& x, const credit_spec& y) noexcept {
  return x.initial == y.initial && x.more_after == y.more_after;
}

/// Credit-based backpressure between actors. A sender spends one credit per
/// message and blocks once a destination has no credit left. A receiver
/// acknowledges each message and grants `more_after` new credit to the
/// sender after receiving `more_after` messages from it.
///
/// The ledger is owned by a single actor and requires no synchronization.
/// @tparam Handle Identifies peers, e.g., `caf::actor_addr`. Must be
///                ordered.
template <class Handle>
class credit_flow {
public:
  // -- member types -----------------------------------------------------------

  using handle_type = Handle;

  // -- constructors, destructors, and assignment operators --------------------

  credit_flow() = default;

  explicit credit_flow(credit_spec spec) : spec_(spec) {
    // nop
  }

  // -- properties -------------------------------------------------------------

  const credit_spec& spec() const noexcept {
    return spec_;
  }

  /// Returns whether at least one destination ran out of credit.
  bool blocked() const noexcept {
    return !blocked_.empty();
  }

  /// Returns whether `peer` ran out of credit.
  bool blocked(const Handle& peer) const {
    return blocked_.count(peer) != 0;
  }

  /// Returns the remaining credit for sending to `peer`.
  uint32_t credit(const Handle& peer) const {
    if (auto i = credit_from_.find(peer); i != credit_from_.end())
      return i->second > 0 ? static_cast<uint32_t>(i->second) : 0u;
    return spec_.initial;
  }

  /// Returns how many messages from `peer` remain until the next credit
  /// bump.
  uint32_t pending_acks(const Handle& peer) const {
    if (auto i = credit_to_.find(peer); i != credit_to_.end())
      return i->second;
    return spec_.more_after;
  }

  // -- sender side ------------------------------------------------------------

  /// Spends one credit for sending a message to `peer`.
  void send(const Handle& peer) {
    auto i = credit_from_.emplace(peer, static_cast<int64_t>(spec_.initial))
               .first;
    if (--i->second <= 0)
      blocked_.emplace(peer);
  }

  /// Adds `amount` credit for sending to `peer`, unblocking it if the new
  /// credit is positive.
  void handle_bump(const Handle& peer, uint32_t amount) {
    auto i = credit_from_.emplace(peer, int64_t{0}).first;
    i->second += amount;
    if (i->second > 0)
      blocked_.erase(peer);
  }

  // -- receiver side ----------------------------------------------------------

  /// Acknowledges a message received from `peer`.
  /// @returns the credit to grant to `peer` if a bump is due.
  std::optional<uint32_t> ack(const Handle& peer) {
    auto i = credit_to_.emplace(peer, spec_.more_after).first;
    if (i->second <= 1) {
      i->second = spec_.more_after;
      return spec_.more_after;
    }
    --i->second;
    return std::nullopt;
  }

  // -- peer management --------------------------------------------------------

  /// Drops all state for `peer`.
  void peer_down(const Handle& peer) {
    blocked_.erase(peer);
    credit_from_.erase(peer);
    credit_to_.erase(peer);
  }

private:
  credit_spec spec_;

  /// Remaining credit per destination.
  std::map<Handle, int64_t> credit_from_;

  /// Messages until the next bump per source.
  std::map<Handle, uint32_t> credit_to_;

  /// Destinations without credit.
  std::set<Handle> blocked_;
};

} // namespace qsync
