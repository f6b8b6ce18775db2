#pragma once

#include "qsync/error.hh"
#include "qsync/message.hh"
#include "qsync/time.hh"

#include <cstdint>
#include <functional>
#include <memory>

namespace qsync {

/// Abstract base class for the message store of a single queue. The sync
/// protocol only borrows a store: the owning queue actor keeps the store alive
/// for the duration of a round.
class backing_queue {
public:
  /// Visitor for @ref fold. Returning `false` stops the iteration.
  using visitor = std::function<bool(const queue_message&,
                                     const message_properties&)>;

  backing_queue() = default;

  virtual ~backing_queue();

  backing_queue(const backing_queue&) = delete;

  backing_queue& operator=(const backing_queue&) = delete;

  // -- modifiers --------------------------------------------------------------

  /// Appends a message to the tail of the queue.
  /// @param msg The message to store.
  /// @param props The delivery properties of *msg*.
  /// @param delivered Whether *msg* counts as delivered at least once.
  virtual error publish(const queue_message& msg,
                        const message_properties& props, bool delivered)
    = 0;

  /// Discards all messages.
  /// @returns the number of discarded messages.
  virtual expected<uint64_t> purge() = 0;

  /// Sets the target duration for keeping messages in RAM. The default
  /// implementation only stores the value.
  virtual void set_ram_duration_target(timespan target);

  /// Limits how long idle resources (e.g., file handles) remain open. The
  /// default implementation only stores the value.
  virtual void set_maximum_since_use(timespan age);

  // -- inspectors -------------------------------------------------------------

  /// Visits all messages in queue order.
  /// @returns an error if the store fails to read its content.
  virtual error fold(const visitor& f) const = 0;

  /// Returns the number of messages in the queue.
  virtual expected<uint64_t> len() const = 0;

  /// Returns the current estimate for how long messages stay in RAM.
  virtual timespan ram_duration() const;

  timespan ram_duration_target() const noexcept {
    return ram_duration_target_;
  }

  timespan maximum_since_use() const noexcept {
    return maximum_since_use_;
  }

private:
  timespan ram_duration_target_ = infinite;
  timespan maximum_since_use_ = infinite;
};

/// @relates backing_queue
using backing_queue_ptr = std::unique_ptr<backing_queue>;

} // namespace qsync
