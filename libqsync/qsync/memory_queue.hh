#pragma once

#include "qsync/backing_queue.hh"

#include <deque>
#include <vector>

namespace qsync {

/// A message store that keeps all messages in memory.
class memory_queue : public backing_queue {
public:
  /// A single entry in the queue.
  struct entry {
    queue_message msg;
    message_properties props;
    bool delivered = false;
  };

  memory_queue() = default;

  ~memory_queue() override;

  error publish(const queue_message& msg, const message_properties& props,
                bool delivered) override;

  expected<uint64_t> purge() override;

  error fold(const visitor& f) const override;

  expected<uint64_t> len() const override;

  // -- properties -------------------------------------------------------------

  const std::deque<entry>& entries() const noexcept {
    return entries_;
  }

  /// Returns all stored messages in queue order.
  std::vector<queue_message> messages() const;

  /// Returns how many times `purge` has been called.
  size_t purge_count() const noexcept {
    return purge_count_;
  }

private:
  std::deque<entry> entries_;
  size_t purge_count_ = 0;
};

} // namespace qsync
