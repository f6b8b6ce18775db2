#include "qsync/memory_queue.hh"

namespace qsync {

memory_queue::~memory_queue() {
  // nop
}

error memory_queue::publish(const queue_message& msg,
                            const message_properties& props, bool delivered) {
  entries_.push_back(entry{msg, props, delivered});
  return {};
}

expected<uint64_t> memory_queue::purge() {
  ++purge_count_;
  auto result = static_cast<uint64_t>(entries_.size());
  entries_.clear();
  return result;
}

error memory_queue::fold(const visitor& f) const {
  for (auto& x : entries_)
    if (!f(x.msg, x.props))
      break;
  return {};
}

expected<uint64_t> memory_queue::len() const {
  return static_cast<uint64_t>(entries_.size());
}

std::vector<queue_message> memory_queue::messages() const {
  std::vector<queue_message> result;
  result.reserve(entries_.size());
  for (auto& x : entries_)
    result.emplace_back(x.msg);
  return result;
}

} // namespace qsync
