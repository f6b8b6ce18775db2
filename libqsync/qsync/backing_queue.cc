#include "qsync/backing_queue.hh"

namespace qsync {

backing_queue::~backing_queue() {
  // nop
}

void backing_queue::set_ram_duration_target(timespan target) {
  ram_duration_target_ = target;
}

void backing_queue::set_maximum_since_use(timespan age) {
  maximum_since_use_ = age;
}

timespan backing_queue::ram_duration() const {
  return infinite;
}

} // namespace qsync
