#include "qsync/internal/metric_factory.hh"

#include <utility>

namespace qsync::internal {

// -- 'imports' to safe ourselves some typing ----------------------------------

using counter = metric_factory::counter;

using counter_family = metric_factory::counter_family;

// -- master metrics -----------------------------------------------------------

using master_t = metric_factory::master_t;

counter_family* master_t::sync_messages_family() {
  return &prometheus::BuildCounter()
            .Name("qsync_sync_messages_total")
            .Help("Total number of messages relayed by sync masters.")
            .Register(*reg_);
}

counter* master_t::sync_messages_instance(std::string queue) {
  return &sync_messages_family()->Add({{"queue", std::move(queue)}});
}

counter_family* master_t::dropped_slaves_family() {
  return &prometheus::BuildCounter()
            .Name("qsync_dropped_slaves_total")
            .Help("Total number of slaves removed from ongoing rounds.")
            .Register(*reg_);
}

counter* master_t::dropped_slaves_instance() {
  return &dropped_slaves_family()->Add({});
}

// -- slave metrics ------------------------------------------------------------

using slave_t = metric_factory::slave_t;

counter_family* slave_t::rounds_family() {
  return &prometheus::BuildCounter()
            .Name("qsync_slave_rounds_total")
            .Help("Total number of sync rounds per outcome on slaves.")
            .Register(*reg_);
}

slave_t::rounds_t slave_t::rounds_instances() {
  auto fm = rounds_family();
  rounds_t result;
  result.completed = &fm->Add({{"outcome", "completed"}});
  result.failed = &fm->Add({{"outcome", "failed"}});
  result.stopped = &fm->Add({{"outcome", "stopped"}});
  return result;
}

} // namespace qsync::internal
