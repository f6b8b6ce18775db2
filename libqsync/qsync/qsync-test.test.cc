#define CAF_TEST_NO_MAIN

#include "qsync/qsync-test.test.hh"

#include <caf/test/unit_test_impl.hpp>

#include <caf/blocking_actor.hpp>

#include "qsync/logger.hh"

#include <set>
#include <utility>

using namespace qsync;

// -- message stores for testing -----------------------------------------------

error capped_queue::publish(const queue_message& msg,
                            const message_properties& props, bool delivered) {
  auto n = len();
  if (n && *n >= capacity_)
    return make_error(ec::backend_failure, "queue is full");
  return memory_queue::publish(msg, props, delivered);
}

error unreadable_queue::fold(const visitor&) const {
  return make_error(ec::backend_failure, "unreadable");
}

expected<uint64_t> unpurgeable_queue::purge() {
  if (successes_ == 0)
    return make_error(ec::backend_failure, "cannot purge");
  --successes_;
  return memory_queue::purge();
}

// -- observers ----------------------------------------------------------------

void recording_observer::on_round_start(round_id, size_t ready) {
  std::unique_lock<std::mutex> guard{mtx_};
  round_starts_.emplace_back(ready);
}

void recording_observer::on_slave_down(round_id, const error&) {
  std::unique_lock<std::mutex> guard{mtx_};
  ++slave_downs_;
}

void recording_observer::on_round_done(round_id, const std::string&,
                                       size_t count) {
  std::unique_lock<std::mutex> guard{mtx_};
  round_dones_.emplace_back(count);
}

void recording_observer::observe(event_ptr what) {
  std::unique_lock<std::mutex> guard{mtx_};
  identifiers_.emplace_back(what->identifier);
}

bool recording_observer::accepts(event::severity_level,
                                 event::component_type) const {
  return true;
}

std::vector<std::string> recording_observer::identifiers() {
  std::unique_lock<std::mutex> guard{mtx_};
  return identifiers_;
}

std::vector<size_t> recording_observer::round_starts() {
  std::unique_lock<std::mutex> guard{mtx_};
  return round_starts_;
}

std::vector<size_t> recording_observer::round_dones() {
  std::unique_lock<std::mutex> guard{mtx_};
  return round_dones_;
}

size_t recording_observer::slave_downs() {
  std::unique_lock<std::mutex> guard{mtx_};
  return slave_downs_;
}

// -- utility ------------------------------------------------------------------

std::vector<std::pair<queue_message, message_properties>>
make_messages(size_t n) {
  std::vector<std::pair<queue_message, message_properties>> result;
  for (size_t i = 1; i <= n; ++i) {
    queue_message msg;
    msg.id = i;
    msg.routing_key = "key";
    msg.payload = "M" + std::to_string(i);
    msg.persistent = i % 3 == 0;
    auto props = make_properties(msg, i % 2 == 0);
    result.emplace_back(std::move(msg), props);
  }
  return result;
}

void fill(backing_queue& store,
          const std::vector<std::pair<queue_message, message_properties>>& xs) {
  for (auto& [msg, props] : xs)
    if (auto err = store.publish(msg, props, false))
      FAIL("failed to fill store: " << to_string(err));
}

uint64_t len_of(const backing_queue& store) {
  auto n = store.len();
  if (!n)
    FAIL("failed to read the length of a store: " << to_string(n.error()));
  return *n;
}

void replica(caf::blocking_actor* self, backing_queue* store,
             sync_options opts, slave_result* out) {
  credit_flow<caf::actor_addr> credit{opts.credit};
  auto hdl = caf::actor_cast<caf::actor>(self);
  bool running = true;
  self->receive_while(running)(
    [&](atom::sync_start, const sync_start_msg& x) {
      if (!x.includes(hdl))
        return;
      *out = slave::run(self, x.ref, x.syncer, *store, credit, opts);
      running = false;
    },
    [&](caf::exit_msg& x) {
      *out = slave_result{sync_outcome::stopped, std::move(x.reason)};
      running = false;
    });
}

// -- fixtures -----------------------------------------------------------------

actor_system_fixture::actor_system_fixture() : sys(cfg), self(sys) {
  // nop
}

actor_system_fixture::~actor_system_fixture() {
  // nop
}

void actor_system_fixture::await_termination(
  const std::vector<caf::actor>& hdls) {
  std::set<caf::actor_addr> pending;
  for (auto& hdl : hdls) {
    self->monitor(hdl);
    pending.emplace(hdl.address());
  }
  self->receive_while([&] { return !pending.empty(); })(
    [&](caf::down_msg& x) { pending.erase(x.source); });
}

int main(int argc, char** argv) {
  configuration::init_global_state();
  return caf::test::main(argc, argv);
}
