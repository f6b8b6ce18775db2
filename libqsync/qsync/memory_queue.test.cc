#define SUITE memory_queue

#include "qsync/memory_queue.hh"

#include "qsync/qsync-test.test.hh"

using namespace qsync;

namespace {

struct fixture {
  memory_queue store;

  std::vector<queue_message> folded() {
    std::vector<queue_message> result;
    auto err = store.fold([&](const queue_message& msg,
                              const message_properties&) {
      result.emplace_back(msg);
      return true;
    });
    if (err)
      FAIL("fold failed: " << to_string(err));
    return result;
  }
};

} // namespace

FIXTURE_SCOPE(memory_queue_tests, fixture)

TEST(a new queue is empty) {
  CHECK_EQUAL(len_of(store), 0u);
  CHECK(folded().empty());
}

TEST(fold visits messages in publish order) {
  fill(store, make_messages(3));
  auto msgs = folded();
  REQUIRE_EQUAL(msgs.size(), 3u);
  CHECK_EQUAL(msgs[0].payload, "M1");
  CHECK_EQUAL(msgs[1].payload, "M2");
  CHECK_EQUAL(msgs[2].payload, "M3");
  CHECK_EQUAL(msgs, store.messages());
}

TEST(fold stops when the visitor returns false) {
  fill(store, make_messages(5));
  size_t visited = 0;
  auto err = store.fold([&](const queue_message&, const message_properties&) {
    return ++visited < 2;
  });
  CHECK(!err);
  CHECK_EQUAL(visited, 2u);
}

TEST(purge discards all messages and reports their number) {
  fill(store, make_messages(4));
  auto n = store.purge();
  REQUIRE(n);
  CHECK_EQUAL(*n, uint64_t{4});
  CHECK_EQUAL(len_of(store), 0u);
  CHECK_EQUAL(store.purge_count(), 1u);
}

TEST(publish records the delivered flag and the properties) {
  auto xs = make_messages(2);
  CHECK(!store.publish(xs[0].first, xs[0].second, true));
  CHECK(!store.publish(xs[1].first, xs[1].second, false));
  auto& entries = store.entries();
  REQUIRE_EQUAL(entries.size(), 2u);
  CHECK(entries[0].delivered);
  CHECK(!entries[1].delivered);
  CHECK_EQUAL(entries[1].props, xs[1].second);
  CHECK(entries[1].props.needs_confirming);
}

TEST(the store keeps tuning parameters) {
  CHECK_EQUAL(store.ram_duration_target(), infinite);
  store.set_ram_duration_target(std::chrono::seconds{5});
  store.set_maximum_since_use(std::chrono::seconds{7});
  CHECK_EQUAL(store.ram_duration_target(), timespan{std::chrono::seconds{5}});
  CHECK_EQUAL(store.maximum_since_use(), timespan{std::chrono::seconds{7}});
}

FIXTURE_SCOPE_END()
