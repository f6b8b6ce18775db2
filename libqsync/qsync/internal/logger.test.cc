#define SUITE internal.logger

#include "qsync/internal/logger.hh"

#include "qsync/qsync-test.test.hh"

#include <iterator>
#include <memory>
#include <string>

using namespace qsync;

namespace {

template <class... Ts>
std::string fmt(std::string_view fstr, const Ts&... args) {
  std::string result;
  internal::fmt_to(std::back_inserter(result), fstr, args...);
  return result;
}

struct fixture {
  std::shared_ptr<recording_observer> observer
    = std::make_shared<recording_observer>();

  fixture() {
    logger(observer);
  }

  ~fixture() {
    logger(nullptr);
  }
};

} // namespace

FIXTURE_SCOPE(logger_tests, fixture)

TEST(fmt_to replaces placeholders) {
  CHECK_EQUAL(fmt("no placeholders"), "no placeholders");
  CHECK_EQUAL(fmt("{} + {} = {}", 1, 2, 3), "1 + 2 = 3");
  CHECK_EQUAL(fmt("{}", true), "true");
  CHECK_EQUAL(fmt("[{}]", std::string{"x"}), "[x]");
  CHECK_EQUAL(fmt("{{{}", "x"), "{x");
}

TEST(fmt_to renders qsync types) {
  auto ref = round_id::random(1);
  CHECK_EQUAL(fmt("round {}", ref), "round " + to_string(ref));
  CHECK_EQUAL(fmt("{}", ec::round_aborted), "round_aborted");
  CHECK_EQUAL(fmt("{}", infinite), "infinite");
}

TEST(log functions emit events to the global observer) {
  qsync::log::master::info("test-event", "value: {}", 42);
  qsync::log::slave::debug("other-event", "no args");
  auto ids = observer->identifiers();
  REQUIRE_EQUAL(ids.size(), 2u);
  CHECK_EQUAL(ids[0], "test-event");
  CHECK_EQUAL(ids[1], "other-event");
}

FIXTURE_SCOPE_END()
