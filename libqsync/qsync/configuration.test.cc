#define SUITE configuration

#include "qsync/configuration.hh"

#include "qsync/qsync-test.test.hh"

#include <stdexcept>
#include <string>
#include <vector>

using namespace qsync;

namespace {

struct fixture {
  // Builds a configuration from command line arguments.
  template <class... Ts>
  sync_options parse(Ts... xs) {
    std::vector<std::string> args{"qsync-test", xs...};
    std::vector<char*> argv;
    for (auto& arg : args)
      argv.emplace_back(arg.data());
    configuration cfg{static_cast<int>(argv.size()), argv.data()};
    return cfg.options();
  }
};

} // namespace

FIXTURE_SCOPE(configuration_tests, fixture)

TEST(default options use the default credit window) {
  auto opts = parse();
  CHECK_EQUAL(opts.credit.initial, defaults::credit::initial);
  CHECK_EQUAL(opts.credit.more_after, defaults::credit::more_after);
  CHECK_EQUAL(opts.progress_interval, defaults::progress_interval);
  CHECK(!opts.broadcast_channel);
  CHECK(!opts.registry);
}

TEST(command line arguments override defaults) {
  auto opts = parse("--qsync.credit.initial=10", "--qsync.credit.more-after=5",
                    "--qsync.progress-interval=250ms");
  CHECK_EQUAL(opts.credit.initial, 10u);
  CHECK_EQUAL(opts.credit.more_after, 5u);
  CHECK_EQUAL(opts.progress_interval,
              timespan{std::chrono::milliseconds{250}});
}

TEST(inconsistent credit settings are rejected) {
  auto rejects = [this](auto... xs) {
    try {
      parse(xs...);
    } catch (std::invalid_argument&) {
      return true;
    }
    return false;
  };
  CHECK(rejects("--qsync.credit.initial=10", "--qsync.credit.more-after=20"));
  CHECK(rejects("--qsync.credit.initial=0"));
  CHECK(!rejects("--qsync.credit.initial=10", "--qsync.credit.more-after=10"));
}

FIXTURE_SCOPE_END()
