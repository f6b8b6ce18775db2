#include "qsync/configuration.hh"

#include "qsync/backing_queue.hh"
#include "qsync/event.hh"
#include "qsync/internal/type_id.hh"
#include "qsync/logger.hh"

#include <caf/config_value.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>
#include <caf/string_view.hpp>

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qsync {

namespace {

template <class... Ts>
auto concat(Ts... xs) {
  std::string result;
  ((result += xs), ...);
  return result;
}

constexpr caf::string_view console_verbosity_key = "qsync.console-verbosity";

constexpr caf::string_view progress_interval_key = "qsync.progress-interval";

[[noreturn]] void throw_illegal_log_level(const char* var, const char* cstr) {
  auto what = concat("illegal value for environment variable ", var, ": '",
                     cstr,
                     "' (legal values: 'critical', 'error', 'warning', "
                     "'info', 'verbose', 'debug')");
  throw std::invalid_argument(what);
}

std::string to_log_level(const char* var, const char* cstr) {
  event::severity_level level;
  if (!from_string(cstr, level))
    throw_illegal_log_level(var, cstr);
  return cstr;
}

} // namespace

// -- sync_options -------------------------------------------------------------

sync_options sync_options::from(const caf::actor_system_config& cfg) {
  sync_options result;
  result.credit.initial = caf::get_or(cfg, "qsync.credit.initial",
                                      defaults::credit::initial);
  result.credit.more_after = caf::get_or(cfg, "qsync.credit.more-after",
                                         defaults::credit::more_after);
  result.progress_interval = caf::get_or(cfg, progress_interval_key,
                                         defaults::progress_interval);
  return result;
}

// -- configuration ------------------------------------------------------------

configuration::configuration(skip_init_t) {
  // Add runtime type information for qsync types.
  init_global_state();
  // Add custom options to the CAF parser.
  opt_group{custom_options_, "qsync"}
    .add<timespan>("progress-interval",
                   "minimum time between two progress reports of a master")
    .add<std::string>("console-verbosity",
                      "enables console output for the given severity");
  opt_group{custom_options_, "qsync.credit"}
    .add<uint32_t>("initial", "credit per slave before the syncer blocks")
    .add<uint32_t>("more-after",
                   "number of messages before a slave grants new credit");
}

configuration::configuration() : configuration(skip_init) {
  init(0, nullptr);
}

configuration::configuration(int argc, char** argv)
  : configuration(skip_init) {
  init(argc, argv);
}

void configuration::init(int argc, char** argv) {
  std::vector<std::string> args;
  if (argc > 1 && argv != nullptr)
    args.assign(argv + 1, argv + argc);
  // Phase 1: parse the configuration file specified by the user on the command
  //          line (overrides hard-coded defaults).
  std::vector<std::string> args_subset;
  auto predicate = [](const std::string& str) {
    return str.compare(0, 14, "--config-file=") != 0;
  };
  auto sep = std::stable_partition(args.begin(), args.end(), predicate);
  if (sep != args.end()) {
    args_subset.assign(std::make_move_iterator(sep),
                       std::make_move_iterator(args.end()));
    args.erase(sep, args.end());
  }
  if (auto err = parse(std::move(args_subset))) {
    auto what = concat("Error while reading configuration file: ",
                       to_string(err));
    throw std::runtime_error(what);
  }
  // Phase 2: parse environment variables (override config file settings).
  if (auto console_verbosity = getenv("QSYNC_CONSOLE_VERBOSITY")) {
    auto level = to_log_level("QSYNC_CONSOLE_VERBOSITY", console_verbosity);
    set(console_verbosity_key, level);
  }
  if (auto env = getenv("QSYNC_PROGRESS_INTERVAL")) {
    caf::config_value val{env};
    if (auto interval = caf::get_as<caf::timespan>(val)) {
      set(progress_interval_key, *interval);
    } else {
      auto what = concat("invalid value for QSYNC_PROGRESS_INTERVAL: ", env,
                         " (expected an interval such as '500ms')");
      throw std::invalid_argument(what);
    }
  }
  // Phase 3: parse command line arguments.
  if (!args.empty()) {
    std::stringstream dummy;
    if (auto err = parse(std::move(args), dummy)) {
      auto what = concat("Error while parsing CLI arguments: ", to_string(err));
      throw std::runtime_error(what);
    }
  }
  auto initial = caf::get_or(*this, "qsync.credit.initial",
                             defaults::credit::initial);
  auto more_after = caf::get_or(*this, "qsync.credit.more-after",
                                defaults::credit::more_after);
  if (initial == 0 || more_after == 0 || more_after > initial) {
    auto what = concat("invalid credit settings: qsync.credit.initial = ",
                       std::to_string(initial),
                       ", qsync.credit.more-after = ",
                       std::to_string(more_after),
                       " (expected 0 < more-after <= initial)");
    throw std::invalid_argument(what);
  }
}

sync_options configuration::options() const {
  return sync_options::from(*this);
}

void configuration::apply_logger() const {
  if (auto str = caf::get_if<std::string>(&content, console_verbosity_key))
    set_console_logger(*str);
}

caf::settings configuration::dump_content() const {
  auto result = super::dump_content();
  auto& grp = result["qsync"].as_dictionary();
  put_missing(grp, "progress-interval", defaults::progress_interval);
  auto& credit_grp = grp["credit"].as_dictionary();
  put_missing(credit_grp, "initial", defaults::credit::initial);
  put_missing(credit_grp, "more-after", defaults::credit::more_after);
  return result;
}

namespace {

std::once_flag init_global_state_flag;

} // namespace

void configuration::init_global_state() {
  std::call_once(init_global_state_flag, [] {
    caf::init_global_meta_objects<caf::id_block::qsync>();
    caf::core::init_global_meta_objects();
  });
}

} // namespace qsync
