#include "qsync/logger.hh"

#include "qsync/time.hh"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

#include <caf/term.hpp>

namespace qsync {

namespace {

event_observer_ptr global_observer;

class console_logger : public event_observer {
public:
  console_logger(event::severity_level severity, event::component_mask mask)
    : severity_(severity), mask_(mask) {
    // nop
  }

  void observe(event_ptr what) override {
    auto color = [](event::severity_level level) {
      switch (level) {
        case event::severity_level::critical:
        case event::severity_level::error:
          return caf::term::red;
        case event::severity_level::warning:
          return caf::term::yellow;
        case event::severity_level::info:
          return caf::term::green;
        default:
          return caf::term::blue;
      }
    };
    auto ts = std::string{};
    convert(what->timestamp, ts);
    std::lock_guard<std::mutex> guard{mtx_};
    std::cerr << color(what->severity) << '[' << to_string(what->component)
              << '/' << to_string(what->severity) << "] " << caf::term::reset
              << ts << ' ' << what->identifier << ": " << what->description
              << std::endl;
  }

  bool accepts(event::severity_level severity,
               event::component_type component) const override {
    return severity <= severity_ && has_component(mask_, component);
  }

private:
  event::severity_level severity_;
  event::component_mask mask_;
  std::mutex mtx_;
};

} // namespace

event_observer* logger() noexcept {
  return global_observer.get();
}

void logger(event_observer_ptr ptr) noexcept {
  global_observer = std::move(ptr);
}

event_observer_ptr make_console_logger(event::severity_level severity,
                                       event::component_mask mask) {
  return std::make_shared<console_logger>(severity, mask);
}

event_observer_ptr make_console_logger(std::string_view severity,
                                       event::component_mask mask) {
  auto level = event::severity_level::info;
  if (!from_string(severity, level)) {
    auto what = std::string{"invalid severity level: "};
    what += severity;
    throw std::invalid_argument(what);
  }
  return make_console_logger(level, mask);
}

} // namespace qsync
