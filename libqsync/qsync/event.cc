#include "qsync/event.hh"

#include <iterator>

namespace qsync {

namespace {

constexpr std::string_view severity_names[] = {
  "critical", "error", "warning", "info", "verbose", "debug",
};

} // namespace

std::string_view to_string(event::severity_level level) noexcept {
  auto index = static_cast<size_t>(level);
  if (index < std::size(severity_names))
    return severity_names[index];
  return "<invalid>";
}

std::string_view to_string(event::component_type component) noexcept {
  switch (component) {
    case event::component_type::master:
      return "master";
    case event::component_type::syncer:
      return "syncer";
    case event::component_type::slave:
      return "slave";
    case event::component_type::store:
      return "store";
    case event::component_type::app:
      return "app";
  }
  return "<invalid>";
}

bool from_string(std::string_view str, event::severity_level& level) noexcept {
  for (size_t index = 0; index < std::size(severity_names); ++index) {
    if (severity_names[index] == str) {
      level = static_cast<event::severity_level>(index);
      return true;
    }
  }
  return false;
}

} // namespace qsync
