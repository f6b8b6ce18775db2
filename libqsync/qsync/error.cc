#include "qsync/error.hh"

#include "qsync/internal/type_id.hh"

#include <caf/make_message.hpp>
#include <caf/type_id.hpp>

#include <utility>

namespace qsync {

namespace {

constexpr std::string_view ec_names[] = {
  "none",           "unspecified",      "round_aborted", "backend_failure",
  "invalid_data",   "cannot_open_file", "invalid_config",
};

template <class T, size_t N>
constexpr size_t array_size(const T (&)[N]) {
  return N;
}

} // namespace

std::string to_string(ec code) {
  auto index = static_cast<uint8_t>(code);
  if (index < array_size(ec_names))
    return std::string{ec_names[index]};
  return "<invalid>";
}

bool from_string(std::string_view str, ec& code) {
  for (size_t index = 0; index < array_size(ec_names); ++index) {
    if (ec_names[index] == str) {
      code = static_cast<ec>(index);
      return true;
    }
  }
  return false;
}

bool from_integer(std::underlying_type_t<ec> in, ec& code) {
  if (in < array_size(ec_names)) {
    code = static_cast<ec>(in);
    return true;
  }
  return false;
}

error make_error(ec code) {
  return error{code};
}

error make_error(ec code, std::string description) {
  return error{code, caf::make_message(std::move(description))};
}

error make_error(ec code, error reason, std::string description) {
  return error{code,
               caf::make_message(std::move(reason), std::move(description))};
}

ec code_of(const error& err) {
  if (!err)
    return ec::none;
  if (err.category() != caf::type_id_v<ec>)
    return ec::unspecified;
  return static_cast<ec>(err.code());
}

} // namespace qsync
