#pragma once

#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace qsync {

using caf::error;

template <class T>
using expected = caf::expected<T>;

/// qsync's error codes.
enum class ec : uint8_t {
  /// Not-an-error.
  none,
  /// The unspecified default error code.
  unspecified,
  /// A sync round was aborted because a linked actor terminated while the
  /// master waited for an acknowledgement.
  round_aborted,
  /// The message store failed to execute the operation.
  backend_failure,
  /// Stored or received data cannot be used to carry out the operation.
  invalid_data,
  /// Opening a file or database failed.
  cannot_open_file,
  /// A configuration value is missing or malformed.
  invalid_config,
};

/// @relates ec
std::string to_string(ec code);

/// @relates ec
bool from_string(std::string_view str, ec& code);

/// @relates ec
bool from_integer(std::underlying_type_t<ec> in, ec& code);

/// @relates ec
template <class Inspector>
bool inspect(Inspector& f, ec& x) {
  return caf::default_enum_inspect(f, x);
}

/// Creates a new @ref error from given @ref ec code.
error make_error(ec code);

/// Creates a new @ref error from given @ref ec @p code and @p description.
error make_error(ec code, std::string description);

/// Creates a new @ref error from given @ref ec @p code that wraps the error
/// @p reason reported by another component.
error make_error(ec code, error reason, std::string description);

/// Returns the error code of `err` if its category is `ec` or
/// `ec::unspecified` otherwise.
ec code_of(const error& err);

} // namespace qsync
