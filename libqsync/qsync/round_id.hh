#pragma once

#include <caf/detail/comparable.hpp>

#include <array>
#include <cstddef>
#include <cstring>
#include <functional>
#include <string>

namespace qsync {

/// Identifies a single sync round. Every protocol message carries the ID of
/// its round, which allows participants to discard messages that belong to a
/// superseded or completed round. Round IDs are 16-byte UUIDs.
class round_id : caf::detail::comparable<round_id> {
public:
  // -- constants --------------------------------------------------------------

  static constexpr size_t num_bytes = 16;

  // -- member types -----------------------------------------------------------

  using array_type = std::array<std::byte, num_bytes>;

  round_id() noexcept;

  explicit round_id(const array_type& bytes) noexcept : bytes_(bytes) {
    // nop
  }

  round_id(const round_id&) noexcept = default;

  round_id& operator=(const round_id&) noexcept = default;

  // -- properties -------------------------------------------------------------

  const array_type& bytes() const noexcept {
    return bytes_;
  }

  /// Queries whether this ID is *not* default-constructed.
  bool valid() const noexcept;

  explicit operator bool() const noexcept {
    return valid();
  }

  bool operator!() const noexcept {
    return !valid();
  }

  /// Compares this instance to `other`.
  /// @returns -1 if `*this < other`, 0 if `*this == other`, and 1 otherwise.
  int compare(const round_id& other) const noexcept {
    return memcmp(bytes_.data(), other.bytes_.data(), num_bytes);
  }

  size_t hash() const noexcept;

  // -- factories --------------------------------------------------------------

  /// Creates a new, random round ID.
  static round_id random() noexcept;

  /// Creates a random round ID with a predefined seed.
  static round_id random(unsigned seed) noexcept;

  // -- inspection -------------------------------------------------------------

  template <class Inspector>
  friend bool inspect(Inspector& f, round_id& x) {
    return f.apply(x.bytes_);
  }

private:
  array_type bytes_;
};

/// @relates round_id
void convert(round_id x, std::string& str);

/// @relates round_id
bool convert(const std::string& str, round_id& x);

/// @relates round_id
std::string to_string(round_id x);

} // namespace qsync

namespace std {

template <>
struct hash<qsync::round_id> {
  size_t operator()(const qsync::round_id& x) const noexcept {
    return x.hash();
  }
};

} // namespace std
