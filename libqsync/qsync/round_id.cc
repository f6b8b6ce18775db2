#include "qsync/round_id.hh"

#include <caf/hash/fnv.hpp>
#include <caf/uuid.hpp>

namespace qsync {

namespace {

std::byte nil_bytes[round_id::num_bytes];

caf::uuid to_uuid(const round_id& id) {
  std::array<caf::byte, round_id::num_bytes> tmp;
  auto& bytes = id.bytes();
  for (size_t index = 0; index < round_id::num_bytes; ++index)
    tmp[index] = static_cast<caf::byte>(bytes[index]);
  return caf::uuid{tmp};
}

round_id from_uuid(const caf::uuid& id) {
  round_id::array_type tmp;
  auto& bytes = id.bytes();
  for (size_t index = 0; index < round_id::num_bytes; ++index)
    tmp[index] = static_cast<std::byte>(bytes[index]);
  return round_id{tmp};
}

} // namespace

round_id::round_id() noexcept {
  memset(bytes_.data(), 0, bytes_.size());
}

bool round_id::valid() const noexcept {
  return memcmp(bytes_.data(), nil_bytes, num_bytes) != 0;
}

size_t round_id::hash() const noexcept {
  return caf::hash::fnv<size_t>::compute(bytes_);
}

round_id round_id::random() noexcept {
  return from_uuid(caf::uuid::random());
}

round_id round_id::random(unsigned seed) noexcept {
  return from_uuid(caf::uuid::random(seed));
}

void convert(round_id x, std::string& str) {
  str = caf::to_string(to_uuid(x));
}

bool convert(const std::string& str, round_id& x) {
  caf::uuid id;
  if (auto err = caf::parse(str, id))
    return false;
  x = from_uuid(id);
  return true;
}

std::string to_string(round_id x) {
  std::string result;
  convert(x, result);
  return result;
}

} // namespace qsync
