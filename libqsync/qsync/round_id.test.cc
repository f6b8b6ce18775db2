#define SUITE round_id

#include "qsync/round_id.hh"

#include "qsync/qsync-test.test.hh"

#include <set>
#include <unordered_set>

using namespace qsync;

TEST(default constructed round IDs are invalid) {
  round_id x;
  CHECK(!x.valid());
  CHECK(!x);
  CHECK_EQUAL(to_string(x), "00000000-0000-0000-0000-000000000000");
}

TEST(random round IDs are valid and distinct) {
  std::set<round_id> ids;
  std::unordered_set<round_id> hashed;
  for (int i = 0; i < 100; ++i) {
    auto x = round_id::random();
    CHECK(x.valid());
    ids.emplace(x);
    hashed.emplace(x);
  }
  CHECK_EQUAL(ids.size(), 100u);
  CHECK_EQUAL(hashed.size(), 100u);
}

TEST(seeded round IDs are deterministic) {
  CHECK_EQUAL(round_id::random(42), round_id::random(42));
  CHECK_NOT_EQUAL(round_id::random(42), round_id::random(43));
}

TEST(round IDs render as UUIDs) {
  auto x = round_id::random(42);
  auto str = to_string(x);
  CHECK_EQUAL(str.size(), 36u);
  round_id y;
  CHECK(convert(str, y));
  CHECK_EQUAL(x, y);
  CHECK(!convert("not-a-uuid", y));
}
