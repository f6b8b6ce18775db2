#define SUITE error

#include "qsync/error.hh"

#include "qsync/qsync-test.test.hh"

#include <caf/message.hpp>

using namespace qsync;

TEST(error codes convert to and from strings) {
  CHECK_EQUAL(to_string(ec::round_aborted), "round_aborted");
  CHECK_EQUAL(to_string(ec::invalid_config), "invalid_config");
  ec code = ec::none;
  CHECK(from_string("backend_failure", code));
  CHECK_EQUAL(code, ec::backend_failure);
  CHECK(!from_string("no_such_code", code));
  CHECK_EQUAL(code, ec::backend_failure);
}

TEST(from_integer rejects out of range values) {
  ec code = ec::none;
  CHECK(from_integer(2, code));
  CHECK_EQUAL(code, ec::round_aborted);
  CHECK(!from_integer(200, code));
}

TEST(code_of extracts qsync error codes) {
  CHECK_EQUAL(code_of(error{}), ec::none);
  CHECK_EQUAL(code_of(make_error(ec::invalid_data)), ec::invalid_data);
  CHECK_EQUAL(code_of(caf::make_error(caf::sec::runtime_error)),
              ec::unspecified);
}

TEST(errors can wrap the error of another component) {
  auto inner = make_error(ec::backend_failure, "disk full");
  auto outer = make_error(ec::round_aborted, inner, "syncer terminated");
  CHECK_EQUAL(code_of(outer), ec::round_aborted);
  auto& ctx = outer.context();
  REQUIRE(ctx.match_elements<error, std::string>());
  CHECK_EQUAL(ctx.get_as<error>(0), inner);
  CHECK_EQUAL(ctx.get_as<std::string>(1), "syncer terminated");
}
