#define SUITE credit_flow

#include "qsync/credit_flow.hh"

#include "qsync/qsync-test.test.hh"

#include <algorithm>
#include <string>

using namespace qsync;

namespace {

struct fixture {
  credit_flow<std::string> flow{credit_spec{4, 2}};
};

} // namespace

FIXTURE_SCOPE(credit_flow_tests, fixture)

TEST(default credit settings grant 2000 credit and bump after 500 messages) {
  credit_spec spec;
  CHECK_EQUAL(spec.initial, 2000u);
  CHECK_EQUAL(spec.more_after, 500u);
  credit_flow<std::string> uut;
  CHECK_EQUAL(uut.credit("A"), 2000u);
  CHECK_EQUAL(uut.pending_acks("A"), 500u);
  CHECK(!uut.blocked());
}

TEST(senders block after spending all credit) {
  for (int i = 0; i < 3; ++i) {
    flow.send("A");
    CHECK(!flow.blocked());
  }
  CHECK_EQUAL(flow.credit("A"), 1u);
  flow.send("A");
  CHECK(flow.blocked());
  CHECK(flow.blocked("A"));
  CHECK(!flow.blocked("B"));
  CHECK_EQUAL(flow.credit("A"), 0u);
}

TEST(credit bumps unblock senders) {
  for (int i = 0; i < 4; ++i)
    flow.send("A");
  REQUIRE(flow.blocked());
  flow.handle_bump("A", 2);
  CHECK(!flow.blocked());
  CHECK_EQUAL(flow.credit("A"), 2u);
}

TEST(one blocked destination blocks the sender) {
  for (int i = 0; i < 4; ++i)
    flow.send("A");
  flow.send("B");
  CHECK(flow.blocked());
  CHECK(flow.blocked("A"));
  CHECK(!flow.blocked("B"));
}

TEST(receivers grant credit after more_after messages) {
  CHECK(!flow.ack("A"));
  auto bump = flow.ack("A");
  REQUIRE(bump);
  CHECK_EQUAL(*bump, 2u);
  CHECK(!flow.ack("A"));
  CHECK_EQUAL(flow.pending_acks("A"), 1u);
}

TEST(peer_down drops all state for a peer) {
  for (int i = 0; i < 4; ++i)
    flow.send("A");
  flow.ack("A");
  REQUIRE(flow.blocked());
  flow.peer_down("A");
  CHECK(!flow.blocked());
  CHECK_EQUAL(flow.credit("A"), 4u);
  CHECK_EQUAL(flow.pending_acks("A"), 2u);
}

TEST(a sender never exceeds its initial credit without bumps) {
  // Simulates a syncer that only sends while not blocked and a receiver that
  // acknowledges in batches.
  credit_flow<std::string> receiver{credit_spec{4, 2}};
  size_t outstanding = 0;
  size_t max_outstanding = 0;
  for (int round = 0; round < 100; ++round) {
    while (!flow.blocked()) {
      flow.send("S");
      ++outstanding;
      max_outstanding = std::max(max_outstanding, outstanding);
    }
    // The receiver processes three messages.
    for (int i = 0; i < 3 && outstanding > 0; ++i) {
      --outstanding;
      if (auto bump = receiver.ack("S"))
        flow.handle_bump("S", *bump);
    }
  }
  CHECK_LESS_EQUAL(max_outstanding, 4u);
}

FIXTURE_SCOPE_END()
