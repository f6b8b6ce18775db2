#pragma once

#ifdef SUITE
#  define CAF_SUITE SUITE
#endif

#include <caf/test/unit_test.hpp>

#include <caf/actor_system.hpp>
#include <caf/scoped_actor.hpp>

#include "qsync/backing_queue.hh"
#include "qsync/configuration.hh"
#include "qsync/event_observer.hh"
#include "qsync/internal/type_id.hh"
#include "qsync/memory_queue.hh"
#include "qsync/message.hh"
#include "qsync/round_id.hh"
#include "qsync/slave.hh"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

// -- test setup macros --------------------------------------------------------

#define TEST CAF_TEST
#define FIXTURE_SCOPE CAF_TEST_FIXTURE_SCOPE
#define FIXTURE_SCOPE_END CAF_TEST_FIXTURE_SCOPE_END

// -- logging macros -----------------------------------------------------------

#define ERROR CAF_TEST_PRINT_ERROR
#define INFO CAF_TEST_PRINT_INFO
#define VERBOSE CAF_TEST_PRINT_VERBOSE

// -- macros for checking results ---------------------------------------------

#define REQUIRE CAF_REQUIRE
#define REQUIRE_EQUAL CAF_REQUIRE_EQUAL
#define REQUIRE_NOT_EQUAL CAF_REQUIRE_NOT_EQUAL
#define CHECK CAF_CHECK
#define CHECK_EQUAL CAF_CHECK_EQUAL
#define CHECK_NOT_EQUAL CAF_CHECK_NOT_EQUAL
#define CHECK_LESS CAF_CHECK_LESS
#define CHECK_LESS_EQUAL CAF_CHECK_LESS_OR_EQUAL
#define CHECK_GREATER CAF_CHECK_GREATER
#define CHECK_GREATER_EQUAL CAF_CHECK_GREATER_OR_EQUAL
#define CHECK_FAIL CAF_CHECK_FAIL

#ifndef FAIL
#  define FAIL CAF_FAIL
#endif

// -- message stores for testing -----------------------------------------------

/// A memory queue that fails to store more than `capacity` messages.
class capped_queue : public qsync::memory_queue {
public:
  explicit capped_queue(size_t capacity) : capacity_(capacity) {
    // nop
  }

  qsync::error publish(const qsync::queue_message& msg,
                       const qsync::message_properties& props,
                       bool delivered) override;

private:
  size_t capacity_;
};

/// A memory queue that fails to read its content.
class unreadable_queue : public qsync::memory_queue {
public:
  qsync::error fold(const visitor& f) const override;
};

/// A memory queue that fails to purge its content after `successes` purges.
class unpurgeable_queue : public qsync::memory_queue {
public:
  explicit unpurgeable_queue(size_t successes = 0) : successes_(successes) {
    // nop
  }

  qsync::expected<uint64_t> purge() override;

private:
  size_t successes_;
};

// -- observers ----------------------------------------------------------------

/// Records all callbacks of the sync protocol.
class recording_observer : public qsync::event_observer {
public:
  void on_round_start(qsync::round_id ref, size_t ready) override;

  void on_slave_down(qsync::round_id ref, const qsync::error& reason) override;

  void on_round_done(qsync::round_id ref, const std::string& queue,
                     size_t count) override;

  void observe(qsync::event_ptr what) override;

  bool accepts(qsync::event::severity_level severity,
               qsync::event::component_type component) const override;

  /// Returns the identifiers of all observed events.
  std::vector<std::string> identifiers();

  /// Returns the number of participants per started round.
  std::vector<size_t> round_starts();

  /// Returns the number of transferred messages per completed round.
  std::vector<size_t> round_dones();

  /// Returns how many slaves left a round before its end.
  size_t slave_downs();

private:
  std::mutex mtx_;
  std::vector<std::string> identifiers_;
  std::vector<size_t> round_starts_;
  std::vector<size_t> round_dones_;
  size_t slave_downs_ = 0;
};

// -- utility ------------------------------------------------------------------

/// Creates `n` messages with IDs 1 to `n`. Every second message needs
/// confirming.
std::vector<std::pair<qsync::queue_message, qsync::message_properties>>
make_messages(size_t n);

/// Stores `xs` in `store`.
void fill(qsync::backing_queue& store,
          const std::vector<std::pair<qsync::queue_message,
                                      qsync::message_properties>>& xs);

/// Returns the number of messages in `store`.
uint64_t len_of(const qsync::backing_queue& store);

/// Hosts a slave for a single round. Waits for a `sync_start_msg` that
/// includes `self`, runs the slave side of the round and writes the result to
/// `out`.
void replica(caf::blocking_actor* self, qsync::backing_queue* store,
             qsync::sync_options opts, qsync::slave_result* out);

// -- fixtures -----------------------------------------------------------------

/// Provides an actor system with a scoped actor for running the master side.
class actor_system_fixture {
public:
  actor_system_fixture();

  virtual ~actor_system_fixture();

  /// Waits until all actors in `hdls` have terminated.
  void await_termination(const std::vector<caf::actor>& hdls);

  qsync::configuration cfg;

  caf::actor_system sys;

  caf::scoped_actor self;
};
