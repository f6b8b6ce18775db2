#include "qsync/master.hh"

#include "qsync/internal/logger.hh"
#include "qsync/internal/metric_factory.hh"
#include "qsync/internal/syncer.hh"
#include "qsync/internal/type_id.hh"

#include <caf/blocking_actor.hpp>
#include <caf/spawn_options.hpp>

#include <utility>

namespace qsync::master {

caf::actor prepare(caf::blocking_actor* self, round_id ref,
                   std::vector<caf::actor> slaves, const sync_options& opts) {
  log::master::debug("sync-prepare", "spawn syncer for round {} with {} slaves",
                     ref, slaves.size());
  auto hdl = caf::actor_cast<caf::actor>(self);
  return self->spawn<caf::linked>(internal::syncer, ref, std::move(hdl),
                                  std::move(slaves), opts);
}

error run(caf::blocking_actor* self, const caf::actor& syncer, round_id ref,
          const std::string& queue_name, backing_queue& store,
          const sync_options& opts) {
  log::master::info("sync-start", "start synchronising {} in round {}",
                    queue_name, ref);
  internal::metric_factory::counter* sync_messages = nullptr;
  if (opts.registry) {
    internal::metric_factory factory{*opts.registry};
    sync_messages = factory.master.sync_messages_instance(queue_name);
  }
  size_t count = 0;
  auto last_report = now();
  bool aborted = false;
  error abort_reason;
  auto send_one = [&](const queue_message& msg,
                      const message_properties& props) {
    self->send(syncer, atom::msg_v, ref, msg, props);
    bool acked = false;
    self->receive_while([&] { return !acked && !aborted; })(
      [&](atom::msg_ok, round_id id) {
        if (id == ref)
          acked = true;
        else
          log::master::debug("sync-stale-ack",
                             "drop acknowledgement of round {}", id);
      },
      [&](caf::exit_msg& x) {
        log::master::warning("sync-aborted",
                             "abort synchronising {} after {} messages: {}",
                             queue_name, count, x.reason);
        aborted = true;
        abort_reason = std::move(x.reason);
      });
    if (!acked)
      return false;
    ++count;
    if (sync_messages)
      sync_messages->Increment();
    auto t = now();
    if (t - last_report > opts.progress_interval) {
      log::master::info("sync-progress", "synchronising {}: {} messages",
                        queue_name, count);
      last_report = t;
    }
    return true;
  };
  if (auto err = store.fold(send_one)) {
    log::master::error("sync-fold-failed",
                       "failed to read messages of {}: {}", queue_name, err);
    auto reason = make_error(ec::backend_failure, std::move(err),
                             "failed to read the master store");
    // The syncer waits for `done` otherwise. Unlinking first keeps the exit
    // message of the syncer out of our mailbox.
    self->unlink_from(syncer);
    self->send_exit(syncer, reason);
    return reason;
  }
  if (aborted)
    return make_error(ec::round_aborted, std::move(abort_reason),
                      "syncer terminated during the round");
  self->send(syncer, atom::done_v, ref);
  log::master::info("sync-done", "synchronised {} messages of {}", count,
                    queue_name);
  if (auto lptr = logger())
    lptr->on_round_done(ref, queue_name, count);
  return {};
}

} // namespace qsync::master
