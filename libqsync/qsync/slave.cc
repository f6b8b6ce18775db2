#include "qsync/slave.hh"

#include "qsync/internal/logger.hh"
#include "qsync/internal/metric_factory.hh"
#include "qsync/internal/type_id.hh"

#include <caf/blocking_actor.hpp>

#include <optional>
#include <utility>

namespace qsync {

std::string to_string(sync_outcome x) {
  switch (x) {
    case sync_outcome::completed:
      return "completed";
    case sync_outcome::failed:
      return "failed";
    case sync_outcome::stopped:
      return "stopped";
  }
  return "<invalid>";
}

} // namespace qsync

namespace qsync::slave {

namespace {

error purge(backing_queue& store, round_id ref) {
  auto n = store.purge();
  if (!n) {
    log::slave::error("slave-purge-failed",
                      "failed to purge store for round {}: {}", ref,
                      n.error());
    return make_error(ec::backend_failure, std::move(n.error()),
                      "failed to purge the local store");
  }
  log::slave::debug("slave-purge", "purged {} messages for round {}", *n,
                    ref);
  return {};
}

void count_outcome(const sync_options& opts, sync_outcome outcome) {
  if (!opts.registry)
    return;
  internal::metric_factory factory{*opts.registry};
  auto rounds = factory.slave.rounds_instances();
  switch (outcome) {
    case sync_outcome::completed:
      rounds.completed->Increment();
      break;
    case sync_outcome::failed:
      rounds.failed->Increment();
      break;
    case sync_outcome::stopped:
      rounds.stopped->Increment();
      break;
  }
}

} // namespace

slave_result run(caf::blocking_actor* self, round_id ref,
                 const caf::actor& syncer, backing_queue& store,
                 credit_flow<caf::actor_addr>& credit,
                 const sync_options& opts) {
  auto hdl = caf::actor_cast<caf::actor>(self);
  auto syncer_addr = syncer.address();
  self->monitor(syncer);
  self->send(syncer, atom::sync_ready_v, ref, hdl);
  if (auto err = purge(store, ref)) {
    self->demonitor(syncer);
    credit.peer_down(syncer_addr);
    count_outcome(opts, sync_outcome::stopped);
    return slave_result{sync_outcome::stopped, std::move(err)};
  }
  log::slave::debug("slave-syncing", "enter round {}", ref);
  std::optional<slave_result> result;
  size_t received = 0;
  self->receive_while([&] { return !result; })(
    [&](caf::down_msg& x) {
      if (x.source != syncer_addr)
        return;
      log::slave::warning("slave-sync-failed",
                          "syncer of round {} went down after {} messages: {}",
                          ref, received, x.reason);
      // Received messages form a prefix of the master queue. Keeping them
      // would leave a gap after a later round with another master.
      auto err = purge(store, ref);
      credit.peer_down(syncer_addr);
      if (err)
        result = slave_result{sync_outcome::failed, std::move(err)};
      else
        result = slave_result{sync_outcome::failed, std::move(x.reason)};
    },
    [&](atom::bump_credit, const caf::actor_addr& peer, uint32_t amount) {
      credit.handle_bump(peer, amount);
    },
    [&](atom::set_ram_duration_target, timespan target) {
      store.set_ram_duration_target(target);
    },
    [&](atom::set_maximum_since_use, timespan age) {
      store.set_maximum_since_use(age);
    },
    [&](atom::update_ram_duration) {
      if (opts.update_ram_duration)
        opts.update_ram_duration(store);
      else
        log::slave::debug("slave-ram-duration", "RAM duration estimate: {}",
                          store.ram_duration());
    },
    [&](atom::sync_complete, round_id id) {
      if (id != ref) {
        log::slave::debug("stale-sync-complete",
                          "drop completion of round {}", id);
        return;
      }
      self->send(syncer, atom::sync_complete_ok_v, ref, hdl);
      self->demonitor(syncer);
      credit.peer_down(syncer_addr);
      log::slave::info("slave-sync-completed",
                       "completed round {} with {} messages", ref, received);
      result = slave_result{sync_outcome::completed, error{}};
    },
    [&](atom::sync_msg, round_id id, const queue_message& msg,
        const message_properties& props) {
      if (id != ref) {
        log::slave::debug("stale-sync-msg", "drop message of round {}", id);
        return;
      }
      if (auto amount = credit.ack(syncer_addr))
        self->send(syncer, atom::bump_credit_v, self->address(), *amount);
      auto confirmed = props;
      confirmed.needs_confirming = false;
      if (auto err = store.publish(msg, confirmed, true)) {
        log::slave::error("slave-publish-failed",
                          "failed to store message {} of round {}: {}", msg.id,
                          ref, err);
        self->demonitor(syncer);
        credit.peer_down(syncer_addr);
        result = slave_result{sync_outcome::stopped,
                              make_error(ec::backend_failure, std::move(err),
                                         "failed to store a sync message")};
        return;
      }
      ++received;
    },
    [&](caf::exit_msg& x) {
      log::slave::info("slave-stopped", "stop during round {}: {}", ref,
                       x.reason);
      result = slave_result{sync_outcome::stopped, std::move(x.reason)};
    });
  count_outcome(opts, result->outcome);
  return std::move(*result);
}

} // namespace qsync::slave
