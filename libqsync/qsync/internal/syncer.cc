#include "qsync/internal/syncer.hh"

#include "qsync/credit_flow.hh"
#include "qsync/internal/logger.hh"
#include "qsync/internal/metric_factory.hh"
#include "qsync/internal/type_id.hh"
#include "qsync/logger.hh"
#include "qsync/sync_start_msg.hh"

#include <caf/actor_addr.hpp>
#include <caf/blocking_actor.hpp>

#include <algorithm>
#include <optional>
#include <set>
#include <utility>

namespace qsync::internal {

namespace {

/// Bundles the mutable state of a syncer.
struct syncer_state {
  syncer_state(caf::blocking_actor* self, round_id ref, caf::actor master,
               const sync_options& opts)
    : self(self), ref(ref), master(std::move(master)), credit(opts.credit) {
    if (opts.registry) {
      metric_factory factory{*opts.registry};
      dropped_slaves = factory.master.dropped_slaves_instance();
    }
  }

  /// Removes `addr` from the participant set after its monitor fired.
  /// @returns `true` if `addr` was a participant, `false` otherwise.
  bool drop(const caf::actor_addr& addr, const error& reason) {
    auto pred = [&addr](const caf::actor& hdl) { return hdl == addr; };
    auto i = std::find_if(slaves.begin(), slaves.end(), pred);
    if (i == slaves.end())
      return false;
    slaves.erase(i);
    credit.peer_down(addr);
    log::syncer::info("slave-down",
                      "drop slave from round {}: {} ({} slaves left)", ref,
                      reason, slaves.size());
    if (dropped_slaves)
      dropped_slaves->Increment();
    if (auto lptr = logger())
      lptr->on_slave_down(ref, reason);
    return true;
  }

  void bump(const caf::actor_addr& peer, uint32_t amount) {
    credit.handle_bump(peer, amount);
  }

  caf::blocking_actor* self;
  round_id ref;
  caf::actor master;

  /// Live participants in participant order.
  std::vector<caf::actor> slaves;

  credit_flow<caf::actor_addr> credit;

  metric_factory::counter* dropped_slaves = nullptr;
};

} // namespace

void syncer(caf::blocking_actor* self, round_id ref, caf::actor master,
            std::vector<caf::actor> candidates, sync_options opts) {
  syncer_state st{self, ref, std::move(master), opts};
  bool terminated = false;
  auto on_exit = [&](caf::exit_msg& x) {
    log::syncer::info("syncer-exit", "abort round {}: {}", ref, x.reason);
    self->fail_state(std::move(x.reason));
    terminated = true;
  };
  // Monitor all candidates and announce the round.
  for (auto& hdl : candidates)
    self->monitor(hdl);
  sync_start_msg announcement{ref, caf::actor_cast<caf::actor>(self),
                              candidates};
  if (opts.broadcast_channel) {
    self->send(opts.broadcast_channel, atom::sync_start_v, announcement);
  } else {
    for (auto& hdl : candidates)
      self->send(hdl, atom::sync_start_v, announcement);
  }
  // Wait until each candidate either signals readiness or goes down. Slaves
  // enter their receive loop before signaling readiness. Hence, all messages
  // we send from here on reach a slave while it runs the sync protocol.
  std::set<caf::actor_addr> pending;
  std::set<caf::actor_addr> dead;
  for (auto& hdl : candidates)
    pending.emplace(hdl.address());
  self->receive_while([&] { return !pending.empty() && !terminated; })(
    [&](atom::sync_ready, round_id id, const caf::actor& hdl) {
      if (id != ref) {
        log::syncer::debug("stale-sync-ready", "drop readiness for round {}",
                           id);
        return;
      }
      log::syncer::debug("slave-ready", "slave ready for round {}", ref);
      pending.erase(hdl.address());
    },
    [&](caf::down_msg& x) {
      log::syncer::info("candidate-down", "candidate of round {} is down: {}",
                        ref, x.reason);
      pending.erase(x.source);
      dead.emplace(x.source);
    },
    on_exit);
  if (terminated)
    return;
  for (auto& hdl : candidates)
    if (dead.count(hdl.address()) == 0)
      st.slaves.emplace_back(hdl);
  log::syncer::info("round-start", "start round {} with {} of {} slaves", ref,
                    st.slaves.size(), candidates.size());
  if (auto lptr = logger())
    lptr->on_round_start(ref, st.slaves.size());
  // Handlers for credit bumps and slave deaths. Used in the main loop as well
  // as while waiting for credit.
  auto on_bump = [&](atom::bump_credit, const caf::actor_addr& peer,
                     uint32_t amount) { st.bump(peer, amount); };
  auto on_down = [&](caf::down_msg& x) { st.drop(x.source, x.reason); };
  // Relay messages from the master until it sends `done`.
  bool done = false;
  std::optional<std::pair<queue_message, message_properties>> next;
  while (!done && !terminated) {
    self->receive(
      [&](atom::msg, round_id id, queue_message& msg,
          message_properties& props) {
        if (id != ref) {
          log::syncer::debug("stale-msg", "drop message of round {}", id);
          return;
        }
        next.emplace(std::move(msg), std::move(props));
      },
      [&](atom::done, round_id id) {
        if (id != ref) {
          log::syncer::debug("stale-done", "drop done of round {}", id);
          return;
        }
        done = true;
      },
      on_bump, on_down, on_exit);
    if (!next)
      continue;
    self->send(st.master, atom::msg_ok_v, ref);
    self->receive_while([&] { return st.credit.blocked() && !terminated; })(
      on_bump, on_down, on_exit);
    if (!terminated) {
      for (auto& hdl : st.slaves) {
        st.credit.send(hdl.address());
        self->send(hdl, atom::sync_msg_v, ref, next->first, next->second);
      }
    }
    next.reset();
  }
  if (terminated)
    return;
  for (auto& hdl : st.slaves)
    self->send(hdl, atom::sync_complete_v, ref);
  log::syncer::info("round-done", "completed round {} with {} slaves", ref,
                    st.slaves.size());
  self->unlink_from(st.master);
}

} // namespace qsync::internal
