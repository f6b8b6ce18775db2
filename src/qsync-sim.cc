#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <caf/actor_system.hpp>
#include <caf/behavior.hpp>
#include <caf/blocking_actor.hpp>
#include <caf/config_option_adder.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/exit_reason.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/scoped_actor.hpp>
#include <caf/send.hpp>
#include <caf/type_id.hpp>

#include "qsync/configuration.hh"
#include "qsync/internal/type_id.hh"
#include "qsync/master.hh"
#include "qsync/memory_queue.hh"
#include "qsync/slave.hh"
#include "qsync/sqlite_queue.hh"

#include <fmt/color.h>
#include <fmt/core.h>

using std::string;

using qsync::backing_queue;
using qsync::backing_queue_ptr;

namespace atom = qsync::atom;

// -- additional message and atom types ----------------------------------------

CAF_BEGIN_TYPE_ID_BLOCK(qsync_sim, caf::id_block::qsync::end)

  CAF_ADD_ATOM(qsync_sim, qsync::atom, report)

CAF_END_TYPE_ID_BLOCK(qsync_sim)

namespace {

// -- constants ----------------------------------------------------------------

const auto error_style = fg(fmt::color::red);

const auto verbose_style = fg(fmt::color::blue);

constexpr uint64_t default_messages = 1000;

constexpr uint64_t default_slaves = 2;

// -- program options ----------------------------------------------------------

class sim_config : public qsync::configuration {
public:
  sim_config() : configuration(qsync::skip_init) {
    opt_group{custom_options_, "sim"}
      .add<uint64_t>("messages,n",
                     "number of messages in the master queue (default: 1000)")
      .add<uint64_t>("slaves,k", "number of slaves (default: 2)")
      .add<uint64_t>("kill-slave",
                     "index of a slave to terminate when the round starts")
      .add<string>("store", "'memory' (default) or 'sqlite'")
      .add<string>("directory",
                   "directory for SQLite databases (default: qsync-sim)");
  }
};

// -- actors -------------------------------------------------------------------

// Relays round announcements to all members in order.
caf::behavior broadcast_channel(caf::event_based_actor* self,
                                std::vector<caf::actor> members) {
  return {
    [self, members](atom::sync_start, const qsync::sync_start_msg& x) {
      for (auto& member : members)
        self->send(member, atom::sync_start_v, x);
    },
  };
}

// Hosts a queue replica that takes part in sync rounds until receiving an
// exit message.
void replica(caf::blocking_actor* self, uint64_t index, backing_queue* store,
             qsync::sync_options opts, caf::actor reporter) {
  qsync::credit_flow<caf::actor_addr> credit{opts.credit};
  auto hdl = caf::actor_cast<caf::actor>(self);
  bool running = true;
  self->receive_while(running)(
    [&](atom::sync_start, const qsync::sync_start_msg& x) {
      if (!x.includes(hdl))
        return;
      auto res = qsync::slave::run(self, x.ref, x.syncer, *store, credit,
                                   opts);
      auto len = store->len();
      self->send(reporter, atom::report_v, index,
                 to_string(res.outcome), len ? *len : uint64_t{0});
      if (res.outcome == qsync::sync_outcome::stopped)
        running = false;
    },
    [&](caf::exit_msg&) { running = false; });
}

// -- store setup --------------------------------------------------------------

backing_queue_ptr make_store(const caf::actor_system_config& cfg,
                             const string& name) {
  auto type = caf::get_or(cfg, "sim.store", "memory");
  if (type == "memory")
    return std::make_unique<qsync::memory_queue>();
  if (type != "sqlite") {
    fmt::print(error_style, "invalid store type: {}\n", type);
    return nullptr;
  }
  qsync::sqlite_queue_options opts;
  opts.path = caf::get_or(cfg, "sim.directory", "qsync-sim");
  opts.path += '/';
  opts.path += name;
  opts.path += ".db";
  auto result = std::make_unique<qsync::sqlite_queue>(std::move(opts));
  if (result->init_failed()) {
    fmt::print(error_style, "failed to open the database for {}\n", name);
    return nullptr;
  }
  return result;
}

} // namespace

int main(int argc, char** argv) try {
  setvbuf(stdout, nullptr, _IOLBF, 0); // Always line-buffer stdout.
  caf::init_global_meta_objects<caf::id_block::qsync_sim>();
  // Parse CLI parameters using our config.
  sim_config cfg;
  try {
    cfg.init(argc, argv);
  } catch (std::exception& ex) {
    fmt::print(error_style, "{}\n", ex.what());
    return EXIT_FAILURE;
  }
  if (cfg.cli_helptext_printed)
    return EXIT_SUCCESS;
  cfg.apply_logger();
  auto opts = cfg.options();
  auto num_messages = caf::get_or(cfg, "sim.messages", default_messages);
  auto num_slaves = caf::get_or(cfg, "sim.slaves", default_slaves);
  // Stores must outlive the actor system.
  auto master_store = make_store(cfg, "master");
  if (!master_store)
    return EXIT_FAILURE;
  std::vector<backing_queue_ptr> slave_stores;
  for (uint64_t i = 0; i < num_slaves; ++i) {
    auto store = make_store(cfg, "slave-" + std::to_string(i));
    if (!store)
      return EXIT_FAILURE;
    slave_stores.emplace_back(std::move(store));
  }
  // Fill the master queue.
  if (auto n = master_store->purge(); !n) {
    fmt::print(error_style, "failed to purge the master store: {}\n",
               to_string(n.error()));
    return EXIT_FAILURE;
  }
  for (uint64_t i = 1; i <= num_messages; ++i) {
    qsync::queue_message msg;
    msg.id = i;
    msg.routing_key = "sim";
    msg.payload = "message " + std::to_string(i);
    msg.persistent = true;
    if (auto err = master_store->publish(msg, qsync::make_properties(msg),
                                         false)) {
      fmt::print(error_style, "failed to fill the master store: {}\n",
                 to_string(err));
      return EXIT_FAILURE;
    }
  }
  caf::actor_system sys{cfg};
  caf::scoped_actor self{sys};
  auto reporter = caf::actor_cast<caf::actor>(self);
  std::vector<caf::actor> slaves;
  for (uint64_t i = 0; i < num_slaves; ++i)
    slaves.emplace_back(
      sys.spawn(replica, i, slave_stores[i].get(), opts, reporter));
  opts.broadcast_channel = sys.spawn(broadcast_channel, slaves);
  // Run a single round.
  auto ref = qsync::round_id::random();
  fmt::print("start round {} with {} messages and {} slaves\n",
             to_string(ref), num_messages, num_slaves);
  auto syncer = qsync::master::prepare(self.ptr(), ref, slaves, opts);
  if (auto victim = caf::get_as<uint64_t>(cfg, "sim.kill-slave")) {
    if (*victim < num_slaves) {
      fmt::print("terminate slave {}\n", *victim);
      self->send_exit(slaves[*victim], caf::exit_reason::user_shutdown);
    } else {
      fmt::print(error_style, "no such slave: {}\n", *victim);
    }
  }
  auto err = qsync::master::run(self.ptr(), syncer, ref, "sim",
                                *master_store, opts);
  if (err)
    fmt::print(error_style, "round failed: {}\n", to_string(err));
  // Collect the results from all slaves.
  std::set<caf::actor_addr> pending;
  for (auto& hdl : slaves) {
    self->monitor(hdl);
    pending.emplace(hdl.address());
  }
  auto index_of = [&](const caf::actor_addr& addr) {
    for (size_t i = 0; i < slaves.size(); ++i)
      if (slaves[i] == addr)
        return i;
    return slaves.size();
  };
  self->receive_while([&] { return !pending.empty(); })(
    [&](atom::report, uint64_t index, const string& outcome, uint64_t len) {
      fmt::print(outcome == "completed" ? verbose_style : error_style,
                 "slave {}: {} with {} messages\n", index, outcome, len);
      pending.erase(slaves[index].address());
    },
    [&](caf::down_msg& x) {
      if (pending.erase(x.source) != 0)
        fmt::print(error_style, "slave {}: terminated ({})\n",
                   index_of(x.source), to_string(x.reason));
    });
  for (auto& hdl : slaves)
    self->send_exit(hdl, caf::exit_reason::user_shutdown);
  self->send_exit(opts.broadcast_channel, caf::exit_reason::user_shutdown);
  return err ? EXIT_FAILURE : EXIT_SUCCESS;
} catch (std::exception& ex) {
  fmt::print(error_style, "{}\n", ex.what());
  return EXIT_FAILURE;
}
