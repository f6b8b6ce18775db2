#pragma once

#include "qsync/credit_flow.hh"
#include "qsync/defaults.hh"
#include "qsync/time.hh"

#include <caf/actor.hpp>
#include <caf/actor_system_config.hpp>

#include <functional>
#include <memory>

namespace prometheus {

class Registry;

} // namespace prometheus

namespace qsync {

class backing_queue;

struct skip_init_t {};

constexpr skip_init_t skip_init = skip_init_t{};

/// Tuning knobs and collaborators for a single sync round.
struct sync_options {
  /// Credit window between the syncer and each slave.
  credit_spec credit;

  /// Minimum time between two progress reports of the master.
  timespan progress_interval = defaults::progress_interval;

  /// Ordered broadcast channel for announcing a round. When set, the syncer
  /// sends `(sync_start, sync_start_msg)` to this actor instead of sending the
  /// announcement to each candidate slave directly.
  caf::actor broadcast_channel;

  /// Optional registry for exporting metrics.
  std::shared_ptr<prometheus::Registry> registry;

  /// Called by a slave upon receiving `update_ram_duration`. When unset, the
  /// slave only logs the current RAM duration estimate of its store.
  std::function<void(backing_queue&)> update_ram_duration;

  /// Reads credit and progress settings from the `qsync` option group of
  /// `cfg`.
  static sync_options from(const caf::actor_system_config& cfg);
};

/// Configures an actor system for hosting queue replicas.
///
/// The configuration draws user-provided options from three sources (in order):
/// 1. The configuration file passed via `--config-file`. Contents of this file
///    override hard-coded defaults.
/// 2. Environment variables. qsync currently recognizes the following
///    environment variables:
///    - `QSYNC_CONSOLE_VERBOSITY`: enables console output by overriding
///      `qsync.console-verbosity`. Valid values are `critical`, `error`,
///      `warning`, `info`, `verbose`, and `debug`.
///    - `QSYNC_PROGRESS_INTERVAL`: overrides `qsync.progress-interval`, e.g.,
///      `500ms`.
/// 3. Command line arguments (if provided).
class configuration : public caf::actor_system_config {
public:
  // --- member types ----------------------------------------------------------

  using super = caf::actor_system_config;

  // --- construction and destruction ------------------------------------------

  /// Constructs the configuration without calling `init` implicitly. Requires
  /// the user to call `init` manually.
  explicit configuration(skip_init_t);

  configuration();

  /// Constructs a configuration from command line arguments.
  configuration(int argc, char** argv);

  // -- initialization ---------------------------------------------------------

  /// Parses the configuration file, environment variables, and command line
  /// arguments.
  /// @throws std::invalid_argument if an environment variable has an illegal
  ///         value.
  /// @throws std::runtime_error if parsing the configuration file or the
  ///         command line arguments fails.
  void init(int argc, char** argv);

  /// Registers qsync types with CAF. Safe to call multiple times.
  static void init_global_state();

  // -- properties -------------------------------------------------------------

  /// Returns the sync options as configured by the user.
  sync_options options() const;

  /// Installs the console logger if the user set `qsync.console-verbosity`.
  void apply_logger() const;

  caf::settings dump_content() const override;
};

} // namespace qsync
