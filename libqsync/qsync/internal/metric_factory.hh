#pragma once

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/registry.h>

#include <string>

namespace qsync::internal {

/// Provides a single access point for all qsync metric families and instances.
class metric_factory {
public:
  // -- convenience type aliases -----------------------------------------------

  template <class T>
  using family_t = prometheus::Family<T>;

  using counter = prometheus::Counter;

  using counter_family = family_t<counter>;

  /// Bundles all metrics for the master and syncer side of a round.
  class master_t {
  public:
    explicit master_t(prometheus::Registry& reg) : reg_(&reg) {}

    master_t(const master_t&) noexcept = default;

    master_t& operator=(const master_t&) noexcept = default;

    /// Counts how many messages the master handed to a syncer.
    ///
    /// Label dimensions: `queue`.
    counter_family* sync_messages_family();

    /// Returns an instance of `qsync_sync_messages_total` for the given
    /// queue.
    counter* sync_messages_instance(std::string queue);

    /// Counts how many slaves a syncer removed from an ongoing round.
    counter_family* dropped_slaves_family();

    /// Returns the single instance of `qsync_dropped_slaves_total`.
    counter* dropped_slaves_instance();

  private:
    prometheus::Registry* reg_;
  };

  /// Bundles all metrics for the slave side of a round.
  class slave_t {
  public:
    explicit slave_t(prometheus::Registry& reg) : reg_(&reg) {}

    slave_t(const slave_t&) noexcept = default;

    slave_t& operator=(const slave_t&) noexcept = default;

    /// Counts how many rounds ended on the slave side.
    ///
    /// Label dimensions: `outcome` ('completed', 'failed', or 'stopped').
    counter_family* rounds_family();

    struct rounds_t {
      counter* completed;
      counter* failed;
      counter* stopped;
    };

    /// Returns all instances of `qsync_slave_rounds_total`.
    rounds_t rounds_instances();

  private:
    prometheus::Registry* reg_;
  };

  explicit metric_factory(prometheus::Registry& reg) noexcept
    : master(reg), slave(reg) {
    // nop
  }

  metric_factory(const metric_factory&) noexcept = default;

  metric_factory& operator=(const metric_factory&) noexcept = default;

  master_t master;

  slave_t slave;
};

} // namespace qsync::internal
