#pragma once

#include "qsync/error.hh"
#include "qsync/event.hh"
#include "qsync/round_id.hh"

#include <cstddef>
#include <memory>
#include <string>

namespace qsync {

/// An interface for observing internal events of the sync protocol.
class event_observer {
public:
  virtual ~event_observer();

  /// Called by a syncer after all candidate slaves either signaled readiness
  /// or went down.
  /// @param ref The ID of the sync round.
  /// @param ready The number of slaves that take part in the transfer.
  virtual void on_round_start(round_id ref, size_t ready);

  /// Called by a syncer when removing a slave from an ongoing round.
  /// @param ref The ID of the sync round.
  /// @param reason The exit reason of the slave.
  virtual void on_slave_down(round_id ref, const error& reason);

  /// Called by the master driver after handing over all messages of a round.
  /// @param ref The ID of the sync round.
  /// @param queue The name of the synchronized queue.
  /// @param count The number of transferred messages.
  virtual void on_round_done(round_id ref, const std::string& queue,
                             size_t count);

  /// Called by the framework to notify the observer about a new event.
  /// @param what The event that the framework has emitted.
  /// @note This member function is called from multiple threads and thus must
  ///       be thread-safe.
  virtual void observe(event_ptr what) = 0;

  /// Returns true if the observer is interested in events of the given severity
  /// and component type. Returning false will cause the framework to not
  /// generate filtered events.
  virtual bool accepts(event::severity_level severity,
                       event::component_type component) const = 0;
};

/// A smart pointer holding an ::event_observer.
using event_observer_ptr = std::shared_ptr<event_observer>;

} // namespace qsync
