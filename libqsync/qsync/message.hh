#pragma once

#include "qsync/time.hh"

#include <cstdint>
#include <optional>
#include <string>

namespace qsync {

/// A single message stored in a queue.
struct queue_message {
  /// Unique ID of the message within its queue.
  uint64_t id = 0;

  /// The routing key the message was published with.
  std::string routing_key;

  /// Opaque message body.
  std::string payload;

  /// Whether the message survives a restart of its queue.
  bool persistent = false;
};

/// @relates queue_message
inline bool operator==(const queue_message& x, const queue_message& y) {
  return x.id == y.id && x.routing_key == y.routing_key
         && x.payload == y.payload && x.persistent == y.persistent;
}

/// @relates queue_message
inline bool operator!=(const queue_message& x, const queue_message& y) {
  return !(x == y);
}

/// @relates queue_message
template <class Inspector>
bool inspect(Inspector& f, queue_message& x) {
  return f.object(x).fields(f.field("id", x.id),
                            f.field("routing-key", x.routing_key),
                            f.field("payload", x.payload),
                            f.field("persistent", x.persistent));
}

/// @relates queue_message
std::string to_string(const queue_message& x);

/// Delivery properties that accompany a @ref queue_message.
struct message_properties {
  /// Point in time after which the message expires, if any.
  std::optional<timestamp> expiry;

  /// Whether the publisher waits for a confirm of this message.
  bool needs_confirming = false;

  /// Size of the payload in bytes.
  uint64_t size = 0;
};

/// @relates message_properties
inline bool operator==(const message_properties& x,
                       const message_properties& y) {
  return x.expiry == y.expiry && x.needs_confirming == y.needs_confirming
         && x.size == y.size;
}

/// @relates message_properties
inline bool operator!=(const message_properties& x,
                       const message_properties& y) {
  return !(x == y);
}

/// @relates message_properties
template <class Inspector>
bool inspect(Inspector& f, message_properties& x) {
  return f.object(x).fields(f.field("expiry", x.expiry),
                            f.field("needs-confirming", x.needs_confirming),
                            f.field("size", x.size));
}

/// @relates message_properties
std::string to_string(const message_properties& x);

/// Convenience function for creating a message with properties that match its
/// payload.
message_properties make_properties(const queue_message& msg,
                                   bool needs_confirming = false);

} // namespace qsync
