#include "qsync/message.hh"

namespace qsync {

std::string to_string(const queue_message& x) {
  std::string result = "message(";
  result += std::to_string(x.id);
  result += ", ";
  result += x.routing_key;
  result += ", ";
  result += std::to_string(x.payload.size());
  result += " bytes";
  if (x.persistent)
    result += ", persistent";
  result += ')';
  return result;
}

std::string to_string(const message_properties& x) {
  std::string result = "properties(expiry: ";
  if (x.expiry)
    result += to_string(*x.expiry);
  else
    result += "none";
  result += ", needs-confirming: ";
  result += x.needs_confirming ? "true" : "false";
  result += ", size: ";
  result += std::to_string(x.size);
  result += ')';
  return result;
}

message_properties make_properties(const queue_message& msg,
                                   bool needs_confirming) {
  message_properties result;
  result.needs_confirming = needs_confirming;
  result.size = msg.payload.size();
  return result;
}

} // namespace qsync
