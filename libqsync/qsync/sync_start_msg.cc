#include "qsync/sync_start_msg.hh"

#include <algorithm>

namespace qsync {

bool sync_start_msg::includes(const caf::actor& hdl) const {
  return std::find(slaves.begin(), slaves.end(), hdl) != slaves.end();
}

std::string to_string(const sync_start_msg& x) {
  std::string result = "sync_start_msg(";
  result += to_string(x.ref);
  result += ", ";
  result += caf::to_string(x.syncer);
  result += ", [";
  bool first = true;
  for (const auto& slave : x.slaves) {
    if (first)
      first = false;
    else
      result += ", ";
    result += caf::to_string(slave);
  }
  result += "])";
  return result;
}

} // namespace qsync
