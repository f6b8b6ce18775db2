#include "qsync/time.hh"

#include <caf/timestamp.hpp>

namespace qsync {

void convert(timespan s, std::string& str) {
  if (s == infinite) {
    str = "infinite";
    return;
  }
  using std::to_string;
  str = to_string(s.count());
  str += "ns";
}

void convert(timespan s, double& secs) {
  secs = std::chrono::duration_cast<fractional_seconds>(s).count();
}

void convert(timestamp t, std::string& str) {
  caf::append_timestamp_to_string(str, t);
}

bool convert(double secs, timespan& s) {
  s = std::chrono::duration_cast<timespan>(fractional_seconds{secs});
  return true;
}

timestamp now() {
  return clock::now();
}

} // namespace qsync
