#include "qsync/event_observer.hh"

namespace qsync {

event_observer::~event_observer() {}

void event_observer::on_round_start(round_id, size_t) {}

void event_observer::on_slave_down(round_id, const error&) {}

void event_observer::on_round_done(round_id, const std::string&, size_t) {}

} // namespace qsync
