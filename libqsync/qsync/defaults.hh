#pragma once

#include "qsync/time.hh"

#include <chrono>
#include <cstdint>

// This header contains hard-coded default values for various qsync options.

namespace qsync::defaults {

/// Minimum time between two progress reports of the master.
constexpr timespan progress_interval = std::chrono::seconds{1};

} // namespace qsync::defaults

namespace qsync::defaults::credit {

constexpr uint32_t initial = 2000;

constexpr uint32_t more_after = 500;

} // namespace qsync::defaults::credit
