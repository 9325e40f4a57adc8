#pragma once

#include <ostream>

namespace shelf {

// Diagnostics go to std::clog as "[Component] message" lines, off by default.
void set_logging(bool enabled);
bool logging_enabled();

// std::clog when enabled, otherwise a stream that drops everything
std::ostream& log();

} // namespace shelf
