#include "shelf/log.hpp"

#include <atomic>
#include <iostream>

namespace shelf {

namespace {
  std::atomic<bool> g_enabled{false};
  std::ostream g_null{nullptr};
}

void set_logging(bool enabled) {
  g_enabled = enabled;
}

bool logging_enabled() {
  return g_enabled;
}

std::ostream& log() {
  if (g_enabled) return std::clog;
  return g_null;
}

} // namespace shelf
