#pragma once
#include "curator/command_registry.hpp"

namespace curator::modules {
  void register_records(CommandRegistry& reg);
}
