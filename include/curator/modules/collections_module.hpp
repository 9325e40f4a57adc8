#pragma once
#include "curator/command_registry.hpp"

namespace curator::modules {
  void register_collections(CommandRegistry& reg);
}
