#pragma once

#include <istream>
#include <ostream>
#include "curator/command_registry.hpp"
#include "curator/services.hpp"

namespace curator {

// Prompt/read/dispatch until "qq" or end of input, then autosave (if
// configured) and drop all data.
void run_shell(std::istream& in, std::ostream& out, Services& services, const CommandRegistry& reg);

} // namespace curator
