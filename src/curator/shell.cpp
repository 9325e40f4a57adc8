#include "curator/shell.hpp"
#include "curator/input.hpp"
#include "shelf/codec.hpp"
#include "shelf/log.hpp"

namespace curator {

void run_shell(std::istream& in, std::ostream& out, Services& services, const CommandRegistry& reg) {
  Context ctx{in, out, services};

  while (true) {
    out << services.config.prompt << std::flush;

    std::string cmd = read_command(in);
    if (cmd.empty()) {
      shelf::log() << "[Shell] End of input\n";
      break;
    }
    if (cmd == "qq") break;

    reg.dispatch(cmd, ctx);
  }

  std::lock_guard lk(services.mu);
  if (!services.config.autosave.empty()) {
    try {
      shelf::save_file(services.config.autosave, services.library, services.catalog);
      shelf::log() << "[Shell] Autosaved to " << services.config.autosave << "\n";
    } catch (const shelf::Error& e) {
      out << e.what() << "\n";
    }
  }

  services.library.clear_all(services.catalog);
  out << "All data deleted\n";
  out << "Done\n";
}

} // namespace curator
