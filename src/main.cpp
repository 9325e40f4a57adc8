#include <filesystem>
#include <iostream>
#include <string>
#include "curator/command_registry.hpp"
#include "curator/config.hpp"
#include "curator/modules/collections_module.hpp"
#include "curator/modules/records_module.hpp"
#include "curator/modules/storage_module.hpp"
#include "curator/services.hpp"
#include "curator/shell.hpp"
#include "shelf/codec.hpp"
#include "shelf/log.hpp"

int main(int argc, char* argv[]) {
  std::filesystem::path config_path = "curator.json";
  bool verbose = false;
  bool help = false;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      help = true;
    } else {
      std::cerr << "Error: unknown option " << arg << " (try --help)\n";
      return 1;
    }
  }

  curator::CommandRegistry reg;
  curator::modules::register_records(reg);
  curator::modules::register_collections(reg);
  curator::modules::register_storage(reg);

  if (help) {
    std::cout << "Usage: curator [options]\n"
              << "Options:\n"
              << "  --config <path>  JSON config file (default curator.json)\n"
              << "  --verbose        Diagnostics on stderr\n"
              << "  --help           Show this help\n"
              << "Commands:\n";
    reg.describe(std::cout);
    std::cout << "  qq  quit\n";
    return 0;
  }

  curator::Services services{};
  try {
    services.config = curator::load_config(config_path);
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  if (verbose) services.config.verbose = true;
  shelf::set_logging(services.config.verbose);

  shelf::log() << "[Curator] Starting, config " << config_path << "\n";

  if (!services.config.autoload.empty()) {
    try {
      shelf::restore_file(services.config.autoload, services.library, services.catalog);
    } catch (const shelf::Error& e) {
      std::cerr << "[Curator] Could not load " << services.config.autoload << ": " << e.what() << "\n";
    }
  }

  curator::run_shell(std::cin, std::cout, services, reg);
  return 0;
}
