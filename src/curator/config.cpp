#include "curator/config.hpp"
#include "shelf/log.hpp"

#include <fstream>
#include <stdexcept>

namespace curator {

Config config_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("config root must be an object");
  }

  Config config;
  try {
    config.verbose = j.value("verbose", config.verbose);
    config.prompt = j.value("prompt", config.prompt);
    config.autoload = j.value("autoload", std::string{});
    config.autosave = j.value("autosave", std::string{});
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("bad config value: ") + e.what());
  }
  return config;
}

Config load_config(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    shelf::log() << "[Config] " << path << " not found, using defaults\n";
    return Config{};
  }

  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("could not open " + path.string());
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(path.string() + ": " + e.what());
  }

  Config config = config_from_json(j);
  shelf::log() << "[Config] Loaded " << path << "\n";
  return config;
}

} // namespace curator
