#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace curator {

struct Config {
  bool verbose{false};
  std::string prompt{"\nEnter command: "};
  std::filesystem::path autoload;   // restored at startup when set
  std::filesystem::path autosave;   // saved on quit when set
};

// Unknown keys are ignored; a known key of the wrong type throws std::runtime_error
Config config_from_json(const nlohmann::json& j);

// Defaults if path does not exist.
// @throw std::runtime_error if the file cannot be read or parsed
Config load_config(const std::filesystem::path& path);

} // namespace curator
