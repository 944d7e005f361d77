#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace minigpt::config {

// $HOME/.minigpt/config.json
std::filesystem::path ConfigFilePath();

// Defaults overlaid with the given file. Missing or malformed files keep the
// defaults; fields of the wrong type are skipped.
Config LoadConfigFromFile(const std::filesystem::path& path);

// LoadConfigFromFile(ConfigFilePath()) followed by MINIGPT_* environment
// overrides.
Config LoadConfig();

}  // namespace minigpt::config
