/* @file ConfigLoader.cpp
 * @brief reads the JSON config file.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>

// third-party headers
#include <nlohmann/json.hpp>

// ivlab headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace ivlab::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ValidationError("[ConfigLoader] cannot open " + path_);
  try {
    return nlohmann::json::parse(in, /*cb=*/nullptr, /*allow_exceptions=*/true, /*ignore_comments=*/true);
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

LabConfig ConfigLoader::loadLabConfig() const {
  return LabConfig::fromJson(load());
}
