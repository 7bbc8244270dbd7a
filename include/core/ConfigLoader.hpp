#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/LabConfig.hpp"

namespace ivlab::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to
 *        the caller, or turns it straight into a validated LabConfig.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Schema validation lives in LabConfig::fromJson.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `ValidationError`.
    nlohmann::json load() const;

    /// `LabConfig::fromJson(load())`.
    LabConfig loadLabConfig() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace ivlab::core
