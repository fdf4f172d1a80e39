#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads the sweep configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/ExperimentConfig.hpp"

namespace pzt::core {

  /// Missing, malformed or out-of-range configuration.
  class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file, validates it once and hands a
 *        typed ExperimentConfig to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file (tiny file).
 *  * A missing `chN` block is the inactive-channel convention, not an error.
 *  * Anything else missing or invalid throws ConfigError naming the key.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse and validate the file or throw `ConfigError`.
    ExperimentConfig load() const;

    /// Validate an already parsed document.
    static ExperimentConfig parse(const nlohmann::json& doc);

  private:
    std::string path_;
  };

} // namespace pzt::core
