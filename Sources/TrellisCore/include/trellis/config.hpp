#pragma once

#include "log.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace trellis {

/// Process configuration, read from a JSON file:
///
///   { "app_name": "trellis", "db_path": "/tmp/t.db", "in_memory": false, "log_level": "info" }
///
/// Every key is optional.
struct configuration {
    std::string app_name = "trellis";
    std::optional<std::string> db_path;
    bool in_memory = false;
    log_level level = log_level::warn;

    /// Reads `path`. A missing file yields the defaults; a malformed file
    /// throws configuration_error.
    static configuration load(const std::filesystem::path& path);

    /// $XDG_CONFIG_HOME/<app>/config.json, else $HOME/.config/<app>/config.json.
    /// Returns nullopt when neither variable is set.
    static std::optional<std::filesystem::path> default_path(const std::string& app_name);

    /// Applies TRELLIS_DB_PATH and TRELLIS_LOG_LEVEL overrides.
    void apply_environment();

    std::string to_json_string() const;
};

} // namespace trellis
