#include "trellis/config.hpp"
#include "trellis/error.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace trellis {

using json = nlohmann::json;

namespace {

log_level level_from_json(const json& j) {
    auto name = j.get<std::string>();
    auto level = parse_log_level(name);
    if (!level) {
        throw configuration_error("unknown log level: " + name);
    }
    return *level;
}

} // namespace

void to_json(json& j, const configuration& c) {
    j = json{
        {"app_name", c.app_name},
        {"in_memory", c.in_memory},
        {"log_level", to_string(c.level)}
    };
    if (c.db_path) {
        j["db_path"] = *c.db_path;
    }
}

void from_json(const json& j, configuration& c) {
    c.app_name = j.value("app_name", c.app_name);
    c.in_memory = j.value("in_memory", c.in_memory);
    if (j.contains("db_path") && !j["db_path"].is_null()) {
        c.db_path = j["db_path"].get<std::string>();
    }
    if (j.contains("log_level")) {
        c.level = level_from_json(j["log_level"]);
    }
}

configuration configuration::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return configuration{};
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        auto j = json::parse(buffer.str());
        if (!j.is_object()) {
            throw configuration_error("configuration must be a JSON object: " + path.string());
        }
        return j.get<configuration>();
    } catch (const json::exception& e) {
        throw configuration_error("invalid configuration " + path.string() + ": " + e.what());
    }
}

std::optional<std::filesystem::path> configuration::default_path(const std::string& app_name) {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        return std::nullopt;
    }
    return base / app_name / "config.json";
}

void configuration::apply_environment() {
    if (const char* path = std::getenv("TRELLIS_DB_PATH"); path && *path) {
        db_path = path;
    }
    if (const char* name = std::getenv("TRELLIS_LOG_LEVEL"); name && *name) {
        auto parsed = parse_log_level(name);
        if (!parsed) {
            throw configuration_error(std::string("unknown log level in TRELLIS_LOG_LEVEL: ") + name);
        }
        level = *parsed;
    }
}

std::string configuration::to_json_string() const {
    return json(*this).dump(2);
}

} // namespace trellis
