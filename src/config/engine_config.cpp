#include "qapp/config.hpp"
#include "qapp/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace qapp {

namespace {

Error config_error(const std::string& source_path, const std::string& msg) {
    return Error(ErrorCode::CONFIG_ERROR, source_path + ": " + msg);
}

std::string get_env(const char* name) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : std::string();
}

} // namespace

Result<void> apply_config_json(const std::string& json_str,
                               EngineConfig& config,
                               const std::string& source_path) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<void>::err(config_error(source_path, std::string("invalid JSON: ") + e.what()));
    }

    if (!j.is_object()) {
        return Result<void>::err(config_error(source_path, "JSON must be an object"));
    }

    if (j.contains("$schema")) {
        if (!j["$schema"].is_string() || j["$schema"].get<std::string>() != CONFIG_SCHEMA) {
            return Result<void>::err(config_error(source_path,
                std::string("$schema mismatch: expected ") + CONFIG_SCHEMA));
        }
    }

    EngineConfig updated = config;

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const auto& v = it.value();

        auto want_string = [&](std::string& field) -> bool {
            if (!v.is_string() || v.get<std::string>().empty()) return false;
            field = v.get<std::string>();
            return true;
        };
        auto want_bool = [&](bool& field) -> bool {
            if (!v.is_boolean()) return false;
            field = v.get<bool>();
            return true;
        };

        bool ok = true;
        if (key == "$schema") {
            continue;
        } else if (key == "units_root") {
            ok = want_string(updated.units_root);
        } else if (key == "base_path") {
            ok = want_string(updated.base_path);
        } else if (key == "state_dir") {
            ok = want_string(updated.state_dir);
        } else if (key == "systemctl") {
            ok = want_string(updated.systemctl);
        } else if (key == "generator") {
            ok = want_string(updated.generator);
        } else if (key == "validate_units") {
            ok = want_bool(updated.validate_units);
        } else if (key == "user_mode") {
            ok = want_bool(updated.user_mode);
        } else if (key == "timeout_seconds") {
            ok = v.is_number_integer() && v.get<long long>() > 0;
            if (ok) updated.timeout = std::chrono::seconds(v.get<long long>());
        } else {
            spdlog::warn("{}: ignoring unknown config key '{}'", source_path, key);
        }

        if (!ok) {
            return Result<void>::err(config_error(source_path, "invalid value for '" + key + "'"));
        }
    }

    config = updated;
    return Result<void>::ok();
}

std::string resolve_config_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }

    std::string env_path = get_env(CONFIG_ENV_VAR);
    if (!env_path.empty()) {
        return env_path;
    }

    if (is_regular_file(SYSTEM_CONFIG_PATH)) {
        return SYSTEM_CONFIG_PATH;
    }

    return "";
}

Result<EngineConfig> load_engine_config(const std::string& explicit_path) {
    EngineConfig config;

    std::string path = resolve_config_path(explicit_path);
    if (path.empty()) {
        spdlog::debug("no configuration file, using built-in defaults");
        return Result<EngineConfig>::ok(config);
    }

    auto content = read_file(path);
    if (!content) {
        return Result<EngineConfig>::err(config_error(path, "cannot read configuration file"));
    }

    auto applied = apply_config_json(*content, config, path);
    if (applied.isErr()) {
        return Result<EngineConfig>::err(applied.error());
    }

    spdlog::debug("loaded configuration from {}", path);
    return Result<EngineConfig>::ok(config);
}

std::string lock_file_path(const EngineConfig& config, const std::string& app_name) {
    return join_path(join_path(config.state_dir, "locks"), app_name + ".lock");
}

} // namespace qapp
