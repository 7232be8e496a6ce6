#pragma once

#include "qapp/types.hpp"

#include <chrono>
#include <string>

namespace qapp {

// ============================================================================
// Engine Configuration
// ============================================================================

constexpr const char* CONFIG_SCHEMA = "qapp.config.v1";
constexpr const char* CONFIG_ENV_VAR = "QAPP_CONFIG";
constexpr const char* SYSTEM_CONFIG_PATH = "/etc/qapp/config.json";

struct EngineConfig {
    std::string units_root = "/etc/containers/systemd";
    std::string base_path = "/srv";
    std::string state_dir = "/var/lib/qapp";
    std::chrono::seconds timeout{120};
    std::string systemctl = "systemctl";
    std::string generator = "/usr/lib/systemd/system-generators/podman-system-generator";
    bool validate_units = true;
    bool user_mode = false;
};

// Overlay the keys present in a qapp.config.v1 document onto `config`.
// CONFIG_ERROR on malformed JSON, a schema mismatch or a mistyped value;
// unknown keys are logged and ignored.
Result<void> apply_config_json(const std::string& json_str,
                               EngineConfig& config,
                               const std::string& source_path);

/**
 * Resolve the configuration file to use.
 * Priority: explicit path > QAPP_CONFIG env > /etc/qapp/config.json (if present).
 * Returns an empty string when no file applies.
 */
std::string resolve_config_path(const std::string& explicit_path);

// Built-in defaults overlaid with the resolved configuration file.
// An explicitly named file that cannot be read is a CONFIG_ERROR.
Result<EngineConfig> load_engine_config(const std::string& explicit_path);

// {state_dir}/locks/{app}.lock
std::string lock_file_path(const EngineConfig& config, const std::string& app_name);

} // namespace qapp
