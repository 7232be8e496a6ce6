/**
 * qapp CLI - Common utilities and types
 */

#pragma once

#include <qapp/qapp.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace qapp::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Configuration values given on the command line. Set fields win over the
 * configuration file and built-in defaults.
 */
struct ConfigOverrides {
    std::string units_root;
    std::string base_path;
    std::string state_dir;
    std::optional<int> timeout;
    bool no_validate = false;
};

/**
 * Install the stderr logger. Library code logs through spdlog's default
 * logger; stdout is reserved for command output.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("qapp");
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Resolve the engine configuration.
 * Priority: flag > --config file > QAPP_CONFIG file > /etc/qapp/config.json > defaults
 */
inline Result<EngineConfig> resolve_engine_config(const GlobalOptions& opts,
                                                  const ConfigOverrides& overrides) {
    auto loaded = load_engine_config(opts.config);
    if (loaded.isErr()) {
        return loaded;
    }

    EngineConfig config = loaded.value();
    if (!overrides.units_root.empty()) config.units_root = overrides.units_root;
    if (!overrides.base_path.empty()) config.base_path = overrides.base_path;
    if (!overrides.state_dir.empty()) config.state_dir = overrides.state_dir;
    if (overrides.timeout) config.timeout = std::chrono::seconds(*overrides.timeout);
    if (overrides.no_validate) config.validate_units = false;

    return Result<EngineConfig>::ok(config);
}

/**
 * Template variables from --vars-file and repeated --var flags.
 * Flags override values from the file.
 */
inline Result<VariableMap> collect_variables(const std::string& vars_file,
                                             const std::vector<std::string>& assignments) {
    VariableMap vars;
    if (!vars_file.empty()) {
        auto from_file = load_variables_file(vars_file);
        if (from_file.isErr()) return from_file;
        vars = from_file.value();
    }

    auto from_flags = parse_variable_assignments(assignments);
    if (from_flags.isErr()) return from_flags;

    return Result<VariableMap>::ok(merge_variables(vars, from_flags.value()));
}

/**
 * Output utilities.
 */
inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline int report_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["error_kind"] = error_code_to_string(error.code());
        output_json(j);
    } else {
        std::cerr << "Error: " << error.toString() << std::endl;
    }
    return error_code_exit_status(error.code());
}

} // namespace qapp::cli
