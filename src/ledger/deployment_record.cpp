#include "qapp/ledger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>

namespace qapp {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string mode_to_string(unsigned int mode) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04o", mode & 07777u);
    return buf;
}

std::optional<unsigned int> parse_mode(const std::string& s) {
    if (s.empty() || s.size() > 4) return std::nullopt;
    for (char c : s) {
        if (c < '0' || c > '7') return std::nullopt;
    }
    return static_cast<unsigned int>(std::strtoul(s.c_str(), nullptr, 8));
}

} // namespace

RecordParseResult parse_deployment_record(const std::string& json_str) {
    RecordParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        auto schema = get_string(j, "$schema");
        if (!schema) {
            result.error = "$schema missing";
            return result;
        }
        if (*schema != DEPLOYMENT_RECORD_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + DEPLOYMENT_RECORD_SCHEMA;
            return result;
        }
        result.record.schema = *schema;

        if (j.contains("app") && j["app"].is_object()) {
            if (auto name = get_string(j["app"], "name")) {
                result.record.app_name = *name;
            }
        }

        if (auto ts = get_string(j, "deployed_at")) {
            result.record.deployed_at = *ts;
        }

        if (j.contains("files")) {
            if (!j["files"].is_object()) {
                result.error = "files must be an object";
                return result;
            }
            for (auto it = j["files"].begin(); it != j["files"].end(); ++it) {
                const auto& f = it.value();
                if (!f.is_object()) {
                    result.error = "files." + it.key() + " must be an object";
                    return result;
                }

                RecordEntry entry;
                auto digest = get_string(f, "digest");
                if (!digest || digest->empty()) {
                    result.error = "files." + it.key() + ".digest missing";
                    return result;
                }
                entry.digest = *digest;

                if (auto mode_str = get_string(f, "mode")) {
                    auto mode = parse_mode(*mode_str);
                    if (!mode) {
                        result.error = "files." + it.key() + ".mode invalid: " + *mode_str;
                        return result;
                    }
                    entry.mode = *mode;
                }

                if (auto ts = get_string(f, "modified_at")) {
                    entry.modified_at = *ts;
                }

                result.record.files[it.key()] = entry;
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

std::string serialize_deployment_record(const DeploymentRecord& record) {
    nlohmann::json j;
    j["$schema"] = DEPLOYMENT_RECORD_SCHEMA;
    j["app"] = {{"name", record.app_name}};
    j["deployed_at"] = record.deployed_at;

    nlohmann::json files = nlohmann::json::object();
    for (const auto& [path, entry] : record.files) {
        files[path] = {
            {"digest", entry.digest},
            {"mode", mode_to_string(entry.mode)},
            {"modified_at", entry.modified_at},
        };
    }
    j["files"] = files;

    return j.dump(2) + "\n";
}

std::string deployment_record_path(const std::string& state_dir, const std::string& app_name) {
    return join_path(join_path(state_dir, "records"), app_name + ".json");
}

DeploymentRecord load_deployment_record(const std::string& path, const std::string& app_name) {
    DeploymentRecord empty;
    empty.app_name = app_name;

    if (!path_exists(path)) {
        spdlog::debug("no deployment record at {}", path);
        return empty;
    }

    auto content = read_file(path);
    if (!content) {
        spdlog::warn("cannot read deployment record {}, treating every file as changed", path);
        return empty;
    }

    auto parsed = parse_deployment_record(*content);
    if (!parsed.ok) {
        spdlog::warn("ignoring corrupt deployment record {}: {}", path, parsed.error);
        return empty;
    }

    if (parsed.record.app_name.empty()) {
        parsed.record.app_name = app_name;
    }
    return parsed.record;
}

Result<void> save_deployment_record(const std::string& path, const DeploymentRecord& record) {
    auto write = atomic_write_file(path, serialize_deployment_record(record), 0600);
    if (!write.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
            "failed to write deployment record " + path + ": " + write.error));
    }
    return Result<void>::ok();
}

} // namespace qapp
