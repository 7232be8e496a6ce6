#include "qapp/ledger.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace qapp {

namespace {

// The deployed copy is gone or was edited by hand
bool has_drifted(const PlannedFile& file) {
    if (!is_regular_file(file.path)) return true;
    auto on_disk = read_file(file.path);
    return !on_disk || *on_disk != file.content;
}

} // namespace

Result<LedgerDiff> diff_files(const std::vector<PlannedFile>& planned,
                              const DeploymentRecord& previous,
                              bool force) {
    LedgerDiff diff;
    std::set<std::string> planned_paths;

    for (const auto& file : planned) {
        auto hash = compute_file_digest(file.content, file.mode);
        if (!hash.ok) {
            return Result<LedgerDiff>::err(Error(ErrorCode::IO_ERROR,
                "failed to digest " + file.path + ": " + hash.error));
        }
        diff.digests[file.path] = hash.hex_digest;
        planned_paths.insert(file.path);

        if (force) {
            diff.changed.push_back(file.path);
            continue;
        }

        auto it = previous.files.find(file.path);
        if (it == previous.files.end()) {
            spdlog::debug("new file {}", file.path);
            diff.changed.push_back(file.path);
        } else if (it->second.digest != hash.hex_digest) {
            spdlog::debug("content changed {}", file.path);
            diff.changed.push_back(file.path);
        } else if (has_drifted(file)) {
            spdlog::debug("deployed copy drifted {}", file.path);
            diff.changed.push_back(file.path);
        }
    }

    for (const auto& [path, entry] : previous.files) {
        if (!planned_paths.count(path)) {
            diff.stale.push_back(path);
        }
    }

    diff.any_changed = !diff.changed.empty() || !diff.stale.empty();
    return Result<LedgerDiff>::ok(diff);
}

DeploymentRecord build_deployment_record(const std::string& app_name,
                                         const std::vector<PlannedFile>& planned,
                                         const LedgerDiff& diff,
                                         const DeploymentRecord& previous) {
    std::set<std::string> changed(diff.changed.begin(), diff.changed.end());
    std::string now = get_current_timestamp();

    DeploymentRecord record;
    record.app_name = app_name;
    record.deployed_at = now;

    for (const auto& file : planned) {
        RecordEntry entry;
        auto digest = diff.digests.find(file.path);
        if (digest != diff.digests.end()) {
            entry.digest = digest->second;
        }
        entry.mode = file.mode;

        auto prev = previous.files.find(file.path);
        if (!changed.count(file.path) && prev != previous.files.end() &&
            !prev->second.modified_at.empty()) {
            entry.modified_at = prev->second.modified_at;
        } else {
            entry.modified_at = now;
        }

        record.files[file.path] = entry;
    }

    return record;
}

} // namespace qapp
