#include "qapp/deployer.hpp"
#include "qapp/platform.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace qapp {

std::string unit_target_path(const std::string& units_root,
                             const std::string& app_name,
                             const std::string& unit_filename) {
    return join_path(units_root, prefixed_name(app_name, unit_filename));
}

std::string auxiliary_target_path(const std::string& base_path,
                                  const std::string& app_name,
                                  AuxiliaryCategory category,
                                  const std::string& unit,
                                  const std::string& rel_path) {
    std::string dir = join_path(join_path(join_path(base_path, app_name),
                                          auxiliary_target_dir(category)),
                                unit);
    return join_path(dir, rel_path);
}

Result<DeployOutcome> deploy_files(const std::string& app_name,
                                   const std::vector<PlannedFile>& planned,
                                   const LedgerDiff& diff,
                                   const DeploymentRecord& previous,
                                   const std::string& record_path,
                                   const std::string& prune_root) {
    DeployOutcome outcome;
    std::set<std::string> changed(diff.changed.begin(), diff.changed.end());

    for (const auto& file : planned) {
        if (!changed.count(file.path)) continue;

        auto result = atomic_write_file(file.path, file.content, file.mode);
        if (!result.ok) {
            return Result<DeployOutcome>::err(Error(ErrorCode::IO_ERROR,
                "failed to write " + file.path + ": " + result.error));
        }
        spdlog::info("wrote {}", file.path);
        outcome.written.push_back(file.path);
    }

    for (const auto& path : diff.stale) {
        auto result = atomic_remove_file(path);
        if (!result.ok) {
            return Result<DeployOutcome>::err(Error(ErrorCode::IO_ERROR,
                "failed to remove stale file " + path + ": " + result.error));
        }
        spdlog::info("removed stale {}", path);
        outcome.removed.push_back(path);

        for (const auto& dir : remove_empty_directories(get_parent_directory(path), prune_root)) {
            spdlog::debug("removed empty directory {}", dir);
        }
    }

    outcome.record = build_deployment_record(app_name, planned, diff, previous);
    auto saved = save_deployment_record(record_path, outcome.record);
    if (saved.isErr()) {
        return Result<DeployOutcome>::err(saved.error());
    }

    return Result<DeployOutcome>::ok(outcome);
}

} // namespace qapp
