#pragma once

#include "qapp/ledger.hpp"
#include "qapp/layout.hpp"
#include "qapp/types.hpp"

#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Target Paths
// ============================================================================

// {units_root}/{app}--{unit}.{suffix}
std::string unit_target_path(const std::string& units_root,
                             const std::string& app_name,
                             const std::string& unit_filename);

// {base_path}/{app}/{init|config}/{unit}/{rel_path}
std::string auxiliary_target_path(const std::string& base_path,
                                  const std::string& app_name,
                                  AuxiliaryCategory category,
                                  const std::string& unit,
                                  const std::string& rel_path);

// ============================================================================
// File Deployer
// ============================================================================

struct DeployOutcome {
    std::vector<std::string> written;
    std::vector<std::string> removed;
    DeploymentRecord record;
};

/**
 * Apply a ledger diff to the host.
 *
 * Writes every changed file atomically (temp file, fsync, rename, directory
 * fsync), removes stale files, then rewrites the deployment record at
 * `record_path`. The record is only written when every file operation
 * succeeded. IO_ERROR names the file that failed.
 *
 * Directories emptied by a stale removal are pruned up to, but not
 * including, `prune_root` (the per-application auxiliary root).
 */
Result<DeployOutcome> deploy_files(const std::string& app_name,
                                   const std::vector<PlannedFile>& planned,
                                   const LedgerDiff& diff,
                                   const DeploymentRecord& previous,
                                   const std::string& record_path,
                                   const std::string& prune_root = "");

} // namespace qapp
