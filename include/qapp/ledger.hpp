#pragma once

#include "qapp/platform.hpp"
#include "qapp/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Digests (SHA-256 via OpenSSL EVP)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string hex_digest;
    std::string error;
};

HashResult compute_sha256(const std::string& data);

// Digest of a deployed file: content followed by its octal mode
HashResult compute_file_digest(const std::string& content, unsigned int mode);

// ============================================================================
// Planned Files
// ============================================================================

enum class FileCategory {
    Unit,
    Init,
    Config,
};

inline const char* file_category_to_string(FileCategory c) {
    switch (c) {
        case FileCategory::Unit: return "unit";
        case FileCategory::Init: return "init";
        case FileCategory::Config: return "config";
    }
    return "unit";
}

// One file the deployment will produce on the host
struct PlannedFile {
    std::string path;       // absolute target path
    std::string content;    // final rendered (and preprocessed) content
    unsigned int mode = DEFAULT_FILE_MODE;
    FileCategory category = FileCategory::Unit;
    std::string unit;       // owning unit base name
};

// ============================================================================
// Deployment Record ({state_dir}/records/{app}.json)
// ============================================================================

constexpr const char* DEPLOYMENT_RECORD_SCHEMA = "qapp.deployment.record.v1";

struct RecordEntry {
    std::string digest;
    unsigned int mode = DEFAULT_FILE_MODE;
    std::string modified_at;
};

struct DeploymentRecord {
    std::string schema = DEPLOYMENT_RECORD_SCHEMA;
    std::string app_name;
    std::string deployed_at;
    std::map<std::string, RecordEntry> files;  // deployed path -> entry
};

struct RecordParseResult {
    bool ok = false;
    std::string error;
    DeploymentRecord record;
};

RecordParseResult parse_deployment_record(const std::string& json_str);
std::string serialize_deployment_record(const DeploymentRecord& record);

std::string deployment_record_path(const std::string& state_dir, const std::string& app_name);

// A missing record is an empty record. A record that cannot be parsed is
// logged and treated as empty, which makes the next deploy rewrite every file.
DeploymentRecord load_deployment_record(const std::string& path, const std::string& app_name);

// Atomically replace the record. IO_ERROR on failure.
Result<void> save_deployment_record(const std::string& path, const DeploymentRecord& record);

// ============================================================================
// Ledger Diff
// ============================================================================

struct LedgerDiff {
    std::vector<std::string> changed;           // paths to (re)write, in plan order
    std::vector<std::string> stale;             // recorded paths no longer planned
    std::map<std::string, std::string> digests; // planned path -> digest
    bool any_changed = false;
};

/**
 * Compare planned files against the previous record.
 *
 * A file is changed when it is absent from the record, its digest differs,
 * or the deployed copy is missing or no longer matches the planned content.
 * With force every planned file is changed. The record is not modified.
 */
Result<LedgerDiff> diff_files(const std::vector<PlannedFile>& planned,
                              const DeploymentRecord& previous,
                              bool force);

// Record describing `planned` after a successful deploy. Unchanged entries
// keep their previous modification time.
DeploymentRecord build_deployment_record(const std::string& app_name,
                                         const std::vector<PlannedFile>& planned,
                                         const LedgerDiff& diff,
                                         const DeploymentRecord& previous);

} // namespace qapp
