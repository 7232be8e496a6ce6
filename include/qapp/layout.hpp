#pragma once

#include "qapp/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Application Source Layout
// ============================================================================
//
//   <src>/quadlets/main.container        (required)
//   <src>/quadlets/<unit>.{container,volume,network,pod,kube}
//   <src>/init.d/<unit>/...              (optional, one-time init payloads)
//   <src>/config.d/<unit>/...            (optional, runtime configuration)

constexpr const char* QUADLETS_DIR = "quadlets";
constexpr const char* MAIN_UNIT = "main";

enum class AuxiliaryCategory {
    Init,
    Config,
};

// Source directory name ("init.d" / "config.d")
inline const char* auxiliary_source_dir(AuxiliaryCategory c) {
    return c == AuxiliaryCategory::Init ? "init.d" : "config.d";
}

// Deployment directory component ("init" / "config")
inline const char* auxiliary_target_dir(AuxiliaryCategory c) {
    return c == AuxiliaryCategory::Init ? "init" : "config";
}

struct UnitSource {
    UnitKind kind = UnitKind::Container;
    std::string base_name;  // "db"
    std::string filename;   // "db.container"
    std::string path;       // absolute or source-relative path of the file
};

struct AuxiliarySource {
    AuxiliaryCategory category = AuxiliaryCategory::Init;
    std::string unit;       // owning unit base name
    std::string rel_path;   // path relative to <category>.d/<unit>/
    std::string path;       // path of the source file
};

/**
 * Validated application directory.
 *
 * Units are ordered by filename; auxiliary files by category (init before
 * config), then unit, then relative path.
 */
struct AppLayout {
    std::string name;
    std::string source_dir;
    std::vector<UnitSource> units;
    std::vector<AuxiliarySource> auxiliary;

    const UnitSource* find_unit(const std::string& base_name) const;
    std::set<std::string> unit_base_names() const;
};

// Lowercase the given name
std::string normalize_app_name(const std::string& name);

// ^[a-z]$ or ^[a-z][a-z0-9_-]*[a-z0-9]$
bool is_valid_app_name(const std::string& name);

// Explicit name if given, otherwise the source directory base name.
// The result is normalized and validated.
Result<std::string> resolve_app_name(const std::string& source_dir,
                                     const std::string& name_override);

// Check the directory structure and discover every unit and auxiliary file.
// Failures are LAYOUT_ERROR; nothing on the host is touched.
Result<AppLayout> validate_layout(const std::string& source_dir,
                                  const std::string& name_override);

} // namespace qapp
