#pragma once

#include "qapp/types.hpp"
#include "qapp/unit_file.hpp"

#include <set>
#include <string>

namespace qapp {

// ============================================================================
// Unit Preprocessing
// ============================================================================

struct PreprocessContext {
    std::string app_name;
    std::string base_path;              // host root for auxiliary files (/srv)
    std::set<std::string> unit_names;   // base names of every unit of the app
};

// Volume= value split as host-source ":" remainder.
// `rest` keeps its leading ':' (or is empty) so source + rest == value.
struct MountRule {
    std::string source;
    std::string rest;
};

MountRule parse_mount_rule(const std::string& value);

// Directives whose values reference other resources of the application
bool is_resource_directive(const std::string& key);

// Directives whose value is a "resource[:options]" string
bool is_mount_style_directive(const std::string& key);

// Prefix a single resource token with "{app}--" when it references a unit
// of the application. Absolute paths and already prefixed tokens are
// returned unchanged.
std::string prefix_token(const std::string& token, const PreprocessContext& ctx);

// Rewrite an init.d / config.d host source to its deployment path.
// Returns the source unchanged when it is neither.
std::string substitute_mount_source(const std::string& source,
                                    const PreprocessContext& ctx,
                                    const std::string& unit_base);

// Pass 1: Volume=init.d[/sub]:... -> Volume={base}/{app}/init/{unit}[/sub]:...
void apply_path_substitution(UnitFile& unit, const PreprocessContext& ctx,
                             const std::string& unit_base);

// Pass 2: prefix references in the resource directive set
void apply_resource_prefixing(UnitFile& unit, const PreprocessContext& ctx);

// Pass 3: add ContainerName= / PodName= / VolumeName= / NetworkName= when absent
void apply_name_injection(UnitFile& unit, UnitKind kind, const PreprocessContext& ctx,
                          const std::string& unit_base);

// Parse, run the three passes in order and serialize.
// PREPROCESS_ERROR on malformed unit syntax.
Result<std::string> preprocess_unit(const std::string& text,
                                    UnitKind kind,
                                    const std::string& unit_base,
                                    const PreprocessContext& ctx,
                                    const std::string& source_name);

} // namespace qapp
