#include "qapp/layout.hpp"
#include "qapp/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace qapp {

namespace fs = std::filesystem;

namespace {

Error layout_error(const std::string& msg) {
    return Error(ErrorCode::LAYOUT_ERROR, msg);
}

// ".container" for "db.container", "" when there is no dot
std::string file_suffix(const std::string& filename) {
    auto pos = filename.rfind('.');
    if (pos == std::string::npos || pos == 0) return "";
    return filename.substr(pos);
}

std::string file_stem(const std::string& filename) {
    auto pos = filename.rfind('.');
    if (pos == std::string::npos || pos == 0) return filename;
    return filename.substr(0, pos);
}

bool is_auxiliary_owner_kind(UnitKind kind) {
    return kind == UnitKind::Container || kind == UnitKind::Pod;
}

Result<std::vector<UnitSource>> discover_units(const std::string& quadlets_dir) {
    std::vector<UnitSource> units;

    for (const auto& name : list_directory(quadlets_dir)) {
        auto kind = parse_unit_kind(file_suffix(name));
        if (!kind) {
            spdlog::debug("ignoring non-unit file quadlets/{}", name);
            continue;
        }

        std::string path = join_path(quadlets_dir, name);
        if (!is_regular_file(path)) {
            continue;
        }

        UnitSource unit;
        unit.kind = *kind;
        unit.base_name = file_stem(name);
        unit.filename = name;
        unit.path = path;
        units.push_back(unit);
    }

    return Result<std::vector<UnitSource>>::ok(units);
}

Result<void> check_main_unit(const std::vector<UnitSource>& units,
                             const std::string& quadlets_dir) {
    std::vector<const UnitSource*> mains;
    for (const auto& unit : units) {
        if (unit.base_name == MAIN_UNIT) mains.push_back(&unit);
    }

    if (mains.empty() || (mains.size() == 1 && mains[0]->kind != UnitKind::Container)) {
        return Result<void>::err(layout_error(
            "required file not found: " + join_path(quadlets_dir, "main.container") +
            " (the main container unit is mandatory)"));
    }

    if (mains.size() > 1) {
        std::string list;
        for (const auto* unit : mains) {
            if (!list.empty()) list += ", ";
            list += unit->filename;
        }
        return Result<void>::err(layout_error(
            "multiple units named main in " + quadlets_dir + " (" + list +
            "): only main.container is allowed"));
    }

    return Result<void>::ok();
}

// Resolve the unit owning <category>.d/<dir_name>
Result<std::string> resolve_owner(const std::vector<UnitSource>& units,
                                  AuxiliaryCategory category,
                                  const std::string& dir_name) {
    const char* cat_dir = auxiliary_source_dir(category);

    if (parse_unit_kind(file_suffix(dir_name))) {
        return Result<std::string>::err(layout_error(
            std::string("invalid ") + cat_dir + " subdirectory: " + dir_name +
            " (use the unit name without suffix, e.g. " + file_stem(dir_name) +
            "/ instead of " + dir_name + "/)"));
    }

    std::vector<std::string> owners;
    for (const auto& unit : units) {
        if (unit.base_name == dir_name && is_auxiliary_owner_kind(unit.kind)) {
            owners.push_back(unit.filename);
        }
    }

    if (owners.empty()) {
        return Result<std::string>::err(layout_error(
            std::string("orphan auxiliary directory ") + cat_dir + "/" + dir_name +
            ": expected quadlets/" + dir_name + ".container or quadlets/" +
            dir_name + ".pod"));
    }

    if (owners.size() > 1) {
        std::string list;
        for (const auto& o : owners) {
            if (!list.empty()) list += ", ";
            list += o;
        }
        return Result<std::string>::err(layout_error(
            std::string("ambiguous ") + cat_dir + " subdirectory " + dir_name +
            ": multiple owning units found (" + list + ")"));
    }

    return Result<std::string>::ok(dir_name);
}

Result<void> discover_auxiliary(const std::string& source_dir,
                                AuxiliaryCategory category,
                                const std::vector<UnitSource>& units,
                                std::vector<AuxiliarySource>& out) {
    std::string root = join_path(source_dir, auxiliary_source_dir(category));
    if (!is_directory(root)) {
        return Result<void>::ok();
    }

    for (const auto& entry : list_directory(root)) {
        std::string unit_dir = join_path(root, entry);
        if (!is_directory(unit_dir)) {
            spdlog::debug("ignoring non-directory {}/{}", auxiliary_source_dir(category), entry);
            continue;
        }

        auto owner = resolve_owner(units, category, entry);
        if (owner.isErr()) {
            return Result<void>::err(owner.error());
        }

        std::vector<AuxiliarySource> files;
        std::error_code ec;
        fs::recursive_directory_iterator it(unit_dir, ec);
        if (ec) {
            return Result<void>::err(layout_error(
                "cannot read " + unit_dir + ": " + ec.message()));
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                return Result<void>::err(layout_error(
                    "cannot read " + unit_dir + ": " + ec.message()));
            }
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) continue;

            fs::path rel = it->path().lexically_relative(unit_dir).lexically_normal();
            std::string rel_str = rel.generic_string();
            if (rel.empty() || rel.is_absolute() || rel_str == ".." ||
                rel_str.rfind("../", 0) == 0) {
                return Result<void>::err(layout_error(
                    "auxiliary file escapes its unit directory: " + it->path().string()));
            }

            AuxiliarySource aux;
            aux.category = category;
            aux.unit = owner.value();
            aux.rel_path = rel_str;
            aux.path = it->path().string();
            files.push_back(aux);
        }

        std::sort(files.begin(), files.end(),
                  [](const AuxiliarySource& a, const AuxiliarySource& b) {
                      return a.rel_path < b.rel_path;
                  });
        out.insert(out.end(), files.begin(), files.end());
    }

    return Result<void>::ok();
}

} // namespace

const UnitSource* AppLayout::find_unit(const std::string& base_name) const {
    for (const auto& unit : units) {
        if (unit.base_name == base_name) return &unit;
    }
    return nullptr;
}

std::set<std::string> AppLayout::unit_base_names() const {
    std::set<std::string> names;
    for (const auto& unit : units) {
        names.insert(unit.base_name);
    }
    return names;
}

std::string normalize_app_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_valid_app_name(const std::string& name) {
    if (name.empty()) return false;

    auto is_lower = [](char c) { return c >= 'a' && c <= 'z'; };
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };

    if (!is_lower(name.front())) return false;
    if (name.size() == 1) return true;

    char last = name.back();
    if (!is_lower(last) && !is_digit(last)) return false;

    for (char c : name) {
        if (!is_lower(c) && !is_digit(c) && c != '_' && c != '-') return false;
    }
    return true;
}

Result<std::string> resolve_app_name(const std::string& source_dir,
                                     const std::string& name_override) {
    std::string name = name_override;
    if (name.empty()) {
        fs::path p = fs::path(source_dir).lexically_normal();
        if (!p.has_filename()) {
            p = p.parent_path();
        }
        name = p.filename().string();
    }

    name = normalize_app_name(name);
    if (!is_valid_app_name(name)) {
        return Result<std::string>::err(layout_error(
            "invalid application name: '" + name + "' (must start with a letter, "
            "end with a letter or digit, and contain only a-z, 0-9, '-' and '_')"));
    }
    return Result<std::string>::ok(name);
}

Result<AppLayout> validate_layout(const std::string& source_dir,
                                  const std::string& name_override) {
    if (!path_exists(source_dir)) {
        return Result<AppLayout>::err(layout_error("source directory not found: " + source_dir));
    }
    if (!is_directory(source_dir)) {
        return Result<AppLayout>::err(layout_error("source path is not a directory: " + source_dir));
    }

    std::string quadlets_dir = join_path(source_dir, QUADLETS_DIR);
    if (!is_directory(quadlets_dir)) {
        return Result<AppLayout>::err(layout_error(
            "required directory not found: " + quadlets_dir));
    }

    auto name = resolve_app_name(source_dir, name_override);
    if (name.isErr()) {
        return Result<AppLayout>::err(name.error());
    }

    AppLayout layout;
    layout.name = name.value();
    layout.source_dir = source_dir;

    auto units = discover_units(quadlets_dir);
    if (units.isErr()) {
        return Result<AppLayout>::err(units.error());
    }
    layout.units = units.value();

    auto main_check = check_main_unit(layout.units, quadlets_dir);
    if (main_check.isErr()) {
        return Result<AppLayout>::err(main_check.error());
    }

    for (auto category : {AuxiliaryCategory::Init, AuxiliaryCategory::Config}) {
        auto aux = discover_auxiliary(source_dir, category, layout.units, layout.auxiliary);
        if (aux.isErr()) {
            return Result<AppLayout>::err(aux.error());
        }
    }

    spdlog::debug("layout of '{}': {} unit(s), {} auxiliary file(s)",
                  layout.name, layout.units.size(), layout.auxiliary.size());
    return Result<AppLayout>::ok(layout);
}

} // namespace qapp
