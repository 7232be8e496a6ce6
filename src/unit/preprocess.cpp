#include "qapp/preprocess.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>

namespace qapp {

namespace {

constexpr std::array<const char*, 12> RESOURCE_DIRECTIVES = {
    "Network", "Pod", "Volume",
    "Wants", "Requires", "Requisite", "BindsTo", "PartOf", "Upholds",
    "Conflicts", "Before", "After",
};

constexpr std::array<const char*, 6> RESOURCE_SUFFIXES = {
    ".network", ".volume", ".pod", ".kube", ".container", ".service",
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Apply prefix_token to each whitespace separated token, keeping separators
std::string prefix_token_list(const std::string& value, const PreprocessContext& ctx) {
    std::string out;
    size_t i = 0;
    while (i < value.size()) {
        if (std::isspace(static_cast<unsigned char>(value[i]))) {
            out += value[i++];
            continue;
        }
        size_t end = i;
        while (end < value.size() && !std::isspace(static_cast<unsigned char>(value[end]))) ++end;
        out += prefix_token(value.substr(i, end - i), ctx);
        i = end;
    }
    return out;
}

// "init.d", "init.d/sub" -> "sub" (nullopt when `source` is not under `dir`)
std::optional<std::string> aux_subpath(const std::string& source, const std::string& dir) {
    if (source == dir) return std::string();
    if (!starts_with(source, dir + "/")) return std::nullopt;

    std::string sub = source.substr(dir.size());
    size_t start = sub.find_first_not_of('/');
    if (start == std::string::npos) return std::string();
    return sub.substr(start);
}

} // namespace

MountRule parse_mount_rule(const std::string& value) {
    MountRule rule;
    auto colon = value.find(':');
    if (colon == std::string::npos) {
        rule.source = value;
    } else {
        rule.source = value.substr(0, colon);
        rule.rest = value.substr(colon);
    }
    return rule;
}

bool is_resource_directive(const std::string& key) {
    for (const char* d : RESOURCE_DIRECTIVES) {
        if (key == d) return true;
    }
    return false;
}

bool is_mount_style_directive(const std::string& key) {
    return key == "Network" || key == "Pod" || key == "Volume";
}

std::string prefix_token(const std::string& token, const PreprocessContext& ctx) {
    if (token.empty() || token[0] == '/') return token;

    std::string prefix = ctx.app_name + PREFIX_SEPARATOR;
    if (starts_with(token, prefix)) return token;

    for (const char* suffix : RESOURCE_SUFFIXES) {
        if (ends_with(token, suffix)) return prefix + token;
    }

    if (ctx.unit_names.count(token)) return prefix + token;

    return token;
}

std::string substitute_mount_source(const std::string& source,
                                    const PreprocessContext& ctx,
                                    const std::string& unit_base) {
    struct Mapping {
        const char* source_dir;
        const char* target_dir;
    };
    static const Mapping mappings[] = {
        {"init.d", "init"},
        {"config.d", "config"},
    };

    for (const auto& m : mappings) {
        auto sub = aux_subpath(source, m.source_dir);
        if (!sub) continue;

        std::string target = ctx.base_path;
        if (target.empty() || target.back() != '/') target += "/";
        target += ctx.app_name + "/" + m.target_dir + "/" + unit_base;
        if (!sub->empty()) target += "/" + *sub;
        return target;
    }
    return source;
}

void apply_path_substitution(UnitFile& unit, const PreprocessContext& ctx,
                             const std::string& unit_base) {
    auto& lines = unit.lines();
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.kind != UnitLineKind::Entry || line.key != "Volume") continue;

        MountRule rule = parse_mount_rule(line.value);
        std::string source = substitute_mount_source(rule.source, ctx, unit_base);
        if (source != rule.source) {
            spdlog::debug("{}: Volume source {} -> {}", unit_base, rule.source, source);
            unit.setValue(i, source + rule.rest);
        }
    }
}

void apply_resource_prefixing(UnitFile& unit, const PreprocessContext& ctx) {
    auto& lines = unit.lines();
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.kind != UnitLineKind::Entry || !is_resource_directive(line.key)) continue;

        std::string value;
        if (is_mount_style_directive(line.key)) {
            MountRule rule = parse_mount_rule(line.value);
            value = prefix_token(rule.source, ctx) + rule.rest;
        } else {
            value = prefix_token_list(line.value, ctx);
        }
        unit.setValue(i, value);
    }
}

void apply_name_injection(UnitFile& unit, UnitKind kind, const PreprocessContext& ctx,
                          const std::string& unit_base) {
    const char* section = nullptr;
    const char* key = nullptr;
    switch (kind) {
        case UnitKind::Container: section = "Container"; key = "ContainerName"; break;
        case UnitKind::Pod: section = "Pod"; key = "PodName"; break;
        case UnitKind::Volume: section = "Volume"; key = "VolumeName"; break;
        case UnitKind::Network: section = "Network"; key = "NetworkName"; break;
        case UnitKind::Kube: return;
    }

    if (unit.hasKey(section, key)) return;
    unit.insertAfterHeader(section, key, prefixed_name(ctx.app_name, unit_base));
}

Result<std::string> preprocess_unit(const std::string& text,
                                    UnitKind kind,
                                    const std::string& unit_base,
                                    const PreprocessContext& ctx,
                                    const std::string& source_name) {
    auto parsed = UnitFile::parse(text, source_name);
    if (parsed.isErr()) {
        return Result<std::string>::err(parsed.error());
    }

    UnitFile& unit = parsed.value();
    apply_path_substitution(unit, ctx, unit_base);
    apply_resource_prefixing(unit, ctx);
    apply_name_injection(unit, kind, ctx, unit_base);

    return Result<std::string>::ok(unit.serialize());
}

} // namespace qapp
