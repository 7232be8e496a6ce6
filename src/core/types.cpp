#include "qapp/types.hpp"

#include <algorithm>
#include <cctype>

namespace qapp {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<UnitKind> parse_unit_kind(const std::string& suffix) {
    if (suffix == ".container") return UnitKind::Container;
    if (suffix == ".volume") return UnitKind::Volume;
    if (suffix == ".network") return UnitKind::Network;
    if (suffix == ".pod") return UnitKind::Pod;
    if (suffix == ".kube") return UnitKind::Kube;
    return std::nullopt;
}

std::optional<DesiredState> parse_desired_state(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "installed") return DesiredState::Installed;
    if (lower == "started") return DesiredState::Started;
    if (lower == "restarted") return DesiredState::Restarted;
    return std::nullopt;
}

std::string prefixed_name(const std::string& app_name, const std::string& unit_base) {
    return app_name + PREFIX_SEPARATOR + unit_base;
}

std::string service_name(const std::string& app_name, const std::string& unit_base) {
    return prefixed_name(app_name, unit_base) + ".service";
}

} // namespace qapp
