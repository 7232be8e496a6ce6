#include "qapp/supervisor.hpp"
#include "qapp/platform.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <set>
#include <sstream>

namespace qapp {

namespace {

constexpr const char* DEPENDENCY_PROPERTIES[] = {
    "Requires", "Requisite", "Wants", "BindsTo", "Upholds", "After",
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

Error service_error(const std::string& msg) {
    return Error(ErrorCode::SERVICE_ERROR, msg);
}

} // namespace

RunState parse_active_state(const std::string& output) {
    std::string s = trim(output);
    if (s == "active" || s == "reloading") return RunState::Active;
    if (s == "inactive" || s == "failed" || s == "deactivating") return RunState::Inactive;
    return RunState::Unknown;
}

std::vector<std::string> parse_show_dependencies(const std::string& output) {
    std::vector<std::string> units;
    std::set<std::string> seen;

    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::istringstream values(line.substr(eq + 1));
        std::string unit;
        while (values >> unit) {
            if (seen.insert(unit).second) {
                units.push_back(unit);
            }
        }
    }
    return units;
}

SystemctlSupervisor::SystemctlSupervisor(SystemctlOptions options)
    : options_(std::move(options)) {}

std::vector<std::string> SystemctlSupervisor::command(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{options_.systemctl};
    if (options_.user_mode) argv.push_back("--user");
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

Result<std::string> SystemctlSupervisor::run(const std::vector<std::string>& args, bool check_exit) {
    auto argv = command(args);
    std::string cmdline = join_args(argv);
    spdlog::debug("exec: {}", cmdline);

    auto result = run_process(argv, options_.timeout);
    if (result.timed_out) {
        return Result<std::string>::err(service_error(
            cmdline + " timed out after " + std::to_string(options_.timeout.count()) + "s"));
    }
    if (!result.ok) {
        return Result<std::string>::err(service_error(
            "failed to execute " + cmdline + ": " + result.error));
    }
    if (result.exit_code == 127 && result.output.empty() && result.error_output.empty()) {
        return Result<std::string>::err(service_error("command not found: " + argv[0]));
    }
    if (check_exit && result.exit_code != 0) {
        return Result<std::string>::err(service_error(
            cmdline + " failed (exit " + std::to_string(result.exit_code) + "): " +
            trim(result.error_output)));
    }
    return Result<std::string>::ok(result.output);
}

Result<void> SystemctlSupervisor::reload() {
    auto r = run({"daemon-reload"}, true);
    if (r.isErr()) return Result<void>::err(r.error());
    return Result<void>::ok();
}

Result<void> SystemctlSupervisor::start(const std::string& service) {
    auto r = run({"start", service}, true);
    if (r.isErr()) return Result<void>::err(r.error());
    return Result<void>::ok();
}

Result<void> SystemctlSupervisor::restart(const std::string& service) {
    auto r = run({"restart", service}, true);
    if (r.isErr()) return Result<void>::err(r.error());
    return Result<void>::ok();
}

Result<RunState> SystemctlSupervisor::state(const std::string& service) {
    // is-active exits non-zero for anything but active; the text is what matters
    auto r = run({"is-active", service}, false);
    if (r.isErr()) return Result<RunState>::err(r.error());
    return Result<RunState>::ok(parse_active_state(r.value()));
}

Result<std::vector<std::string>> SystemctlSupervisor::dependencies(const std::string& service) {
    std::vector<std::string> args{"show"};
    for (const char* prop : DEPENDENCY_PROPERTIES) {
        args.push_back("-p");
        args.push_back(prop);
    }
    args.push_back(service);

    auto r = run(args, true);
    if (r.isErr()) return Result<std::vector<std::string>>::err(r.error());
    return Result<std::vector<std::string>>::ok(parse_show_dependencies(r.value()));
}

Result<void> SystemctlSupervisor::validateUnits() {
    std::vector<std::string> argv{options_.generator};
    if (options_.user_mode) argv.push_back("-user");
    argv.push_back("-dryrun");

    std::string cmdline = join_args(argv);
    spdlog::debug("exec: {}", cmdline);

    auto result = run_process(argv, options_.timeout);
    if (result.timed_out) {
        return Result<void>::err(service_error(
            cmdline + " timed out after " + std::to_string(options_.timeout.count()) + "s"));
    }
    if (!result.ok) {
        return Result<void>::err(service_error(
            "failed to execute unit validation: " + result.error));
    }
    if (result.exit_code != 0) {
        return Result<void>::err(service_error(
            "unit validation failed (" + cmdline + "): " + trim(result.error_output)));
    }
    return Result<void>::ok();
}

} // namespace qapp
