#pragma once

#include "qapp/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace qapp {

// ============================================================================
// Supervisor Interface
// ============================================================================

/**
 * Narrow interface to the host process supervisor.
 *
 * Every call is bounded by the implementation's timeout. Failures and
 * timeouts are SERVICE_ERROR and are never retried.
 */
class Supervisor {
public:
    virtual ~Supervisor() = default;

    // Re-run unit generators and reload unit definitions
    virtual Result<void> reload() = 0;

    virtual Result<void> start(const std::string& service) = 0;
    virtual Result<void> restart(const std::string& service) = 0;

    virtual Result<RunState> state(const std::string& service) = 0;

    // Declared requirement / ordering targets of `service`
    // (Requires, Requisite, Wants, BindsTo, Upholds, After), in declaration order
    virtual Result<std::vector<std::string>> dependencies(const std::string& service) = 0;

    // Dry-run the unit generator over the deployed unit files
    virtual Result<void> validateUnits() = 0;
};

// ============================================================================
// systemd Implementation
// ============================================================================

struct SystemctlOptions {
    std::string systemctl = "systemctl";
    std::string generator = "/usr/lib/systemd/system-generators/podman-system-generator";
    std::chrono::seconds timeout{120};
    bool user_mode = false;
};

class SystemctlSupervisor : public Supervisor {
public:
    explicit SystemctlSupervisor(SystemctlOptions options);

    Result<void> reload() override;
    Result<void> start(const std::string& service) override;
    Result<void> restart(const std::string& service) override;
    Result<RunState> state(const std::string& service) override;
    Result<std::vector<std::string>> dependencies(const std::string& service) override;
    Result<void> validateUnits() override;

private:
    std::vector<std::string> command(const std::vector<std::string>& args) const;
    Result<std::string> run(const std::vector<std::string>& args, bool check_exit);

    SystemctlOptions options_;
};

// Map `systemctl is-active` output to a run state
RunState parse_active_state(const std::string& output);

// Parse `systemctl show -p ...` output ("Key=a b c" per line) into the list of
// referenced units, first occurrence order, duplicates removed
std::vector<std::string> parse_show_dependencies(const std::string& output);

} // namespace qapp
