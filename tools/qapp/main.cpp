/**
 * qapp CLI - Entry Point
 *
 * Deploys application directories as systemd-managed container units.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace qapp::cli::commands {
    void setup_deploy(CLI::App* app, GlobalOptions& opts);
    void setup_render(CLI::App* app, GlobalOptions& opts);
    void setup_status(CLI::App* app, GlobalOptions& opts);
    void setup_secret(CLI::App* app, GlobalOptions& opts);
}

namespace {

using SetupFn = void (*)(CLI::App*, qapp::cli::GlobalOptions&);

struct CommandEntry {
    const char* name;
    const char* description;
    SetupFn setup;
};

const CommandEntry COMMANDS[] = {
    {"deploy", "Deploy an application directory", qapp::cli::commands::setup_deploy},
    {"render", "Show the files a deploy would write", qapp::cli::commands::setup_render},
    {"status", "Show deployment record and service state", qapp::cli::commands::setup_status},
    {"secret", "Print a secret from the container secret store", qapp::cli::commands::setup_secret},
};

} // namespace

int main(int argc, char** argv) {
    using namespace qapp::cli;

    CLI::App app{"qapp - application deployment for Podman quadlets"};
    app.set_version_flag("-V,--version", QAPP_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (qapp.config.v1)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    app.parse_complete_callback([&opts]() { init_logging(opts); });

    for (const auto& cmd : COMMANDS) {
        auto* sub = app.add_subcommand(cmd.name, cmd.description);
        cmd.setup(sub, opts);
    }

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
