/**
 * qapp CLI - secret command
 *
 * Print the value of "{namespace}-{name}" from Podman's file secret driver.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace qapp::cli::commands {

namespace {

struct SecretOptions {
    std::string ns;
    std::string name;
    std::string dir = DEFAULT_SECRETS_DIR;
};

int cmd_secret(const GlobalOptions& opts, const SecretOptions& secret_opts) {
    auto store = SecretStore::open(secret_opts.dir);
    if (store.isErr()) {
        return report_error(store.error(), opts.json);
    }

    auto value = store.value().get(secret_opts.ns, secret_opts.name);
    if (value.isErr()) {
        return report_error(value.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["name"] = secret_full_name(secret_opts.ns, secret_opts.name);
        j["value"] = value.value();
        output_json(j);
    } else {
        // Raw value, no trailing newline
        std::cout << value.value() << std::flush;
    }

    return 0;
}

} // anonymous namespace

void setup_secret(CLI::App* app, GlobalOptions& opts) {
    static SecretOptions secret_opts;

    app->add_option("namespace", secret_opts.ns, "Secret namespace")->required();
    app->add_option("name", secret_opts.name, "Secret name within the namespace")->required();
    app->add_option("--secrets-dir", secret_opts.dir, "File driver secret directory")
        ->capture_default_str();

    app->callback([&opts]() {
        std::exit(cmd_secret(opts, secret_opts));
    });
}

} // namespace qapp::cli::commands
