#pragma once

#include "qapp/types.hpp"

#include <map>
#include <string>

namespace qapp {

// ============================================================================
// Container Runtime Secret Store (file driver)
// ============================================================================

constexpr const char* DEFAULT_SECRETS_DIR = "/var/lib/containers/storage/secrets";

// "{namespace}-{name}"
std::string secret_full_name(const std::string& ns, const std::string& name);

// Decode standard base64 (whitespace ignored). nullopt on malformed input.
std::optional<std::string> decode_base64(const std::string& encoded);

/**
 * Read-only view of Podman's file secret driver.
 *
 *   <dir>/secrets.json                  {"nameToID": {"<name>": "<id>"}, ...}
 *   <dir>/filedriver/secretsdata.json   {"<id>": "<base64 payload>"}
 */
class SecretStore {
public:
    // IO_ERROR when either document is missing, CONFIG_ERROR when malformed
    static Result<SecretStore> open(const std::string& dir);

    bool contains(const std::string& ns, const std::string& name) const;

    // Decoded value of secret "{ns}-{name}", SECRET_NOT_FOUND when unknown
    Result<std::string> get(const std::string& ns, const std::string& name) const;

private:
    std::map<std::string, std::string> name_to_id_;
    std::map<std::string, std::string> payloads_;
};

} // namespace qapp
