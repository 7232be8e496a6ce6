#include "qapp/secrets.hpp"
#include "qapp/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <vector>

#include <openssl/evp.h>

namespace qapp {

namespace {

Result<nlohmann::json> load_json_object(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<nlohmann::json>::err(Error(ErrorCode::IO_ERROR,
            "cannot read secret store file " + path));
    }
    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object()) {
            return Result<nlohmann::json>::err(Error(ErrorCode::CONFIG_ERROR,
                path + ": JSON must be an object"));
        }
        return Result<nlohmann::json>::ok(j);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json>::err(Error(ErrorCode::CONFIG_ERROR,
            path + ": invalid JSON: " + e.what()));
    }
}

} // namespace

std::string secret_full_name(const std::string& ns, const std::string& name) {
    return ns + "-" + name;
}

std::optional<std::string> decode_base64(const std::string& encoded) {
    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) clean += c;
    }
    if (clean.empty()) return std::string();
    if (clean.size() % 4 != 0) return std::nullopt;

    std::vector<unsigned char> out(clean.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(clean.data()),
                              static_cast<int>(clean.size()));
    if (len < 0) return std::nullopt;

    // EVP_DecodeBlock counts padding bytes as output
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;

    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(len) - padding);
}

Result<SecretStore> SecretStore::open(const std::string& dir) {
    SecretStore store;

    auto index = load_json_object(join_path(dir, "secrets.json"));
    if (index.isErr()) return Result<SecretStore>::err(index.error());

    const auto& j = index.value();
    if (j.contains("nameToID")) {
        if (!j["nameToID"].is_object()) {
            return Result<SecretStore>::err(Error(ErrorCode::CONFIG_ERROR,
                "secrets.json: nameToID must be an object"));
        }
        for (auto it = j["nameToID"].begin(); it != j["nameToID"].end(); ++it) {
            if (it.value().is_string()) {
                store.name_to_id_[it.key()] = it.value().get<std::string>();
            }
        }
    }

    auto data = load_json_object(join_path(join_path(dir, "filedriver"), "secretsdata.json"));
    if (data.isErr()) return Result<SecretStore>::err(data.error());

    for (auto it = data.value().begin(); it != data.value().end(); ++it) {
        if (it.value().is_string()) {
            store.payloads_[it.key()] = it.value().get<std::string>();
        }
    }

    spdlog::debug("secret store {}: {} secret(s)", dir, store.name_to_id_.size());
    return Result<SecretStore>::ok(store);
}

bool SecretStore::contains(const std::string& ns, const std::string& name) const {
    auto id = name_to_id_.find(secret_full_name(ns, name));
    return id != name_to_id_.end() && payloads_.count(id->second) > 0;
}

Result<std::string> SecretStore::get(const std::string& ns, const std::string& name) const {
    std::string full_name = secret_full_name(ns, name);

    auto id = name_to_id_.find(full_name);
    if (id == name_to_id_.end()) {
        return Result<std::string>::err(Error(ErrorCode::SECRET_NOT_FOUND,
            "secret '" + full_name + "' not found"));
    }

    auto payload = payloads_.find(id->second);
    if (payload == payloads_.end()) {
        return Result<std::string>::err(Error(ErrorCode::SECRET_NOT_FOUND,
            "secret '" + full_name + "' has no data in the file driver"));
    }

    auto decoded = decode_base64(payload->second);
    if (!decoded) {
        return Result<std::string>::err(Error(ErrorCode::CONFIG_ERROR,
            "secret '" + full_name + "' payload is not valid base64"));
    }
    return Result<std::string>::ok(*decoded);
}

} // namespace qapp
