#pragma once

#include <qapp/platform.hpp>
#include <qapp/supervisor.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace qapp::test {

class TempTestDir {
public:
    TempTestDir() {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "qapp_test_XXXXXX").lexically_normal().string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed for " + pattern);
        }
        path = buf.data();
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    TempTestDir(const TempTestDir&) = delete;
    TempTestDir& operator=(const TempTestDir&) = delete;

    std::string file(const std::string& rel) const { return path + "/" + rel; }

    // Write a file below the directory, creating parents
    void write(const std::string& rel, const std::string& content) const {
        std::filesystem::path p(file(rel));
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
    }

    void mkdir(const std::string& rel) const {
        std::filesystem::create_directories(file(rel));
    }

    std::string path;
};

/**
 * Supervisor double that records every call and answers from canned state.
 */
class RecordingSupervisor : public Supervisor {
public:
    std::vector<std::string> calls;

    std::map<std::string, RunState> states;
    std::map<std::string, std::vector<std::string>> deps;
    std::set<std::string> failing;   // services whose start/restart fails
    bool validation_fails = false;
    bool reload_fails = false;

    Result<void> reload() override {
        calls.push_back("daemon-reload");
        if (reload_fails) {
            return Result<void>::err(Error(ErrorCode::SERVICE_ERROR, "systemctl daemon-reload timed out"));
        }
        return Result<void>::ok();
    }

    Result<void> start(const std::string& service) override {
        calls.push_back("start " + service);
        if (failing.count(service)) {
            return Result<void>::err(Error(ErrorCode::SERVICE_ERROR, "start failed: " + service));
        }
        states[service] = RunState::Active;
        return Result<void>::ok();
    }

    Result<void> restart(const std::string& service) override {
        calls.push_back("restart " + service);
        if (failing.count(service)) {
            return Result<void>::err(Error(ErrorCode::SERVICE_ERROR, "restart failed: " + service));
        }
        states[service] = RunState::Active;
        return Result<void>::ok();
    }

    Result<RunState> state(const std::string& service) override {
        calls.push_back("is-active " + service);
        auto it = states.find(service);
        return Result<RunState>::ok(it == states.end() ? RunState::Inactive : it->second);
    }

    Result<std::vector<std::string>> dependencies(const std::string& service) override {
        calls.push_back("show " + service);
        auto it = deps.find(service);
        if (it == deps.end()) {
            return Result<std::vector<std::string>>::ok({});
        }
        return Result<std::vector<std::string>>::ok(it->second);
    }

    Result<void> validateUnits() override {
        calls.push_back("validate");
        if (validation_fails) {
            return Result<void>::err(Error(ErrorCode::SERVICE_ERROR, "unit validation failed"));
        }
        return Result<void>::ok();
    }

    // Calls that change service state, in order
    std::vector<std::string> transitions() const {
        std::vector<std::string> out;
        for (const auto& c : calls) {
            if (c.rfind("start ", 0) == 0 || c.rfind("restart ", 0) == 0) {
                out.push_back(c);
            }
        }
        return out;
    }
};

} // namespace qapp::test
