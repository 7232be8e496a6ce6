#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace qapp {

// ============================================================================
// Naming Contract
// ============================================================================

// Separator between the application name and a unit base name.
// "{app}--{unit}" is the only naming guarantee operators rely on.
constexpr const char* PREFIX_SEPARATOR = "--";

// Synthetic template variable holding the resolved application name
constexpr const char* APP_NAME_VARIABLE = "quadlet_app_name";

// Template variable scope
using VariableMap = std::unordered_map<std::string, std::string>;

// ============================================================================
// Error Handling
// ============================================================================

enum class ErrorCode {
    // Pipeline errors, each distinguishable by the caller
    LAYOUT_ERROR,
    TEMPLATE_ERROR,
    PREPROCESS_ERROR,
    DEPENDENCY_ERROR,
    SERVICE_ERROR,

    // System / IO
    IO_ERROR,
    CONFIG_ERROR,
    SECRET_NOT_FOUND,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::LAYOUT_ERROR: return "LayoutError";
        case ErrorCode::TEMPLATE_ERROR: return "TemplateError";
        case ErrorCode::PREPROCESS_ERROR: return "PreprocessError";
        case ErrorCode::DEPENDENCY_ERROR: return "DependencyError";
        case ErrorCode::SERVICE_ERROR: return "ServiceError";
        case ErrorCode::IO_ERROR: return "IOError";
        case ErrorCode::CONFIG_ERROR: return "ConfigError";
        case ErrorCode::SECRET_NOT_FOUND: return "SecretNotFound";
    }
    return "Error";
}

// Process exit status reported by the CLI for each error kind
inline int error_code_exit_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::LAYOUT_ERROR: return 2;
        case ErrorCode::TEMPLATE_ERROR: return 3;
        case ErrorCode::PREPROCESS_ERROR: return 4;
        case ErrorCode::DEPENDENCY_ERROR: return 5;
        case ErrorCode::SERVICE_ERROR: return 6;
        default: return 1;
    }
}

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief Result type for fallible operations
 *
 * Every pipeline stage returns a Result. Check isOk() before value(),
 * or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

// ============================================================================
// Unit Kinds
// ============================================================================

enum class UnitKind {
    Container,
    Volume,
    Network,
    Pod,
    Kube,  // composite pod described by a Kubernetes YAML
};

inline const char* unit_kind_suffix(UnitKind kind) {
    switch (kind) {
        case UnitKind::Container: return ".container";
        case UnitKind::Volume: return ".volume";
        case UnitKind::Network: return ".network";
        case UnitKind::Pod: return ".pod";
        case UnitKind::Kube: return ".kube";
    }
    return "";
}

// Parse a filename suffix (including the dot) to a unit kind
std::optional<UnitKind> parse_unit_kind(const std::string& suffix);

// ============================================================================
// Desired State (requested by the caller)
// ============================================================================

enum class DesiredState {
    Installed,
    Started,
    Restarted,
};

inline const char* desired_state_to_string(DesiredState s) {
    switch (s) {
        case DesiredState::Installed: return "installed";
        case DesiredState::Started: return "started";
        case DesiredState::Restarted: return "restarted";
    }
    return "installed";
}

std::optional<DesiredState> parse_desired_state(const std::string& s);

// ============================================================================
// Service Run State (as reported by the supervisor)
// ============================================================================

enum class RunState {
    Active,
    Inactive,
    Unknown,
};

inline const char* run_state_to_string(RunState s) {
    switch (s) {
        case RunState::Active: return "active";
        case RunState::Inactive: return "inactive";
        case RunState::Unknown: return "unknown";
    }
    return "unknown";
}

// ============================================================================
// Naming helpers
// ============================================================================

// "{app}--{unit}"
std::string prefixed_name(const std::string& app_name, const std::string& unit_base);

// "{app}--{unit}.service"
std::string service_name(const std::string& app_name, const std::string& unit_base);

} // namespace qapp
