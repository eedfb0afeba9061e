#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace linkagent {

// ── Error kinds ─────────────────────────────────────────────────
// Each kind carries its own fields; the human-readable message is derived.

namespace errors {

struct FileNotFound {
    std::string path;
    std::vector<std::string> suggestions;
};

struct BinaryFile {
    std::string path;
};

struct InvalidArguments {
    std::string tool;
    std::string message;
};

struct ToolExecution {
    std::string tool;
    std::string message;
};

struct ProviderInit {
    std::string provider;
    std::string message;
};

struct Authentication {
    std::string message;
};

struct Session {
    std::optional<std::string> session_id;
    std::string message;
};

struct Config {
    std::string message;
};

struct IO {
    std::string message;
};

struct Serialization {
    std::string message;
};

struct Network {
    std::string message;
};

struct Unknown {
    std::string message;
};

} // namespace errors

enum class ErrorKind {
    FileNotFound,
    BinaryFile,
    InvalidArguments,
    ToolExecution,
    ProviderInit,
    Authentication,
    Session,
    Config,
    IO,
    Serialization,
    Network,
    Unknown
};

class AgentError {
public:
    using Payload = std::variant<errors::FileNotFound, errors::BinaryFile,
                                 errors::InvalidArguments, errors::ToolExecution,
                                 errors::ProviderInit, errors::Authentication,
                                 errors::Session, errors::Config, errors::IO,
                                 errors::Serialization, errors::Network,
                                 errors::Unknown>;

    AgentError(Payload payload) : payload_(std::move(payload)) {} // NOLINT(google-explicit-constructor)

    static AgentError file_not_found(const std::string& path,
                                     std::vector<std::string> suggestions = {});
    static AgentError binary_file(const std::string& path);
    static AgentError invalid_arguments(const std::string& tool, const std::string& message);
    static AgentError tool_execution(const std::string& tool, const std::string& message);
    static AgentError provider_init(const std::string& provider, const std::string& message);
    static AgentError authentication(const std::string& message);
    static AgentError session(std::optional<std::string> session_id, const std::string& message);
    static AgentError config(const std::string& message);
    static AgentError io(const std::string& message);
    static AgentError io(const std::error_code& ec, const std::string& path);
    static AgentError serialization(const std::string& message);
    static AgentError network(const std::string& message);
    static AgentError unknown(const std::string& message);

    ErrorKind kind() const { return static_cast<ErrorKind>(payload_.index()); }

    // Stable wire name ("FileNotFound", "IOError", ...)
    const char* name() const;

    // Human-readable message
    std::string what() const;

    // {"name": ..., "data": {...fields, "message": ...}}
    nlohmann::json to_json() const;

    template <typename K>
    const K* as() const { return std::get_if<K>(&payload_); }

    const Payload& payload() const { return payload_; }

private:
    Payload payload_;
};

const char* error_kind_name(ErrorKind kind);

// ── Result propagation ──────────────────────────────────────────
// Expected failures travel as values: either T or an AgentError.

template <typename T>
using Result = std::variant<T, AgentError>;

template <typename T>
bool is_error(const Result<T>& result) {
    return std::holds_alternative<AgentError>(result);
}

template <typename T>
const AgentError& get_error(const Result<T>& result) {
    return std::get<AgentError>(result);
}

template <typename T>
const T& get_value(const Result<T>& result) {
    return std::get<T>(result);
}

template <typename T>
T& get_value(Result<T>& result) {
    return std::get<T>(result);
}

} // namespace linkagent
