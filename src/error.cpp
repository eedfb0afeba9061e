#include "error.hpp"

namespace linkagent {

namespace {

// Overload set for std::visit
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

AgentError AgentError::file_not_found(const std::string& path,
                                      std::vector<std::string> suggestions) {
    return AgentError(errors::FileNotFound{path, std::move(suggestions)});
}

AgentError AgentError::binary_file(const std::string& path) {
    return AgentError(errors::BinaryFile{path});
}

AgentError AgentError::invalid_arguments(const std::string& tool, const std::string& message) {
    return AgentError(errors::InvalidArguments{tool, message});
}

AgentError AgentError::tool_execution(const std::string& tool, const std::string& message) {
    return AgentError(errors::ToolExecution{tool, message});
}

AgentError AgentError::provider_init(const std::string& provider, const std::string& message) {
    return AgentError(errors::ProviderInit{provider, message});
}

AgentError AgentError::authentication(const std::string& message) {
    return AgentError(errors::Authentication{message});
}

AgentError AgentError::session(std::optional<std::string> session_id,
                               const std::string& message) {
    return AgentError(errors::Session{std::move(session_id), message});
}

AgentError AgentError::config(const std::string& message) {
    return AgentError(errors::Config{message});
}

AgentError AgentError::io(const std::string& message) {
    return AgentError(errors::IO{message});
}

AgentError AgentError::io(const std::error_code& ec, const std::string& path) {
    return AgentError(errors::IO{path + ": " + ec.message()});
}

AgentError AgentError::serialization(const std::string& message) {
    return AgentError(errors::Serialization{message});
}

AgentError AgentError::network(const std::string& message) {
    return AgentError(errors::Network{message});
}

AgentError AgentError::unknown(const std::string& message) {
    return AgentError(errors::Unknown{message});
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FileNotFound:     return "FileNotFound";
        case ErrorKind::BinaryFile:       return "BinaryFile";
        case ErrorKind::InvalidArguments: return "InvalidArguments";
        case ErrorKind::ToolExecution:    return "ToolExecution";
        case ErrorKind::ProviderInit:     return "ProviderInitError";
        case ErrorKind::Authentication:   return "AuthenticationError";
        case ErrorKind::Session:          return "SessionError";
        case ErrorKind::Config:           return "ConfigError";
        case ErrorKind::IO:               return "IOError";
        case ErrorKind::Serialization:    return "JSONError";
        case ErrorKind::Network:          return "HTTPError";
        case ErrorKind::Unknown:          return "UnknownError";
    }
    return "UnknownError";
}

const char* AgentError::name() const {
    return error_kind_name(kind());
}

std::string AgentError::what() const {
    return std::visit(overloaded{
        [](const errors::FileNotFound& e) { return "File not found: " + e.path; },
        [](const errors::BinaryFile& e) { return "Cannot read binary file: " + e.path; },
        [](const errors::InvalidArguments& e) {
            return "Invalid arguments for tool '" + e.tool + "': " + e.message;
        },
        [](const errors::ToolExecution& e) { return "Tool execution failed: " + e.message; },
        [](const errors::ProviderInit& e) {
            return "Provider initialization failed: " + e.provider;
        },
        [](const errors::Authentication& e) { return "Authentication error: " + e.message; },
        [](const errors::Session& e) { return "Session error: " + e.message; },
        [](const errors::Config& e) { return "Configuration error: " + e.message; },
        [](const errors::IO& e) { return "IO error: " + e.message; },
        [](const errors::Serialization& e) { return "JSON error: " + e.message; },
        [](const errors::Network& e) { return "HTTP error: " + e.message; },
        [](const errors::Unknown& e) { return "Unknown error: " + e.message; },
    }, payload_);
}

nlohmann::json AgentError::to_json() const {
    nlohmann::json data = std::visit(overloaded{
        [](const errors::FileNotFound& e) {
            std::string msg = "File not found: " + e.path;
            if (!e.suggestions.empty()) {
                msg += "\n\nDid you mean one of these?\n";
                for (size_t i = 0; i < e.suggestions.size(); ++i) {
                    if (i > 0) msg += '\n';
                    msg += e.suggestions[i];
                }
            }
            return nlohmann::json{{"path", e.path},
                                  {"suggestions", e.suggestions},
                                  {"message", msg}};
        },
        [](const errors::BinaryFile& e) {
            return nlohmann::json{{"path", e.path},
                                  {"message", "Cannot read binary file: " + e.path}};
        },
        [](const errors::InvalidArguments& e) {
            return nlohmann::json{{"tool", e.tool}, {"message", e.message}};
        },
        [](const errors::ToolExecution& e) {
            return nlohmann::json{{"tool", e.tool}, {"message", e.message}};
        },
        [](const errors::ProviderInit& e) {
            return nlohmann::json{{"provider", e.provider}, {"message", e.message}};
        },
        [](const errors::Authentication& e) {
            return nlohmann::json{{"message", e.message}};
        },
        [](const errors::Session& e) {
            nlohmann::json d = {{"message", e.message}};
            d["sessionID"] = e.session_id ? nlohmann::json(*e.session_id) : nlohmann::json();
            return d;
        },
        [](const errors::Config& e) { return nlohmann::json{{"message", e.message}}; },
        [](const errors::IO& e) { return nlohmann::json{{"message", e.message}}; },
        [](const errors::Serialization& e) { return nlohmann::json{{"message", e.message}}; },
        [](const errors::Network& e) { return nlohmann::json{{"message", e.message}}; },
        [](const errors::Unknown& e) { return nlohmann::json{{"message", e.message}}; },
    }, payload_);

    return {{"name", name()}, {"data", std::move(data)}};
}

} // namespace linkagent
