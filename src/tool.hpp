#pragma once
#include "error.hpp"
#include "tool_context.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace linkagent {

struct ToolSpec {
    std::string id;
    std::string description;
    nlohmann::json parameters; // JSON schema for parameters
};

// Binary payload attached to a result (images read as data URLs)
struct FileAttachment {
    std::string id;
    std::string session_id;
    std::string message_id;
    std::string type = "file";
    std::string mime;
    std::string url;

    nlohmann::json to_json() const;
};

struct ToolResult {
    std::string title;
    std::string output;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::vector<FileAttachment>> attachments;

    nlohmann::json to_json() const;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string id() const = 0;
    virtual std::string description() const = 0;
    virtual nlohmann::json parameters_schema() const = 0;

    // Decodes params against parameters_schema(); failures come back as
    // InvalidArguments, tool-specific failures as their own error kinds.
    virtual Result<ToolResult> execute(const nlohmann::json& params, const ToolContext& ctx) = 0;

    ToolSpec spec() const {
        return ToolSpec{id(), description(), parameters_schema()};
    }
};

// Create all built-in tools: read, write, edit, list, glob, grep, bash.
// bash_timeout_ms is the bash tool's default timeout.
std::vector<std::unique_ptr<Tool>> create_builtin_tools(uint64_t bash_timeout_ms = 120000);

// Fixed collection of tools keyed by id. Built once, read-only afterwards.
class ToolRegistry {
public:
    ToolRegistry();
    explicit ToolRegistry(std::vector<std::unique_ptr<Tool>> tools);

    // nullptr when no tool has this id
    Tool* get(const std::string& id) const;

    const std::vector<std::unique_ptr<Tool>>& all() const { return tools_; }

    std::vector<ToolSpec> specs() const;
    std::vector<std::pair<std::string, std::string>> descriptions() const;

private:
    std::vector<std::unique_ptr<Tool>> tools_;
};

} // namespace linkagent
