#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace linkagent {

// Per-invocation environment handed to every tool call. Built once per
// instruction and never mutated; the with_* helpers return copies.
struct ToolContext {
    std::string session_id;
    std::string message_id;
    std::string agent = "agent";
    std::filesystem::path working_directory;
    std::optional<std::string> call_id;
    std::optional<std::string> provider_id;
    std::optional<std::string> model_id;

    ToolContext(std::string session, std::string message, std::filesystem::path wd);

    ToolContext with_call_id(const std::string& id) const;
    ToolContext with_model(const std::string& provider, const std::string& model) const;

    // Absolute paths pass through; relative ones are joined to the working directory
    std::filesystem::path resolve_path(const std::string& path) const;

    // Path relative to the working directory when inside it, else unchanged
    std::string relative_path(const std::filesystem::path& path) const;
};

} // namespace linkagent
