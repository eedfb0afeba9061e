#include "list.hpp"
#include "tool_util.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace linkagent {

std::string format_size(uint64_t bytes) {
    constexpr uint64_t kKB = 1024;
    constexpr uint64_t kMB = kKB * 1024;
    constexpr uint64_t kGB = kMB * 1024;

    char buf[32];
    if (bytes >= kGB) {
        std::snprintf(buf, sizeof(buf), "%.1fGB", static_cast<double>(bytes) / kGB);
    } else if (bytes >= kMB) {
        std::snprintf(buf, sizeof(buf), "%.1fMB", static_cast<double>(bytes) / kMB);
    } else if (bytes >= kKB) {
        std::snprintf(buf, sizeof(buf), "%.1fKB", static_cast<double>(bytes) / kKB);
    } else {
        return std::to_string(bytes) + "B";
    }
    return buf;
}

Result<ToolResult> ListTool::execute(const nlohmann::json& params, const ToolContext& ctx) {
    namespace fs = std::filesystem;
    if (auto err = validate_params(id(), parameters_schema(), params)) return *err;

    auto path = optional_string(params, "path");
    fs::path dir = path ? ctx.resolve_path(*path) : ctx.working_directory;

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return AgentError::file_not_found(dir.string());
    }
    if (!fs::is_directory(dir, ec)) {
        return AgentError::tool_execution(id(), "Not a directory: " + dir.string());
    }

    std::vector<std::string> entries;
    fs::directory_iterator it(dir, ec);
    if (ec) return AgentError::io(ec, dir.string());
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return AgentError::io(ec, dir.string());
        std::string name = it->path().filename().string();
        if (it->is_directory(ec)) {
            entries.push_back(name + "/");
        } else {
            uint64_t size = it->file_size(ec);
            if (ec) size = 0;
            entries.push_back(name + " (" + format_size(size) + ")");
        }
    }
    std::sort(entries.begin(), entries.end());

    std::string output;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) output += '\n';
        output += entries[i];
    }

    ToolResult result;
    result.title = ctx.relative_path(dir);
    if (result.title.empty()) result.title = ".";
    result.output = std::move(output);
    result.metadata = {{"count", entries.size()}};
    return result;
}

std::string ListTool::description() const {
    return "Lists files and directories in a given path.\n\n"
           "Usage:\n"
           "- If no path is specified, lists the current working directory\n"
           "- Returns file names and sizes\n"
           "- Directories are marked with a trailing slash";
}

nlohmann::json ListTool::parameters_schema() const {
    return nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "path": {"type": "string", "description": "The path to list (defaults to current directory)"}
        }
    })json");
}

} // namespace linkagent
