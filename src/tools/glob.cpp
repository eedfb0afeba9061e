#include "glob.hpp"
#include "tool_util.hpp"
#include "../glob_match.hpp"

#include <algorithm>
#include <filesystem>

namespace linkagent {

Result<ToolResult> GlobTool::execute(const nlohmann::json& params, const ToolContext& ctx) {
    namespace fs = std::filesystem;
    if (auto err = validate_params(id(), parameters_schema(), params)) return *err;

    const auto pattern = params["pattern"].get<std::string>();
    auto path = optional_string(params, "path");
    fs::path base = path ? ctx.resolve_path(*path) : ctx.working_directory;

    std::string full_pattern = (!pattern.empty() && pattern[0] == '/')
        ? pattern : (base / pattern).string();

    if (auto problem = glob_syntax_error(full_pattern)) {
        return AgentError::tool_execution(id(), "Invalid pattern: " + *problem);
    }

    struct Match {
        fs::path path;
        fs::file_time_type mtime;
    };
    std::vector<Match> matches;
    for (auto& file : glob_files(full_pattern)) {
        std::error_code ec;
        auto mtime = fs::last_write_time(file, ec);
        if (ec) mtime = fs::file_time_type::min();
        matches.push_back({std::move(file), mtime});
    }

    // Most recently modified first
    std::sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
        if (a.mtime != b.mtime) return a.mtime > b.mtime;
        return a.path < b.path;
    });

    std::string output;
    for (size_t i = 0; i < matches.size(); ++i) {
        if (i > 0) output += '\n';
        output += ctx.relative_path(matches[i].path);
    }

    ToolResult result;
    result.title = pattern;
    result.output = std::move(output);
    result.metadata = {{"count", matches.size()}};
    return result;
}

std::string GlobTool::description() const {
    return "Fast file pattern matching tool.\n\n"
           "Usage:\n"
           "- Supports glob patterns like \"**/*.js\" or \"src/**/*.ts\"\n"
           "- Returns matching file paths sorted by modification time\n"
           "- Use for finding files by name patterns";
}

nlohmann::json GlobTool::parameters_schema() const {
    return nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "pattern": {"type": "string", "description": "The glob pattern to match files against"},
            "path": {"type": "string", "description": "The directory to search in (defaults to working directory)"}
        },
        "required": ["pattern"]
    })json");
}

} // namespace linkagent
