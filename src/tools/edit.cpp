#include "edit.hpp"
#include "tool_util.hpp"
#include "../diff.hpp"
#include "../edit_engine.hpp"
#include "../util.hpp"

#include <filesystem>

namespace linkagent {

namespace {

ToolResult edit_result(const std::string& title, const std::string& file,
                       const std::string& before, const std::string& after,
                       const std::vector<DiffLine>& lines, const DiffStats& stats) {
    ToolResult result;
    result.title = title;
    result.metadata = {
        {"diagnostics", nlohmann::json::object()},
        {"diff", unified_diff(lines, file)},
        {"filediff", {
            {"file", file},
            {"before", before},
            {"after", after},
            {"additions", stats.additions},
            {"deletions", stats.deletions}
        }}
    };
    return result;
}

} // namespace

Result<ToolResult> EditTool::execute(const nlohmann::json& params, const ToolContext& ctx) {
    if (auto err = validate_params(id(), parameters_schema(), params)) return *err;

    const auto old_string = params["oldString"].get<std::string>();
    const auto new_string = params["newString"].get<std::string>();
    bool replace_all = optional_bool(params, "replaceAll", false);

    if (old_string == new_string) {
        return AgentError::invalid_arguments(id(), "oldString and newString must be different");
    }

    auto filepath = ctx.resolve_path(params["filePath"].get<std::string>());
    std::string title = ctx.relative_path(filepath);
    std::string file = filepath.string();

    // Empty oldString creates (or overwrites) the file
    if (old_string.empty()) {
        if (auto err = write_text_file(filepath, new_string)) return *err;
        DiffStats stats;
        stats.additions = split_lines(new_string).size();
        return edit_result(title, file, "", new_string, diff_lines("", new_string), stats);
    }

    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec)) {
        return AgentError::file_not_found(file);
    }

    std::string raw;
    if (!read_file(file, raw)) {
        return AgentError::io("Failed to open file: " + file);
    }
    std::string content_old = normalize_line_endings(raw);

    auto replaced = replace_text(content_old, old_string, new_string, replace_all);
    if (is_error(replaced)) return get_error(replaced);
    const std::string& content_new = get_value(replaced);

    if (auto err = write_text_file(filepath, content_new)) return *err;

    auto lines = diff_lines(content_old, content_new);
    return edit_result(title, file, content_old, content_new, lines, diff_stats(lines));
}

std::string EditTool::description() const {
    return "Performs exact string replacements in files.\n\n"
           "Usage:\n"
           "- The filePath parameter must be an absolute path\n"
           "- oldString must exist in the file (exact match or fuzzy match fallback)\n"
           "- newString must be different from oldString\n"
           "- Use replaceAll=true to replace all occurrences\n"
           "- Use an empty oldString to create a new file";
}

nlohmann::json EditTool::parameters_schema() const {
    return nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "filePath": {"type": "string", "description": "The absolute path to the file to modify"},
            "oldString": {"type": "string", "description": "The text to replace"},
            "newString": {"type": "string", "description": "The text to replace it with (must be different from oldString)"},
            "replaceAll": {"type": "boolean", "description": "Replace all occurrences of oldString (default false)"}
        },
        "required": ["filePath", "oldString", "newString"]
    })json");
}

} // namespace linkagent
