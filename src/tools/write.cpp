#include "write.hpp"
#include "tool_util.hpp"

#include <filesystem>

namespace linkagent {

Result<ToolResult> WriteTool::execute(const nlohmann::json& params, const ToolContext& ctx) {
    if (auto err = validate_params(id(), parameters_schema(), params)) return *err;

    auto filepath = ctx.resolve_path(params["filePath"].get<std::string>());
    const auto content = params["content"].get<std::string>();

    std::error_code ec;
    bool exists = std::filesystem::exists(filepath, ec);

    if (auto err = write_text_file(filepath, content)) return *err;

    ToolResult result;
    result.title = ctx.relative_path(filepath);
    result.metadata = {
        {"diagnostics", nlohmann::json::object()},
        {"filepath", filepath.string()},
        {"exists", exists}
    };
    return result;
}

std::string WriteTool::description() const {
    return "Writes content to a file on the local filesystem.\n\n"
           "Usage:\n"
           "- The filePath parameter must be an absolute path\n"
           "- Will create parent directories if they don't exist\n"
           "- Will overwrite existing files\n"
           "- Returns the path to the written file";
}

nlohmann::json WriteTool::parameters_schema() const {
    return nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "content": {"type": "string", "description": "The content to write to the file"},
            "filePath": {"type": "string", "description": "The absolute path to the file to write (must be absolute, not relative)"}
        },
        "required": ["content", "filePath"]
    })json");
}

} // namespace linkagent
