#include "read.hpp"
#include "tool_util.hpp"
#include "../binary.hpp"
#include "../id.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace linkagent {

namespace {

Result<ToolResult> read_image(const std::filesystem::path& filepath, ImageFormat format,
                              const std::string& title, const ToolContext& ctx) {
    std::string content;
    if (!read_file(filepath.string(), content)) {
        return AgentError::io("Failed to open file: " + filepath.string());
    }

    if (!validate_image_format(content, format)) {
        return AgentError::tool_execution(
            "read", "Image validation failed: " + filepath.string() +
                    " has image extension but does not contain valid " +
                    image_format_name(format) + " data");
    }

    std::string mime = image_mime_type(format);

    FileAttachment attachment;
    attachment.id = ascending_id(IdPrefix::Part);
    attachment.session_id = ctx.session_id;
    attachment.message_id = ctx.message_id;
    attachment.mime = mime;
    attachment.url = "data:" + mime + ";base64," + base64_encode(content);

    ToolResult result;
    result.title = title;
    result.output = "Image read successfully";
    result.metadata = {{"preview", "Image read successfully"}};
    result.attachments = std::vector<FileAttachment>{std::move(attachment)};
    return result;
}

std::string format_line(size_t line_num, const std::string& line) {
    char prefix[32];
    std::snprintf(prefix, sizeof(prefix), "%05zu| ", line_num);
    if (line.size() > ReadTool::kMaxLineLength) {
        return prefix + utf8_truncate(line, ReadTool::kMaxLineLength) + "...";
    }
    return prefix + line;
}

} // namespace

Result<ToolResult> ReadTool::execute(const nlohmann::json& params, const ToolContext& ctx) {
    if (auto err = validate_params(id(), parameters_schema(), params)) return *err;

    std::optional<AgentError> err;
    size_t offset = optional_count(id(), params, "offset", err).value_or(0);
    if (err) return *err;
    size_t limit = optional_count(id(), params, "limit", err).value_or(kDefaultLimit);
    if (err) return *err;

    auto filepath = ctx.resolve_path(params["filePath"].get<std::string>());
    std::string title = ctx.relative_path(filepath);

    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec)) {
        return AgentError::file_not_found(filepath.string(),
                                          suggest_similar_paths(filepath.string()));
    }

    if (auto format = image_format_for(filepath.string())) {
        return read_image(filepath, *format, title, ctx);
    }

    std::string content;
    if (!read_file(filepath.string(), content)) {
        return AgentError::io("Failed to open file: " + filepath.string());
    }

    if (is_binary_file(filepath.string(), content)) {
        return AgentError::binary_file(filepath.string());
    }

    auto lines = split_lines(content);
    size_t begin = std::min(offset, lines.size());
    size_t end = (limit > lines.size() - begin) ? lines.size() : begin + limit;

    std::string output = "<file>\n";
    std::string preview;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) output += '\n';
        output += format_line(i + 1, lines[i]);
        if (i - begin < kPreviewLines) {
            if (i > begin) preview += '\n';
            preview += lines[i];
        }
    }

    if (lines.size() > end) {
        output += "\n\n(File has more lines. Use 'offset' parameter to read beyond line " +
                  std::to_string(end) + ")";
    } else {
        output += "\n\n(End of file - total " + std::to_string(lines.size()) + " lines)";
    }
    output += "\n</file>";

    ToolResult result;
    result.title = title;
    result.output = std::move(output);
    result.metadata = {{"preview", preview}};
    return result;
}

std::string ReadTool::description() const {
    return "Reads a file from the local filesystem.\n\n"
           "Usage:\n"
           "- The filePath parameter must be an absolute path\n"
           "- By default, reads up to 2000 lines from the beginning\n"
           "- Optionally specify offset and limit for pagination\n"
           "- Returns content with line numbers";
}

nlohmann::json ReadTool::parameters_schema() const {
    return nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "filePath": {"type": "string", "description": "The path to the file to read"},
            "offset": {"type": "number", "description": "The line number to start reading from (0-based)"},
            "limit": {"type": "number", "description": "The number of lines to read (defaults to 2000)"}
        },
        "required": ["filePath"]
    })json");
}

} // namespace linkagent
