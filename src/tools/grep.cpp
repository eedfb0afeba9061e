#include "grep.hpp"
#include "tool_util.hpp"
#include "../binary.hpp"
#include "../glob_match.hpp"
#include "../util.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>

namespace linkagent {

namespace {

namespace fs = std::filesystem;

bool is_hidden(const std::string& name) {
    return name.size() > 1 && name[0] == '.' && name != "..";
}

// Depth-first, entries sorted by name, hidden entries skipped
void collect_files(const fs::path& dir, std::vector<fs::path>& out) {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!is_hidden(it->path().filename().string())) {
            entries.push_back(*it);
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& entry : entries) {
        if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
            collect_files(entry.path(), out);
        } else if (entry.is_regular_file(ec)) {
            out.push_back(entry.path());
        }
    }
}

bool passes_filter(const std::string& filter, const fs::path& root, const fs::path& file) {
    if (filter.find('/') == std::string::npos) {
        return glob_match_name(filter, file.filename().string());
    }
    return glob_match_path(filter, file.lexically_relative(root).generic_string());
}

struct GrepOptions {
    std::string mode;
    bool line_numbers = true;
    size_t before = 0;
    size_t after = 0;
};

std::string format_hit(const std::string& path, size_t line_index, const std::string& text,
                       bool line_numbers) {
    if (line_numbers) {
        return path + ":" + std::to_string(line_index + 1) + ": " + text;
    }
    return path + ": " + text;
}

} // namespace

Result<ToolResult> GrepTool::execute(const nlohmann::json& params, const ToolContext& ctx) {
    if (auto err = validate_params(id(), parameters_schema(), params)) return *err;

    const auto pattern = params["pattern"].get<std::string>();
    auto path = optional_string(params, "path");
    fs::path root = path ? ctx.resolve_path(*path) : ctx.working_directory;

    GrepOptions opts;
    opts.mode = optional_string(params, "output_mode").value_or("files_with_matches");
    opts.line_numbers = optional_bool(params, "-n", true);

    std::optional<AgentError> err;
    auto context = optional_count(id(), params, "-C", err);
    if (err) return *err;
    auto before = optional_count(id(), params, "-B", err);
    if (err) return *err;
    auto after = optional_count(id(), params, "-A", err);
    if (err) return *err;
    auto head_limit = optional_count(id(), params, "head_limit", err);
    if (err) return *err;
    opts.before = context ? *context : before.value_or(0);
    opts.after = context ? *context : after.value_or(0);

    auto flags = std::regex::ECMAScript;
    if (optional_bool(params, "-i", false)) flags |= std::regex::icase;
    std::regex regex;
    try {
        regex = std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        return AgentError::tool_execution(id(), std::string("Invalid regex: ") + e.what());
    }

    auto filter = optional_string(params, "glob");
    if (filter) {
        if (auto problem = glob_syntax_error(*filter)) {
            return AgentError::tool_execution(id(), "Invalid pattern: " + *problem);
        }
    }

    std::error_code ec;
    std::vector<fs::path> files;
    if (fs::is_regular_file(root, ec)) {
        files.push_back(root);
    } else if (fs::is_directory(root, ec)) {
        collect_files(root, files);
    } else {
        return AgentError::file_not_found(root.string());
    }

    std::vector<std::string> results;
    size_t match_count = 0;
    size_t file_count = 0;
    bool truncated = false;

    for (const auto& file : files) {
        if (filter && !passes_filter(*filter, root, file)) continue;

        std::string content;
        if (!read_file(file.string(), content)) continue;
        if (is_binary_file(file.string(), content)) continue;

        std::string rel = ctx.relative_path(file);
        if (rel.empty()) rel = file.filename().string();
        auto lines = split_lines(content);

        std::vector<std::string> file_results;
        size_t file_matches = 0;
        size_t next_unprinted = 0;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (!std::regex_search(lines[i], regex)) continue;
            ++file_matches;
            if (opts.mode != "content") continue;

            size_t start = std::max(next_unprinted, i >= opts.before ? i - opts.before : 0);
            size_t stop = std::min(lines.size(), i + opts.after + 1);
            for (size_t j = start; j < stop; ++j) {
                file_results.push_back(format_hit(rel, j, lines[j], opts.line_numbers));
            }
            next_unprinted = std::max(next_unprinted, stop);
        }
        if (file_matches == 0) continue;

        match_count += file_matches;
        ++file_count;
        if (opts.mode == "files_with_matches") {
            results.push_back(rel);
        } else if (opts.mode == "count") {
            results.push_back(rel + ":" + std::to_string(file_matches));
        } else {
            results.insert(results.end(), file_results.begin(), file_results.end());
        }

        if (head_limit && results.size() >= *head_limit) {
            truncated = results.size() > *head_limit || &file != &files.back();
            results.resize(*head_limit);
            break;
        }
    }

    std::string output;
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) output += '\n';
        output += results[i];
    }

    ToolResult result;
    result.title = pattern;
    result.output = std::move(output);
    result.metadata = {
        {"count", match_count},
        {"files", file_count},
        {"truncated", truncated}
    };
    return result;
}

std::string GrepTool::description() const {
    return "A powerful search tool for finding text patterns in files.\n\n"
           "Usage:\n"
           "- Supports full regex syntax (e.g., \"log.*Error\", \"function\\s+\\w+\")\n"
           "- Filter files with glob parameter (e.g., \"*.js\", \"**/*.tsx\")\n"
           "- Output modes: \"content\" shows matching lines, \"files_with_matches\" "
           "shows only file paths, \"count\" shows matches per file\n"
           "- Use -C/-A/-B for context lines around matches";
}

nlohmann::json GrepTool::parameters_schema() const {
    return nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "pattern": {"type": "string", "description": "The regular expression pattern to search for"},
            "path": {"type": "string", "description": "File or directory to search in"},
            "glob": {"type": "string", "description": "Glob pattern to filter files"},
            "output_mode": {
                "type": "string",
                "enum": ["content", "files_with_matches", "count"],
                "description": "Output mode"
            },
            "-i": {"type": "boolean", "description": "Case insensitive search"},
            "-n": {"type": "boolean", "description": "Show line numbers"},
            "-B": {"type": "number", "description": "Lines of context before match"},
            "-A": {"type": "number", "description": "Lines of context after match"},
            "-C": {"type": "number", "description": "Lines of context around match"},
            "head_limit": {"type": "number", "description": "Maximum number of output entries"}
        },
        "required": ["pattern"]
    })json");
}

} // namespace linkagent
