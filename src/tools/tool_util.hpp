#pragma once
#include "../error.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace linkagent {

// Check params against a tool's JSON schema: object shape, required fields,
// no undeclared fields, declared types and enums. Returns InvalidArguments
// on the first violation.
std::optional<AgentError> validate_params(const std::string& tool,
                                          const nlohmann::json& schema,
                                          const nlohmann::json& params);

// Optional string field (already type-checked by validate_params)
std::optional<std::string> optional_string(const nlohmann::json& params, const char* field);

// Optional non-negative integer field. Fractional or negative values are
// reported as InvalidArguments through `err`.
std::optional<size_t> optional_count(const std::string& tool, const nlohmann::json& params,
                                     const char* field, std::optional<AgentError>& err);

inline bool optional_bool(const nlohmann::json& params, const char* field, bool fallback) {
    if (params.contains(field) && params[field].is_boolean()) {
        return params[field].get<bool>();
    }
    return fallback;
}

// Best-effort sibling names for a missing path: entries of the parent
// directory whose lowercase name contains the requested base name or is
// contained in it. At most `limit`, sorted.
std::vector<std::string> suggest_similar_paths(const std::string& path, size_t limit = 3);

// Create parent directories, then overwrite the file with content
std::optional<AgentError> write_text_file(const std::filesystem::path& path,
                                          const std::string& content);

} // namespace linkagent
