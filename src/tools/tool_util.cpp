#include "tool_util.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

namespace linkagent {

namespace {

bool matches_type(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    return true;
}

} // namespace

std::optional<AgentError> validate_params(const std::string& tool,
                                          const nlohmann::json& schema,
                                          const nlohmann::json& params) {
    if (!params.is_object()) {
        return AgentError::invalid_arguments(tool, "Parameters must be a JSON object");
    }

    const auto& properties = schema.contains("properties")
        ? schema["properties"] : nlohmann::json::object();

    if (schema.contains("required")) {
        for (const auto& field : schema["required"]) {
            auto name = field.get<std::string>();
            if (!params.contains(name)) {
                return AgentError::invalid_arguments(tool, "Missing required parameter: " + name);
            }
        }
    }

    for (auto it = params.begin(); it != params.end(); ++it) {
        if (!properties.contains(it.key())) {
            return AgentError::invalid_arguments(tool, "Unknown parameter: " + it.key());
        }
        const auto& prop = properties[it.key()];
        if (prop.contains("type")) {
            auto type = prop["type"].get<std::string>();
            if (!matches_type(it.value(), type)) {
                return AgentError::invalid_arguments(
                    tool, "Parameter '" + it.key() + "' must be of type " + type);
            }
        }
        if (prop.contains("enum")) {
            const auto& allowed = prop["enum"];
            if (std::find(allowed.begin(), allowed.end(), it.value()) == allowed.end()) {
                return AgentError::invalid_arguments(
                    tool, "Parameter '" + it.key() + "' must be one of " + allowed.dump());
            }
        }
    }

    return std::nullopt;
}

std::optional<std::string> optional_string(const nlohmann::json& params, const char* field) {
    if (params.contains(field) && params[field].is_string()) {
        return params[field].get<std::string>();
    }
    return std::nullopt;
}

std::optional<size_t> optional_count(const std::string& tool, const nlohmann::json& params,
                                     const char* field, std::optional<AgentError>& err) {
    if (!params.contains(field) || params[field].is_null()) return std::nullopt;
    const auto& v = params[field];
    if (v.is_number_unsigned()) {
        return static_cast<size_t>(v.get<uint64_t>());
    }
    if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        return static_cast<size_t>(v.get<int64_t>());
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        // max() converts to exactly 2^64, which itself does not fit
        if (d >= 0 && std::floor(d) == d &&
            d < static_cast<double>(std::numeric_limits<size_t>::max())) {
            return static_cast<size_t>(d);
        }
    }
    err = AgentError::invalid_arguments(
        tool, std::string("Parameter '") + field + "' must be a non-negative integer");
    return std::nullopt;
}

std::vector<std::string> suggest_similar_paths(const std::string& path, size_t limit) {
    namespace fs = std::filesystem;
    fs::path p(path);
    fs::path dir = p.has_parent_path() ? p.parent_path() : fs::path(".");
    std::string base = to_lower(p.filename().string());

    std::error_code ec;
    if (base.empty() || !fs::is_directory(dir, ec)) return {};

    std::vector<std::string> names;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        std::string lower = to_lower(name);
        if (lower.find(base) != std::string::npos || base.find(lower) != std::string::npos) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());

    std::vector<std::string> out;
    for (const auto& name : names) {
        if (out.size() >= limit) break;
        out.push_back((dir / name).string());
    }
    return out;
}

std::optional<AgentError> write_text_file(const std::filesystem::path& path,
                                          const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return AgentError::io(ec, path.parent_path().string());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return AgentError::io("Failed to open file for writing: " + path.string());
    }
    file << content;
    file.close();
    if (file.fail()) {
        return AgentError::io("Failed to write to file: " + path.string());
    }
    return std::nullopt;
}

} // namespace linkagent
