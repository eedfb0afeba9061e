#include "dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>

namespace linkagent {

std::string repair_json(const std::string& json_str) {
    std::string s = json_str;

    // Balance braces
    int brace_count = 0;
    int bracket_count = 0;
    for (char c : s) {
        if (c == '{') brace_count++;
        else if (c == '}') brace_count--;
        else if (c == '[') bracket_count++;
        else if (c == ']') bracket_count--;
    }

    while (bracket_count > 0) {
        s += ']';
        bracket_count--;
    }
    while (brace_count > 0) {
        s += '}';
        brace_count--;
    }

    // Drop commas followed (after whitespace) by } or ]
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) {
                j++;
            }
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) {
                continue;
            }
        }
        result += s[i];
    }

    if (nlohmann::json::accept(result)) return result;
    return json_str;
}

Result<ToolResult> dispatch_tool(const ToolCall& call, const ToolRegistry& registry,
                                 const ToolContext& ctx, bool verbose) {
    Tool* tool = registry.get(call.name);
    if (!tool) {
        if (verbose) std::cerr << "[dispatch] unknown tool: " << call.name << "\n";
        return AgentError::invalid_arguments(call.name, "Unknown tool: " + call.name);
    }

    std::string raw = call.arguments.empty() ? "{}" : repair_json(call.arguments);
    nlohmann::json params = nlohmann::json::parse(raw, nullptr, false);
    if (params.is_discarded()) {
        return AgentError::invalid_arguments(call.name, "Failed to parse arguments: " + call.arguments);
    }

    if (verbose) std::cerr << "[dispatch] " << call.name << " (" << call.id << ")\n";

    Result<ToolResult> result = AgentError::unknown("tool did not run");
    try {
        result = tool->execute(params, ctx.with_call_id(call.id));
    } catch (const std::filesystem::filesystem_error& e) {
        result = AgentError::io(e.what());
    } catch (const nlohmann::json::exception& e) {
        result = AgentError::serialization(e.what());
    } catch (const std::exception& e) {
        result = AgentError::unknown(e.what());
    }

    if (verbose) {
        if (is_error(result)) {
            std::cerr << "[dispatch] " << call.name << " failed: " << get_error(result).what() << "\n";
        } else {
            std::cerr << "[dispatch] " << call.name << " done\n";
        }
    }
    return result;
}

} // namespace linkagent
