#pragma once
#include "error.hpp"
#include "tool.hpp"
#include <string>

namespace linkagent {

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON object text
};

// Try to repair malformed JSON: balance braces/brackets and drop trailing
// commas. Returns the input unchanged if the repair still does not parse.
std::string repair_json(const std::string& json_str);

// Look the tool up by name, parse its arguments and execute it with the
// call id attached to the context. Exceptions escaping a tool are turned
// into typed errors: filesystem -> IO, JSON -> Serialization, anything
// else -> Unknown.
Result<ToolResult> dispatch_tool(const ToolCall& call, const ToolRegistry& registry,
                                 const ToolContext& ctx, bool verbose = false);

} // namespace linkagent
