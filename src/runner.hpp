#pragma once
#include "dispatcher.hpp"
#include "error.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace linkagent {

// Output event format. OpenCode events are written as-is (pretty unless
// compact_json); Claude events are stream-json NDJSON, one object per line.
enum class JsonStandard {
    OpenCode,
    Claude
};

// "opencode" / "claude"; nullopt for anything else
std::optional<JsonStandard> parse_json_standard(const std::string& name);

// Map one OpenCode event onto Claude stream-json events. status events have
// no counterpart; tool_use becomes tool_use + tool_result.
std::vector<nlohmann::json> to_claude_events(const nlohmann::json& event, uint64_t start_ms);

struct RunnerOptions {
    std::filesystem::path working_directory;
    std::string provider_id;  // attached to every ToolContext when set
    std::string model_id;
    bool compact_json = false;
    bool dry_run = false;
    bool verbose = false;
    JsonStandard json_standard = JsonStandard::OpenCode;
};

// One line of input: a message plus the tool calls to run for it
struct Instruction {
    std::string message;
    std::vector<ToolCall> tools;
};

// {"message": "...", "tools": [{"name": ..., "params": {...}}]} or plain
// text. A JSON object without a string "message" is treated as plain text;
// a malformed "tools" array is a Serialization error.
Result<Instruction> parse_instruction(const std::string& line);

// Drives the tool framework from an input stream and writes the JSON
// event stream (status, step_start, text, tool_use, step_finish, error).
class Runner {
public:
    Runner(RunnerOptions options, const ToolRegistry& registry, std::ostream& out);

    // Status event, then one instruction per non-empty line until EOF
    void run_stream(std::istream& in);

    // Parse and run a single line (also used for -p/--prompt)
    void run_line(const std::string& line);

    void run_instruction(const Instruction& instruction);

private:
    void emit(const nlohmann::json& event);
    void write_line(const nlohmann::json& value, bool compact);
    nlohmann::json event(const char* type, const std::string& session_id) const;

    RunnerOptions options_;
    const ToolRegistry& registry_;
    std::ostream& out_;
    uint64_t start_ms_;
};

} // namespace linkagent
