#include "runner.hpp"
#include "id.hpp"
#include "util.hpp"

#include <iostream>

namespace linkagent {

Result<Instruction> parse_instruction(const std::string& line) {
    Instruction instruction;
    std::string text = trim(line);

    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("message") ||
        !j["message"].is_string()) {
        instruction.message = text;
        return instruction;
    }

    instruction.message = j["message"].get<std::string>();
    if (!j.contains("tools") || j["tools"].is_null()) return instruction;
    if (!j["tools"].is_array()) {
        return AgentError::serialization("\"tools\" must be an array");
    }

    for (const auto& t : j["tools"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) {
            return AgentError::serialization("each tool call needs a string \"name\"");
        }
        ToolCall call;
        call.id = ascending_id(IdPrefix::Part);
        call.name = t["name"].get<std::string>();
        call.arguments = t.contains("params") ? t["params"].dump() : "{}";
        instruction.tools.push_back(std::move(call));
    }
    return instruction;
}

std::optional<JsonStandard> parse_json_standard(const std::string& name) {
    if (name == "opencode") return JsonStandard::OpenCode;
    if (name == "claude") return JsonStandard::Claude;
    return std::nullopt;
}

std::vector<nlohmann::json> to_claude_events(const nlohmann::json& event, uint64_t start_ms) {
    const std::string type = event.value("type", "");
    if (type == "status") return {};

    uint64_t ts = event.value("timestamp", uint64_t{0});
    nlohmann::json base = {
        {"timestamp", iso_timestamp(ts)},
        {"session_id", event.value("sessionID", nlohmann::json())}
    };

    auto with_type = [&base](const char* t) {
        nlohmann::json j = base;
        j["type"] = t;
        return j;
    };

    if (type == "step_start") {
        return {with_type("init")};
    }
    if (type == "text") {
        auto msg = with_type("message");
        msg["role"] = "assistant";
        msg["content"] = nlohmann::json::array({{{"type", "text"}, {"text", event.value("text", "")}}});
        return {msg};
    }
    if (type == "tool_use") {
        auto use = with_type("tool_use");
        use["name"] = event.value("tool", "unknown");
        use["input"] = event.value("input", nlohmann::json::object());
        use["tool_use_id"] = event.value("callID", "");

        auto res = with_type("tool_result");
        res["tool_use_id"] = use["tool_use_id"];
        const auto none = nlohmann::json::object();
        if (event.value("state", "") == "completed") {
            res["status"] = "success";
            res["output"] = event.value("result", none).value("output", "");
        } else {
            res["status"] = "error";
            res["output"] = event.value("error", none).value("data", none).value("message", "");
        }
        return {use, res};
    }
    if (type == "step_finish") {
        auto result = with_type("result");
        result["status"] = "success";
        result["duration_ms"] = ts > start_ms ? ts - start_ms : uint64_t{0};
        return {result};
    }
    if (type == "error") {
        auto result = with_type("result");
        result["status"] = "error";
        result["output"] = event.value("error", nlohmann::json()).dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace);
        return {result};
    }
    return {};
}

Runner::Runner(RunnerOptions options, const ToolRegistry& registry, std::ostream& out)
    : options_(std::move(options)), registry_(registry), out_(out), start_ms_(epoch_millis()) {}

void Runner::write_line(const nlohmann::json& value, bool compact) {
    // Tool output is raw file or process bytes; invalid UTF-8 becomes U+FFFD
    constexpr auto replace = nlohmann::json::error_handler_t::replace;
    out_ << (compact ? value.dump(-1, ' ', false, replace)
                     : value.dump(2, ' ', false, replace)) << "\n";
    out_.flush();
}

void Runner::emit(const nlohmann::json& event) {
    if (options_.json_standard == JsonStandard::Claude) {
        for (const auto& converted : to_claude_events(event, start_ms_)) {
            write_line(converted, true);
        }
        return;
    }
    write_line(event, options_.compact_json);
}

nlohmann::json Runner::event(const char* type, const std::string& session_id) const {
    return {
        {"type", type},
        {"timestamp", epoch_millis()},
        {"sessionID", session_id}
    };
}

void Runner::run_stream(std::istream& in) {
    emit({
        {"type", "status"},
        {"mode", "stdin-stream"},
        {"message", "linkagent ready. Accepts JSON and plain text input."},
        {"hint", "Press CTRL+C to exit."}
    });

    std::string line;
    while (std::getline(in, line)) {
        if (trim(line).empty()) continue;
        run_line(line);
    }
    if (in.bad()) {
        emit({
            {"type", "error"},
            {"timestamp", epoch_millis()},
            {"sessionID", nullptr},
            {"error", AgentError::io("Failed to read input").to_json()}
        });
    }
}

void Runner::run_line(const std::string& line) {
    auto parsed = parse_instruction(line);
    if (is_error(parsed)) {
        emit({
            {"type", "error"},
            {"timestamp", epoch_millis()},
            {"sessionID", nullptr},
            {"error", get_error(parsed).to_json()}
        });
        return;
    }
    run_instruction(get_value(parsed));
}

void Runner::run_instruction(const Instruction& instruction) {
    std::string session_id = ascending_id(IdPrefix::Session);
    std::string message_id = ascending_id(IdPrefix::Message);

    emit(event("step_start", session_id));

    if (options_.dry_run) {
        auto ev = event("text", session_id);
        ev["text"] = "[DRY RUN] Received message: " + instruction.message;
        emit(std::move(ev));
    } else if (instruction.tools.empty()) {
        auto ready = event("text", session_id);
        ready["text"] = "linkagent ready. " + std::to_string(registry_.all().size()) +
                        " tools available. Message: " + instruction.message;
        emit(std::move(ready));

        std::string ids;
        for (const auto& tool : registry_.all()) {
            if (!ids.empty()) ids += ", ";
            ids += tool->id();
        }
        auto listing = event("text", session_id);
        listing["text"] = "Available tools: " + ids;
        emit(std::move(listing));
    } else {
        ToolContext ctx(session_id, message_id, options_.working_directory);
        if (!options_.model_id.empty()) {
            ctx = ctx.with_model(options_.provider_id, options_.model_id);
        }

        for (const auto& call : instruction.tools) {
            auto result = dispatch_tool(call, registry_, ctx, options_.verbose);
            auto ev = event("tool_use", session_id);
            ev["tool"] = call.name;
            ev["callID"] = call.id;
            auto input = nlohmann::json::parse(call.arguments, nullptr, false);
            ev["input"] = input.is_discarded() ? nlohmann::json(call.arguments) : input;
            if (is_error(result)) {
                ev["state"] = "error";
                ev["error"] = get_error(result).to_json();
            } else {
                ev["state"] = "completed";
                ev["result"] = get_value(result).to_json();
            }
            emit(std::move(ev));
        }
    }

    auto finish = event("step_finish", session_id);
    finish["reason"] = "stop";
    emit(std::move(finish));
}

} // namespace linkagent
