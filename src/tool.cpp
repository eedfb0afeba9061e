#include "tool.hpp"
#include "tools/read.hpp"
#include "tools/write.hpp"
#include "tools/edit.hpp"
#include "tools/list.hpp"
#include "tools/glob.hpp"
#include "tools/grep.hpp"
#include "tools/bash.hpp"

#include <stdexcept>

namespace linkagent {

nlohmann::json FileAttachment::to_json() const {
    return {
        {"id", id},
        {"sessionID", session_id},
        {"messageID", message_id},
        {"type", type},
        {"mime", mime},
        {"url", url}
    };
}

nlohmann::json ToolResult::to_json() const {
    nlohmann::json j = {
        {"title", title},
        {"output", output},
        {"metadata", metadata}
    };
    if (attachments) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& a : *attachments) {
            arr.push_back(a.to_json());
        }
        j["attachments"] = std::move(arr);
    }
    return j;
}

std::vector<std::unique_ptr<Tool>> create_builtin_tools(uint64_t bash_timeout_ms) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<ReadTool>());
    tools.push_back(std::make_unique<WriteTool>());
    tools.push_back(std::make_unique<EditTool>());
    tools.push_back(std::make_unique<ListTool>());
    tools.push_back(std::make_unique<GlobTool>());
    tools.push_back(std::make_unique<GrepTool>());
    tools.push_back(std::make_unique<BashTool>(bash_timeout_ms));
    return tools;
}

ToolRegistry::ToolRegistry() : ToolRegistry(create_builtin_tools()) {}

ToolRegistry::ToolRegistry(std::vector<std::unique_ptr<Tool>> tools)
    : tools_(std::move(tools)) {
    for (size_t i = 0; i < tools_.size(); ++i) {
        for (size_t j = 0; j < i; ++j) {
            if (tools_[j]->id() == tools_[i]->id()) {
                throw std::invalid_argument("Duplicate tool id: " + tools_[i]->id());
            }
        }
    }
}

Tool* ToolRegistry::get(const std::string& id) const {
    for (const auto& tool : tools_) {
        if (tool->id() == id) return tool.get();
    }
    return nullptr;
}

std::vector<ToolSpec> ToolRegistry::specs() const {
    std::vector<ToolSpec> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back(tool->spec());
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> ToolRegistry::descriptions() const {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.emplace_back(tool->id(), tool->description());
    }
    return out;
}

} // namespace linkagent
