#include "tool_context.hpp"

namespace linkagent {

ToolContext::ToolContext(std::string session, std::string message, std::filesystem::path wd)
    : session_id(std::move(session)),
      message_id(std::move(message)),
      working_directory(std::move(wd)) {}

ToolContext ToolContext::with_call_id(const std::string& id) const {
    ToolContext copy = *this;
    copy.call_id = id;
    return copy;
}

ToolContext ToolContext::with_model(const std::string& provider, const std::string& model) const {
    ToolContext copy = *this;
    copy.provider_id = provider;
    copy.model_id = model;
    return copy;
}

std::filesystem::path ToolContext::resolve_path(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.is_absolute()) return p;
    return working_directory / p;
}

std::string ToolContext::relative_path(const std::filesystem::path& path) const {
    auto it = path.begin();
    for (const auto& part : working_directory) {
        // Trailing separator of "/a/b/" iterates as an empty element
        if (part.empty()) continue;
        if (it == path.end() || *it != part) {
            return path.string();
        }
        ++it;
    }

    std::filesystem::path rest;
    for (; it != path.end(); ++it) {
        if (it->empty()) continue;
        rest /= *it;
    }
    return rest.string();
}

} // namespace linkagent
