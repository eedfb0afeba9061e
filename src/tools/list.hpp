#pragma once
#include "../tool.hpp"
#include <cstdint>

namespace linkagent {

class ListTool : public Tool {
public:
    std::string id() const override { return "list"; }
    std::string description() const override;
    nlohmann::json parameters_schema() const override;
    Result<ToolResult> execute(const nlohmann::json& params, const ToolContext& ctx) override;
};

// "512B", "1.5KB", "2.0MB", "1.2GB"
std::string format_size(uint64_t bytes);

} // namespace linkagent
