#pragma once
#include "../tool.hpp"

namespace linkagent {

class WriteTool : public Tool {
public:
    std::string id() const override { return "write"; }
    std::string description() const override;
    nlohmann::json parameters_schema() const override;
    Result<ToolResult> execute(const nlohmann::json& params, const ToolContext& ctx) override;
};

} // namespace linkagent
