#pragma once
#include "../tool.hpp"

namespace linkagent {

class GlobTool : public Tool {
public:
    std::string id() const override { return "glob"; }
    std::string description() const override;
    nlohmann::json parameters_schema() const override;
    Result<ToolResult> execute(const nlohmann::json& params, const ToolContext& ctx) override;
};

} // namespace linkagent
