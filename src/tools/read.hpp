#pragma once
#include "../tool.hpp"

namespace linkagent {

class ReadTool : public Tool {
public:
    std::string id() const override { return "read"; }
    std::string description() const override;
    nlohmann::json parameters_schema() const override;
    Result<ToolResult> execute(const nlohmann::json& params, const ToolContext& ctx) override;

    static constexpr size_t kDefaultLimit = 2000;
    static constexpr size_t kMaxLineLength = 2000;
    static constexpr size_t kPreviewLines = 20;
};

} // namespace linkagent
