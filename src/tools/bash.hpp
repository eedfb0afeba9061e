#pragma once
#include "../tool.hpp"
#include <cstdint>

namespace linkagent {

class BashTool : public Tool {
public:
    static constexpr uint64_t kDefaultTimeoutMs = 120000;
    static constexpr uint64_t kMaxTimeoutMs = 600000;
    static constexpr size_t kMaxOutputLength = 30000;

    BashTool() = default;
    // Timeout applied when a call does not name one (capped at kMaxTimeoutMs)
    explicit BashTool(uint64_t default_timeout_ms);

    std::string id() const override { return "bash"; }
    std::string description() const override;
    nlohmann::json parameters_schema() const override;
    Result<ToolResult> execute(const nlohmann::json& params, const ToolContext& ctx) override;

private:
    uint64_t default_timeout_ms_ = kDefaultTimeoutMs;
};

} // namespace linkagent
