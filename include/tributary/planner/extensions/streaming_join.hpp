#pragma once

#include "tributary/planner/logical_plan.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tributary::planner {

inline constexpr std::string_view kStreamingJoinName = "StreamingJoin";

// A join the streaming runtime can execute. Instant joins pair rows of the same
// window; updating joins buffer state for `ttl`.
class StreamingJoinNode final : public ExtensionNode {
public:
    // Throws std::invalid_argument when `ttl` is set on an instant join or missing on an updating one.
    StreamingJoinNode(LogicalOperatorPtr rewritten_join,
                      bool is_instant,
                      std::optional<std::chrono::microseconds> ttl);

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] const LogicalSchema& schema() const noexcept override;
    [[nodiscard]] std::vector<const LogicalOperator*> inputs() const override;
    [[nodiscard]] std::string describe() const override;

    std::vector<LogicalOperatorPtr> take_inputs() override;
    [[nodiscard]] PlanResult<std::unique_ptr<ExtensionNode>> with_new_inputs(
        std::vector<LogicalOperatorPtr> inputs) const override;
    [[nodiscard]] bool sealed() const noexcept override { return true; }

    [[nodiscard]] const LogicalOperator* rewritten_join() const noexcept;
    [[nodiscard]] bool is_instant() const noexcept;
    [[nodiscard]] const std::optional<std::chrono::microseconds>& ttl() const noexcept;

private:
    LogicalOperatorPtr rewritten_join_{};
    bool is_instant_ = false;
    std::optional<std::chrono::microseconds> ttl_{};
    LogicalSchema schema_{};
};

[[nodiscard]] const StreamingJoinNode* as_streaming_join(const LogicalOperator* node) noexcept;

}  // namespace tributary::planner
