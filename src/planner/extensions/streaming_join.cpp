#include "tributary/planner/extensions/streaming_join.hpp"

#include <stdexcept>
#include <utility>

namespace tributary::planner {

StreamingJoinNode::StreamingJoinNode(LogicalOperatorPtr rewritten_join,
                                     bool is_instant,
                                     std::optional<std::chrono::microseconds> ttl)
    : rewritten_join_{std::move(rewritten_join)}
    , is_instant_{is_instant}
    , ttl_{ttl}
{
    if (!rewritten_join_) {
        throw std::invalid_argument{"streaming join requires a rewritten join"};
    }
    if (is_instant_ == ttl_.has_value()) {
        throw std::invalid_argument{is_instant_ ? "instant joins do not buffer state and take no ttl"
                                                : "updating joins require a ttl"};
    }
    schema_ = rewritten_join_->schema();
}

std::string_view StreamingJoinNode::name() const noexcept
{
    return kStreamingJoinName;
}

const LogicalSchema& StreamingJoinNode::schema() const noexcept
{
    return schema_;
}

std::vector<const LogicalOperator*> StreamingJoinNode::inputs() const
{
    if (!rewritten_join_) {
        return {};
    }
    return {rewritten_join_.get()};
}

std::string StreamingJoinNode::describe() const
{
    std::string description{kStreamingJoinName};
    if (is_instant_) {
        description += ": instant";
    } else {
        description += ": updating ttl=" + format_duration(*ttl_);
    }
    return description;
}

std::vector<LogicalOperatorPtr> StreamingJoinNode::take_inputs()
{
    std::vector<LogicalOperatorPtr> inputs;
    if (rewritten_join_) {
        inputs.push_back(std::move(rewritten_join_));
    }
    return inputs;
}

PlanResult<std::unique_ptr<ExtensionNode>> StreamingJoinNode::with_new_inputs(
    std::vector<LogicalOperatorPtr> inputs) const
{
    using Result = PlanResult<std::unique_ptr<ExtensionNode>>;
    if (inputs.size() != 1U) {
        return Result::failure(make_plan_diagnostic(
            PlanErrc::UpstreamConstruction,
            std::string{kStreamingJoinName} + " expects 1 input but was given " + std::to_string(inputs.size())));
    }
    return Result::ok(std::make_unique<StreamingJoinNode>(std::move(inputs.front()), is_instant_, ttl_));
}

const LogicalOperator* StreamingJoinNode::rewritten_join() const noexcept
{
    return rewritten_join_.get();
}

bool StreamingJoinNode::is_instant() const noexcept
{
    return is_instant_;
}

const std::optional<std::chrono::microseconds>& StreamingJoinNode::ttl() const noexcept
{
    return ttl_;
}

const StreamingJoinNode* as_streaming_join(const LogicalOperator* node) noexcept
{
    if (node == nullptr || node->kind != LogicalOperatorKind::Extension) {
        return nullptr;
    }
    return dynamic_cast<const StreamingJoinNode*>(static_cast<const LogicalExtension*>(node)->node.get());
}

}  // namespace tributary::planner
