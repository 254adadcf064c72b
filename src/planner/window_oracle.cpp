#include "tributary/planner/window_oracle.hpp"

#include "tributary/planner/extensions/key_calculation.hpp"
#include "tributary/planner/extensions/streaming_join.hpp"

namespace tributary::planner {

std::optional<WindowType> WindowDetector::find_window(const LogicalOperator& plan) const
{
    switch (plan.kind) {
    case LogicalOperatorKind::TableScan:
        return std::nullopt;
    case LogicalOperatorKind::Aggregate:
        return static_cast<const LogicalAggregate&>(plan).window;
    case LogicalOperatorKind::Projection:
    case LogicalOperatorKind::Filter: {
        const auto children = plan.children();
        if (children.empty() || children.front() == nullptr) {
            return std::nullopt;
        }
        return find_window(*children.front());
    }
    case LogicalOperatorKind::Join: {
        const auto& join = static_cast<const LogicalJoin&>(plan);
        if (!join.left || !join.right) {
            return std::nullopt;
        }
        auto left = find_window(*join.left);
        auto right = find_window(*join.right);
        if (left.has_value() && right.has_value() && *left == *right) {
            return left;
        }
        return std::nullopt;
    }
    case LogicalOperatorKind::Extension: {
        if (const auto* keyed = as_key_calculation(&plan)) {
            return keyed->input() != nullptr ? find_window(*keyed->input()) : std::nullopt;
        }
        if (const auto* streaming = as_streaming_join(&plan)) {
            return streaming->rewritten_join() != nullptr ? find_window(*streaming->rewritten_join())
                                                          : std::nullopt;
        }
        const auto inputs = plan.children();
        if (inputs.size() == 1U && inputs.front() != nullptr) {
            return find_window(*inputs.front());
        }
        return std::nullopt;
    }
    }
    return std::nullopt;
}

const WindowOracle& default_window_oracle() noexcept
{
    static const WindowDetector detector{};
    return detector;
}

}  // namespace tributary::planner
