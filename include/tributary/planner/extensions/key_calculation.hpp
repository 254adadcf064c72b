#pragma once

#include "tributary/planner/logical_plan.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tributary::planner {

inline constexpr std::string_view kKeyCalculationName = "KeyCalculation";

// Materialises join keys ahead of a streaming join. The wrapped projection emits
// the key columns first; `schema()` is what downstream operators see and drops
// them again when the node is trimmed.
class KeyCalculationNode final : public ExtensionNode {
    // Restricts construction to try_new while still allowing std::make_unique.
    struct ConstructionKey final {
        explicit ConstructionKey() = default;
    };

public:
    KeyCalculationNode(ConstructionKey key,
                       LogicalOperatorPtr input,
                       std::vector<std::size_t> keys,
                       std::string side,
                       bool trimmed,
                       LogicalSchema materialized_schema,
                       LogicalSchema schema);

    static PlanResult<std::unique_ptr<KeyCalculationNode>> try_new(LogicalOperatorPtr input,
                                                                    std::vector<std::size_t> keys,
                                                                    std::string side,
                                                                    bool trimmed);

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] const LogicalSchema& schema() const noexcept override;
    [[nodiscard]] std::vector<const LogicalOperator*> inputs() const override;
    [[nodiscard]] std::string describe() const override;

    std::vector<LogicalOperatorPtr> take_inputs() override;
    [[nodiscard]] PlanResult<std::unique_ptr<ExtensionNode>> with_new_inputs(
        std::vector<LogicalOperatorPtr> inputs) const override;

    [[nodiscard]] const LogicalSchema& materialized_schema() const noexcept;
    [[nodiscard]] const LogicalOperator* input() const noexcept;
    [[nodiscard]] const std::vector<std::size_t>& keys() const noexcept;
    [[nodiscard]] const std::string& side() const noexcept;
    [[nodiscard]] bool trimmed() const noexcept;

private:
    LogicalOperatorPtr input_{};
    std::vector<std::size_t> keys_{};
    std::string side_{};
    bool trimmed_ = false;
    LogicalSchema materialized_schema_{};
    LogicalSchema schema_{};
};

[[nodiscard]] const KeyCalculationNode* as_key_calculation(const LogicalOperator* node) noexcept;

}  // namespace tributary::planner
