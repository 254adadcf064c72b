#pragma once

#include "tributary/planner/logical_expression.hpp"
#include "tributary/planner/logical_schema.hpp"
#include "tributary/planner/plan_errors.hpp"
#include "tributary/planner/window_type.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tributary::planner {

enum class LogicalOperatorKind : std::uint8_t {
    TableScan = 0,
    Projection,
    Filter,
    Aggregate,
    Join,
    Extension
};

enum class JoinType : std::uint8_t {
    Inner = 0,
    LeftOuter,
    RightOuter,
    FullOuter,
    LeftSemi,
    RightSemi,
    LeftAnti,
    RightAnti
};

enum class JoinConstraint : std::uint8_t {
    On = 0,
    Using
};

[[nodiscard]] std::string join_type_name(JoinType type);
[[nodiscard]] std::string join_constraint_name(JoinConstraint constraint);
[[nodiscard]] std::string logical_operator_kind_name(LogicalOperatorKind kind);

struct LogicalOperator;
struct LogicalTableScan;
struct LogicalProjection;
struct LogicalFilter;
struct LogicalAggregate;
struct LogicalJoin;
struct LogicalExtension;

using LogicalOperatorPtr = std::unique_ptr<LogicalOperator>;

class LogicalOperatorVisitor {
public:
    virtual ~LogicalOperatorVisitor() = default;
    virtual void visit(const LogicalTableScan& op) = 0;
    virtual void visit(const LogicalProjection& op) = 0;
    virtual void visit(const LogicalFilter& op) = 0;
    virtual void visit(const LogicalAggregate& op) = 0;
    virtual void visit(const LogicalJoin& op) = 0;
    virtual void visit(const LogicalExtension& op) = 0;
};

// Planner-defined node carried opaquely by LogicalExtension.
class ExtensionNode {
public:
    virtual ~ExtensionNode() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual const LogicalSchema& schema() const noexcept = 0;
    [[nodiscard]] virtual std::vector<const LogicalOperator*> inputs() const = 0;
    [[nodiscard]] virtual std::string describe() const = 0;

    // Moves the inputs out, leaving the node without inputs.
    virtual std::vector<LogicalOperatorPtr> take_inputs() = 0;
    [[nodiscard]] virtual PlanResult<std::unique_ptr<ExtensionNode>> with_new_inputs(
        std::vector<LogicalOperatorPtr> inputs) const = 0;

    // A sealed node holds an already-planned subtree; rule passes do not descend into it.
    [[nodiscard]] virtual bool sealed() const noexcept { return false; }
};

struct LogicalOperator {
    explicit LogicalOperator(LogicalOperatorKind kind) noexcept : kind(kind) {}
    LogicalOperator(const LogicalOperator&) = delete;
    LogicalOperator& operator=(const LogicalOperator&) = delete;
    virtual ~LogicalOperator() = default;

    void accept(LogicalOperatorVisitor& visitor) const;

    [[nodiscard]] virtual const LogicalSchema& schema() const noexcept = 0;
    [[nodiscard]] std::vector<const LogicalOperator*> children() const;

    LogicalOperatorKind kind;
};

struct LogicalTableScan final : LogicalOperator {
    LogicalTableScan() noexcept : LogicalOperator(LogicalOperatorKind::TableScan) {}

    [[nodiscard]] const LogicalSchema& schema() const noexcept override { return output_schema; }

    std::string table_name{};
    LogicalSchema output_schema{};
};

struct LogicalProjection final : LogicalOperator {
    LogicalProjection() noexcept : LogicalOperator(LogicalOperatorKind::Projection) {}

    [[nodiscard]] const LogicalSchema& schema() const noexcept override { return output_schema; }

    std::vector<ExpressionPtr> expressions{};
    LogicalOperatorPtr input{};
    LogicalSchema output_schema{};
};

struct LogicalFilter final : LogicalOperator {
    LogicalFilter() noexcept : LogicalOperator(LogicalOperatorKind::Filter) {}

    [[nodiscard]] const LogicalSchema& schema() const noexcept override;

    ExpressionPtr predicate{};
    LogicalOperatorPtr input{};
};

// Windowed aggregates emit a trailing `_timestamp`; unwindowed ones emit the
// updating-meta field because their output is a change stream.
struct LogicalAggregate final : LogicalOperator {
    LogicalAggregate() noexcept : LogicalOperator(LogicalOperatorKind::Aggregate) {}

    [[nodiscard]] const LogicalSchema& schema() const noexcept override { return output_schema; }

    std::optional<WindowType> window{};
    std::vector<ExpressionPtr> group_expressions{};
    std::vector<ExpressionPtr> aggregate_expressions{};
    LogicalOperatorPtr input{};
    LogicalSchema output_schema{};
};

struct JoinOn final {
    ExpressionPtr left{};
    ExpressionPtr right{};
};

struct LogicalJoin final : LogicalOperator {
    LogicalJoin() noexcept : LogicalOperator(LogicalOperatorKind::Join) {}

    [[nodiscard]] const LogicalSchema& schema() const noexcept override { return output_schema; }

    LogicalOperatorPtr left{};
    LogicalOperatorPtr right{};
    std::vector<JoinOn> on{};
    ExpressionPtr filter{};
    JoinType join_type = JoinType::Inner;
    JoinConstraint join_constraint = JoinConstraint::On;
    bool null_equals_null = false;
    LogicalSchema output_schema{};
};

struct LogicalExtension final : LogicalOperator {
    LogicalExtension() noexcept : LogicalOperator(LogicalOperatorKind::Extension) {}

    [[nodiscard]] const LogicalSchema& schema() const noexcept override;

    std::unique_ptr<ExtensionNode> node{};
};

struct JoinSpec final {
    std::vector<JoinOn> on{};
    ExpressionPtr filter{};
    JoinType join_type = JoinType::Inner;
    JoinConstraint join_constraint = JoinConstraint::On;
    bool null_equals_null = false;
};

[[nodiscard]] PlanResult<LogicalSchema> build_join_schema(const LogicalSchema& left,
                                                          const LogicalSchema& right,
                                                          JoinType join_type);

// Every field of `fields` is qualified with `qualifier`.
[[nodiscard]] PlanResult<LogicalOperatorPtr> make_table_scan(std::string table_name,
                                                             std::string qualifier,
                                                             std::vector<QualifiedField> fields,
                                                             FieldMetadata metadata = {});
[[nodiscard]] PlanResult<LogicalOperatorPtr> make_projection(std::vector<ExpressionPtr> expressions,
                                                             LogicalOperatorPtr input);
[[nodiscard]] PlanResult<LogicalOperatorPtr> make_projection_with_schema(std::vector<ExpressionPtr> expressions,
                                                                         LogicalOperatorPtr input,
                                                                         LogicalSchema schema);
// Re-qualifies every input column with `alias`.
[[nodiscard]] PlanResult<LogicalOperatorPtr> make_subquery_alias(LogicalOperatorPtr input, std::string alias);
[[nodiscard]] PlanResult<LogicalOperatorPtr> make_filter(ExpressionPtr predicate, LogicalOperatorPtr input);
[[nodiscard]] PlanResult<LogicalOperatorPtr> make_aggregate(std::optional<WindowType> window,
                                                            std::vector<ExpressionPtr> group_expressions,
                                                            std::vector<ExpressionPtr> aggregate_expressions,
                                                            LogicalOperatorPtr input);
[[nodiscard]] PlanResult<LogicalOperatorPtr> make_join(LogicalOperatorPtr left,
                                                       LogicalOperatorPtr right,
                                                       JoinSpec spec);
[[nodiscard]] LogicalOperatorPtr make_extension(std::unique_ptr<ExtensionNode> node);

// Detaches the children of `node` (extension inputs included), in order.
std::vector<LogicalOperatorPtr> take_children(LogicalOperator& node);
// Re-attaches `children` to a node whose children were taken, re-deriving join schemas.
[[nodiscard]] PlanResult<LogicalOperatorPtr> with_new_children(LogicalOperatorPtr node,
                                                               std::vector<LogicalOperatorPtr> children);

[[nodiscard]] std::size_t count_nodes(const LogicalOperator& root);

}  // namespace tributary::planner
