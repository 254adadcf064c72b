#include "tributary/planner/rules/join_rewrite_rule.hpp"

#include "tributary/planner/extensions/key_calculation.hpp"
#include "tributary/planner/extensions/streaming_join.hpp"
#include "tributary/planner/planner_context.hpp"
#include "tributary/planner/planner_telemetry.hpp"

#include <stdexcept>
#include <utility>

namespace tributary::planner {

namespace {

PlanResult<bool> reject_shape(std::string message, std::vector<std::string> hints = {})
{
    return PlanResult<bool>::failure(
        make_plan_diagnostic(PlanErrc::UnsupportedJoinShape, std::move(message), std::move(hints)));
}

RuleOutcome failed(std::vector<PlanDiagnostic> diagnostics)
{
    RuleOutcome outcome{};
    outcome.diagnostics = std::move(diagnostics);
    return outcome;
}

RuleOutcome failed(PlanDiagnostic diagnostic)
{
    std::vector<PlanDiagnostic> diagnostics;
    diagnostics.push_back(std::move(diagnostic));
    return failed(std::move(diagnostics));
}

}  // namespace

PlanResult<bool> check_join_windowing(const LogicalJoin& join, const WindowOracle& oracle)
{
    if (!join.left || !join.right) {
        throw std::invalid_argument{"join inputs must not be null"};
    }

    const auto left_window = oracle.find_window(*join.left);
    const auto right_window = oracle.find_window(*join.right);

    if (!left_window.has_value() && !right_window.has_value()) {
        if (join.join_type == JoinType::Inner) {
            return PlanResult<bool>::ok(false);
        }
        return reject_shape("can't handle non-inner joins without windows",
                            {"Window both inputs, or use an inner join."});
    }
    if (!left_window.has_value()) {
        return reject_shape("can't handle mixed windowing between left (non-windowed) and right (windowed).");
    }
    if (!right_window.has_value()) {
        return reject_shape("can't handle mixed windowing between left (windowed) and right (non-windowed).");
    }
    if (*left_window != *right_window) {
        return reject_shape("can't handle mixed windowing between left and right",
                            {"left is " + left_window->describe() + ", right is " + right_window->describe()});
    }
    if (left_window->is_session()) {
        return reject_shape("can't handle session windows in joins");
    }
    return PlanResult<bool>::ok(true);
}

std::optional<PlanDiagnostic> check_updating_inputs(const LogicalSchema& left, const LogicalSchema& right)
{
    if (left.has_column_with_unqualified_name(kUpdatingMetaField)) {
        return make_plan_diagnostic(PlanErrc::UnsupportedUpdatingInput, "can't handle updating left side of join");
    }
    if (right.has_column_with_unqualified_name(kUpdatingMetaField)) {
        return make_plan_diagnostic(PlanErrc::UnsupportedUpdatingInput, "can't handle updating right side of join");
    }
    return std::nullopt;
}

PlanResult<LogicalOperatorPtr> build_keyed_input(LogicalOperatorPtr input,
                                                 const std::vector<ExpressionPtr>& key_expressions,
                                                 std::string side)
{
    if (!input) {
        throw std::invalid_argument{"keyed input must not be null"};
    }

    std::vector<ExpressionPtr> expressions;
    expressions.reserve(key_expressions.size() + input->schema().size());
    for (std::size_t index = 0U; index < key_expressions.size(); ++index) {
        expressions.push_back(
            alias_qualified(key_expressions[index], std::string{kInternalQualifier}, key_field_name(index)));
    }
    for (const auto& field : input->schema().fields()) {
        expressions.push_back(col(field.qualifier, field.name));
    }

    auto projection = make_projection(std::move(expressions), std::move(input));
    if (!projection.success()) {
        return projection;
    }

    std::vector<std::size_t> keys;
    keys.reserve(key_expressions.size());
    for (std::size_t index = 0U; index < key_expressions.size(); ++index) {
        keys.push_back(index);
    }

    auto node = KeyCalculationNode::try_new(std::move(*projection.value), std::move(keys), std::move(side), true);
    if (!node.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(node.diagnostics));
    }
    return PlanResult<LogicalOperatorPtr>::ok(make_extension(std::move(*node.value)));
}

PlanResult<LogicalOperatorPtr> merge_join_timestamps(LogicalOperatorPtr joined)
{
    if (!joined) {
        throw std::invalid_argument{"joined input must not be null"};
    }

    const auto& schema = joined->schema();
    const auto timestamp_indices = schema.indices_with_unqualified_name(kTimestampField);
    if (timestamp_indices.size() != 2U) {
        return PlanResult<LogicalOperatorPtr>::failure(make_plan_diagnostic(
            PlanErrc::MalformedTimestamps,
            "join must have two timestamp fields",
            {"found " + std::to_string(timestamp_indices.size()) + " '_timestamp' fields"}));
    }

    std::vector<QualifiedField> fields;
    std::vector<ExpressionPtr> expressions;
    fields.reserve(schema.size() - 1U);
    expressions.reserve(schema.size() - 1U);
    for (const auto& field : schema.fields()) {
        if (field.name == kTimestampField) {
            continue;
        }
        fields.push_back(field);
        expressions.push_back(col(field.qualifier, field.name));
    }

    const auto& left_timestamp = schema.field(timestamp_indices[0]);
    const auto& right_timestamp = schema.field(timestamp_indices[1]);
    fields.push_back(left_timestamp);

    const auto left_column = col(left_timestamp.qualifier, left_timestamp.name);
    const auto right_column = col(right_timestamp.qualifier, right_timestamp.name);
    auto latest = case_when(binary(left_column, BinaryOperator::GreaterOrEqual, right_column),
                            {{lit(ScalarValue::boolean(true)), left_column},
                             {lit(ScalarValue::boolean(false)), right_column}},
                            coalesce({left_column, right_column}));
    expressions.push_back(alias_qualified(std::move(latest), left_timestamp.qualifier, left_timestamp.name));

    auto output_schema = LogicalSchema::try_new(std::move(fields), schema.metadata());
    if (!output_schema.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(output_schema.diagnostics));
    }
    return make_projection_with_schema(std::move(expressions), std::move(joined), std::move(*output_schema.value));
}

RuleOutcome rewrite_join(const PlannerContext& context, LogicalOperatorPtr& node)
{
    if (!node || node->kind != LogicalOperatorKind::Join) {
        return {};
    }

    auto& join = static_cast<LogicalJoin&>(*node);

    auto windowing = check_join_windowing(join, context.window_oracle());
    if (!windowing.success()) {
        return failed(std::move(windowing.diagnostics));
    }
    const bool is_instant = *windowing.value;

    if (join.join_constraint != JoinConstraint::On) {
        return failed(make_plan_diagnostic(PlanErrc::UnsupportedJoinShape,
                                           "can't handle join constraint other than ON",
                                           {"Rewrite USING as an ON equality."}));
    }
    if (join.null_equals_null) {
        return failed(make_plan_diagnostic(PlanErrc::UnsupportedJoinShape, "can't handle null-equals-null joins"));
    }

    if (auto rejection = check_updating_inputs(join.left->schema(), join.right->schema())) {
        return failed(std::move(*rejection));
    }

    if (join.on.empty() && !is_instant) {
        return failed(make_plan_diagnostic(PlanErrc::MissingEquijoin,
                                           "Updating joins must include an equijoin condition",
                                           {"Add an equality between the two inputs to the ON clause."}));
    }

    std::vector<ExpressionPtr> left_keys;
    std::vector<ExpressionPtr> right_keys;
    left_keys.reserve(join.on.size());
    right_keys.reserve(join.on.size());
    for (const auto& pair : join.on) {
        left_keys.push_back(pair.left);
        right_keys.push_back(pair.right);
    }

    JoinSpec spec{};
    spec.on = std::move(join.on);
    spec.filter = std::move(join.filter);
    spec.join_type = join.join_type;
    spec.join_constraint = JoinConstraint::On;
    spec.null_equals_null = false;

    auto left_input = build_keyed_input(std::move(join.left), left_keys, "left");
    if (!left_input.success()) {
        return failed(std::move(left_input.diagnostics));
    }
    auto right_input = build_keyed_input(std::move(join.right), right_keys, "right");
    if (!right_input.success()) {
        return failed(std::move(right_input.diagnostics));
    }

    auto rewritten_join = make_join(std::move(*left_input.value), std::move(*right_input.value), std::move(spec));
    if (!rewritten_join.success()) {
        return failed(std::move(rewritten_join.diagnostics));
    }

    auto merged = merge_join_timestamps(std::move(*rewritten_join.value));
    if (!merged.success()) {
        return failed(std::move(merged.diagnostics));
    }

    std::optional<std::chrono::microseconds> ttl{};
    if (!is_instant) {
        ttl = context.planning_options().ttl;
    }
    node = make_extension(std::make_unique<StreamingJoinNode>(std::move(*merged.value), is_instant, ttl));

    if (auto* telemetry = context.telemetry()) {
        telemetry->record_join_rewrite(is_instant);
    }

    RuleOutcome outcome{};
    outcome.transformed = true;
    return outcome;
}

std::shared_ptr<Rule> make_streaming_join_rule()
{
    return std::make_shared<Rule>(
        kStreamingJoinRuleName,
        std::vector<LogicalOperatorKind>{LogicalOperatorKind::Join},
        RuleCategory::StreamingJoin,
        [](const RuleContext& context, LogicalOperatorPtr& root) -> RuleOutcome {
            if (context.planner_context() == nullptr) {
                throw std::invalid_argument{"streaming join rewrite requires a planner context"};
            }
            return rewrite_join(*context.planner_context(), root);
        });
}

}  // namespace tributary::planner
