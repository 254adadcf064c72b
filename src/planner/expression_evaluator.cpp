#include "tributary/planner/expression_evaluator.hpp"

#include "tributary/planner/logical_plan.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tributary::planner {

namespace {

using ValueResult = PlanResult<ScalarValue>;

constexpr std::int64_t kNanosPerMicro = 1000;

ValueResult evaluation_error(std::string message)
{
    return ValueResult::failure(make_plan_diagnostic(PlanErrc::EvaluationFailed, std::move(message)));
}

ValueResult evaluate_node(const Expression& expression, const LogicalSchema& schema, const Row& row);

std::optional<bool> truth_value(const ScalarValue& value)
{
    return value.as_boolean();
}

bool is_boolean_or_null(const ScalarValue& value) noexcept
{
    return value.type() == DataType::Boolean || value.type() == DataType::Null || value.is_null();
}

long double numeric_value(const ScalarValue& value)
{
    return std::visit(
        [](const auto& payload) -> long double {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t> ||
                          std::is_same_v<T, double>) {
                return static_cast<long double>(payload);
            } else {
                return 0.0L;
            }
        },
        value.payload());
}

ValueResult evaluate_logical(BinaryOperator op, const ScalarValue& left, const ScalarValue& right)
{
    if (!is_boolean_or_null(left) || !is_boolean_or_null(right)) {
        return evaluation_error("Operator " + binary_operator_symbol(op) + " requires Boolean operands, got " +
                                data_type_name(left.type()) + " and " + data_type_name(right.type()));
    }

    const auto lhs = truth_value(left);
    const auto rhs = truth_value(right);
    if (op == BinaryOperator::And) {
        if ((lhs.has_value() && !*lhs) || (rhs.has_value() && !*rhs)) {
            return ValueResult::ok(ScalarValue::boolean(false));
        }
        if (!lhs.has_value() || !rhs.has_value()) {
            return ValueResult::ok(ScalarValue::null(DataType::Boolean));
        }
        return ValueResult::ok(ScalarValue::boolean(true));
    }

    if ((lhs.has_value() && *lhs) || (rhs.has_value() && *rhs)) {
        return ValueResult::ok(ScalarValue::boolean(true));
    }
    if (!lhs.has_value() || !rhs.has_value()) {
        return ValueResult::ok(ScalarValue::null(DataType::Boolean));
    }
    return ValueResult::ok(ScalarValue::boolean(false));
}

ValueResult evaluate_comparison(BinaryOperator op, const ScalarValue& left, const ScalarValue& right)
{
    if (left.is_null() || right.is_null()) {
        return ValueResult::ok(ScalarValue::null(DataType::Boolean));
    }

    const auto ordering = left.compare(right);
    if (!ordering.has_value()) {
        return evaluation_error("Cannot compare " + data_type_name(left.type()) + " with " +
                                data_type_name(right.type()));
    }

    const int cmp = *ordering;
    switch (op) {
    case BinaryOperator::Equal:
        return ValueResult::ok(ScalarValue::boolean(cmp == 0));
    case BinaryOperator::NotEqual:
        return ValueResult::ok(ScalarValue::boolean(cmp != 0));
    case BinaryOperator::Less:
        return ValueResult::ok(ScalarValue::boolean(cmp < 0));
    case BinaryOperator::LessOrEqual:
        return ValueResult::ok(ScalarValue::boolean(cmp <= 0));
    case BinaryOperator::Greater:
        return ValueResult::ok(ScalarValue::boolean(cmp > 0));
    case BinaryOperator::GreaterOrEqual:
        return ValueResult::ok(ScalarValue::boolean(cmp >= 0));
    default:
        break;
    }
    return evaluation_error("Operator " + binary_operator_symbol(op) + " is not a comparison");
}

std::optional<std::int64_t> checked_add(std::int64_t lhs, std::int64_t rhs) noexcept
{
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if ((rhs > 0 && lhs > max - rhs) || (rhs < 0 && lhs < min - rhs)) {
        return std::nullopt;
    }
    return lhs + rhs;
}

std::optional<std::int64_t> checked_subtract(std::int64_t lhs, std::int64_t rhs) noexcept
{
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if ((rhs < 0 && lhs > max + rhs) || (rhs > 0 && lhs < min + rhs)) {
        return std::nullopt;
    }
    return lhs - rhs;
}

std::optional<std::int64_t> checked_combine(bool subtract, std::int64_t lhs, std::int64_t rhs) noexcept
{
    return subtract ? checked_subtract(lhs, rhs) : checked_add(lhs, rhs);
}

// Int64 view of an integer payload; empty for UInt64 values above INT64_MAX.
std::optional<std::int64_t> signed_value(const ScalarValue& value) noexcept
{
    if (const auto* signed_payload = std::get_if<std::int64_t>(&value.payload())) {
        return *signed_payload;
    }
    if (const auto* unsigned_payload = std::get_if<std::uint64_t>(&value.payload())) {
        if (*unsigned_payload > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(*unsigned_payload);
    }
    return std::nullopt;
}

ValueResult overflow_error(BinaryOperator op, DataType type)
{
    return evaluation_error("Operator " + binary_operator_symbol(op) + " overflows " + data_type_name(type));
}

ValueResult evaluate_arithmetic(BinaryOperator op, const ScalarValue& left, const ScalarValue& right)
{
    const bool subtract = op == BinaryOperator::Subtract;
    if (left.is_null() || right.is_null()) {
        return ValueResult::ok(ScalarValue::null(left.type()));
    }

    const auto lhs_type = left.type();
    const auto rhs_type = right.type();

    if (lhs_type == DataType::Timestamp && rhs_type == DataType::Duration) {
        const auto base = std::get<std::int64_t>(left.payload());
        const auto micros = std::get<std::int64_t>(right.payload());
        constexpr auto limit = std::numeric_limits<std::int64_t>::max() / kNanosPerMicro;
        if (micros > limit || micros < -limit) {
            return overflow_error(op, DataType::Timestamp);
        }
        const auto nanos = checked_combine(subtract, base, micros * kNanosPerMicro);
        if (!nanos.has_value()) {
            return overflow_error(op, DataType::Timestamp);
        }
        return ValueResult::ok(ScalarValue::timestamp(*nanos));
    }
    if (lhs_type == DataType::Timestamp && rhs_type == DataType::Timestamp && subtract) {
        const auto nanos =
            checked_subtract(std::get<std::int64_t>(left.payload()), std::get<std::int64_t>(right.payload()));
        if (!nanos.has_value()) {
            return overflow_error(op, DataType::Duration);
        }
        return ValueResult::ok(ScalarValue::duration(std::chrono::microseconds{*nanos / kNanosPerMicro}));
    }
    if (lhs_type == DataType::Duration && rhs_type == DataType::Duration) {
        const auto micros =
            checked_combine(subtract, std::get<std::int64_t>(left.payload()), std::get<std::int64_t>(right.payload()));
        if (!micros.has_value()) {
            return overflow_error(op, DataType::Duration);
        }
        return ValueResult::ok(ScalarValue::duration(std::chrono::microseconds{*micros}));
    }

    if (!is_numeric(lhs_type) || !is_numeric(rhs_type)) {
        return evaluation_error("Operator " + binary_operator_symbol(op) + " is not defined for " +
                                data_type_name(lhs_type) + " and " + data_type_name(rhs_type));
    }

    if (lhs_type == DataType::Float64 || rhs_type == DataType::Float64) {
        const auto lhs = static_cast<double>(numeric_value(left));
        const auto rhs = static_cast<double>(numeric_value(right));
        return ValueResult::ok(ScalarValue::float64(subtract ? lhs - rhs : lhs + rhs));
    }
    if (lhs_type == DataType::UInt64 && rhs_type == DataType::UInt64) {
        const auto lhs = std::get<std::uint64_t>(left.payload());
        const auto rhs = std::get<std::uint64_t>(right.payload());
        if (subtract && rhs > lhs) {
            return evaluation_error("UInt64 subtraction underflows");
        }
        if (!subtract && lhs > std::numeric_limits<std::uint64_t>::max() - rhs) {
            return overflow_error(op, DataType::UInt64);
        }
        return ValueResult::ok(ScalarValue::uint64(subtract ? lhs - rhs : lhs + rhs));
    }

    const auto lhs = signed_value(left);
    const auto rhs = signed_value(right);
    if (!lhs.has_value() || !rhs.has_value()) {
        return evaluation_error("Operator " + binary_operator_symbol(op) + " has a UInt64 operand above INT64 range");
    }
    const auto result = checked_combine(subtract, *lhs, *rhs);
    if (!result.has_value()) {
        return overflow_error(op, DataType::Int64);
    }
    return ValueResult::ok(ScalarValue::int64(*result));
}

ValueResult evaluate_binary(const BinaryExpression& expression, const LogicalSchema& schema, const Row& row)
{
    auto left = evaluate_node(*expression.left, schema, row);
    if (!left.success()) {
        return left;
    }
    auto right = evaluate_node(*expression.right, schema, row);
    if (!right.success()) {
        return right;
    }

    switch (expression.op) {
    case BinaryOperator::And:
    case BinaryOperator::Or:
        return evaluate_logical(expression.op, *left.value, *right.value);
    case BinaryOperator::Add:
    case BinaryOperator::Subtract:
        return evaluate_arithmetic(expression.op, *left.value, *right.value);
    default:
        return evaluate_comparison(expression.op, *left.value, *right.value);
    }
}

ValueResult evaluate_case(const CaseExpression& expression, const LogicalSchema& schema, const Row& row)
{
    std::optional<ScalarValue> operand{};
    if (expression.operand) {
        auto value = evaluate_node(*expression.operand, schema, row);
        if (!value.success()) {
            return value;
        }
        operand = std::move(*value.value);
    }

    for (const auto& branch : expression.branches) {
        auto when = evaluate_node(*branch.when, schema, row);
        if (!when.success()) {
            return when;
        }

        bool matched = false;
        if (operand.has_value()) {
            // A NULL operand or WHEN value never matches.
            if (!operand->is_null() && !when.value->is_null()) {
                const auto ordering = operand->compare(*when.value);
                if (!ordering.has_value()) {
                    return evaluation_error("CASE operand of type " + data_type_name(operand->type()) +
                                            " cannot be matched against " + data_type_name(when.value->type()));
                }
                matched = *ordering == 0;
            }
        } else {
            if (!is_boolean_or_null(*when.value)) {
                return evaluation_error("CASE WHEN condition must be Boolean, got " +
                                        data_type_name(when.value->type()));
            }
            matched = truth_value(*when.value).value_or(false);
        }

        if (matched) {
            return evaluate_node(*branch.then, schema, row);
        }
    }

    if (expression.else_expression) {
        return evaluate_node(*expression.else_expression, schema, row);
    }
    return ValueResult::ok(ScalarValue::null());
}

ValueResult evaluate_function(const ScalarFunctionExpression& expression, const LogicalSchema& schema, const Row& row)
{
    if (is_aggregate_function(expression.name)) {
        return evaluation_error("Aggregate function '" + expression.name + "' cannot be evaluated on a single row");
    }
    if (expression.name != "coalesce") {
        return evaluation_error("Unknown function '" + expression.name + "'");
    }

    std::optional<ScalarValue> first_null{};
    for (const auto& argument : expression.arguments) {
        auto value = evaluate_node(*argument, schema, row);
        if (!value.success()) {
            return value;
        }
        if (!value.value->is_null()) {
            return value;
        }
        if (!first_null.has_value()) {
            first_null = std::move(*value.value);
        }
    }
    return ValueResult::ok(first_null.value_or(ScalarValue::null()));
}

ValueResult evaluate_node(const Expression& expression, const LogicalSchema& schema, const Row& row)
{
    switch (expression.kind) {
    case ExpressionKind::Column: {
        const auto& column = static_cast<const ColumnExpression&>(expression).column;
        auto index = schema.index_of(column.qualifier, column.name);
        if (!index.success()) {
            return ValueResult::failure(std::move(index.diagnostics));
        }
        return ValueResult::ok(row[*index.value]);
    }
    case ExpressionKind::Literal:
        return ValueResult::ok(static_cast<const LiteralExpression&>(expression).value);
    case ExpressionKind::Binary:
        return evaluate_binary(static_cast<const BinaryExpression&>(expression), schema, row);
    case ExpressionKind::Case:
        return evaluate_case(static_cast<const CaseExpression&>(expression), schema, row);
    case ExpressionKind::ScalarFunction:
        return evaluate_function(static_cast<const ScalarFunctionExpression&>(expression), schema, row);
    case ExpressionKind::Alias:
        return evaluate_node(*static_cast<const AliasExpression&>(expression).expression, schema, row);
    }
    return evaluation_error("Unsupported expression '" + display_name(expression) + "'");
}

}  // namespace

PlanResult<ScalarValue> evaluate(const Expression& expression, const LogicalSchema& schema, const Row& row)
{
    if (row.size() != schema.size()) {
        return evaluation_error("Row has " + std::to_string(row.size()) + " values but the schema has " +
                                std::to_string(schema.size()) + " fields");
    }
    return evaluate_node(expression, schema, row);
}

PlanResult<Row> evaluate_projection(const LogicalProjection& projection, const Row& row)
{
    if (!projection.input) {
        throw std::invalid_argument{"projection input must not be null"};
    }

    Row output;
    output.reserve(projection.expressions.size());
    for (const auto& expression : projection.expressions) {
        auto value = evaluate(*expression, projection.input->schema(), row);
        if (!value.success()) {
            return PlanResult<Row>::failure(std::move(value.diagnostics));
        }
        output.push_back(std::move(*value.value));
    }
    return PlanResult<Row>::ok(std::move(output));
}

}  // namespace tributary::planner
