#include "tributary/planner/logical_expression.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tributary::planner {

namespace {

constexpr std::array<std::string_view, 4> kAggregateFunctions{"count", "sum", "min", "max"};

std::string join_arguments(const std::vector<ExpressionPtr>& arguments)
{
    std::ostringstream stream;
    bool first = true;
    for (const auto& argument : arguments) {
        if (!first) {
            stream << ", ";
        }
        stream << (argument ? display_name(*argument) : std::string{"<null>"});
        first = false;
    }
    return stream.str();
}

void require_operand(const ExpressionPtr& expression, const char* what)
{
    if (!expression) {
        throw std::invalid_argument{what};
    }
}

bool optional_expressions_equal(const ExpressionPtr& lhs, const ExpressionPtr& rhs)
{
    if (!lhs || !rhs) {
        return !lhs && !rhs;
    }
    return expressions_equal(*lhs, *rhs);
}

bool expression_lists_equal(const std::vector<ExpressionPtr>& lhs, const std::vector<ExpressionPtr>& rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0U; index < lhs.size(); ++index) {
        if (!optional_expressions_equal(lhs[index], rhs[index])) {
            return false;
        }
    }
    return true;
}

void collect_columns(const Expression& expression, std::vector<ColumnReference>& output)
{
    switch (expression.kind) {
    case ExpressionKind::Column: {
        const auto& column = static_cast<const ColumnExpression&>(expression).column;
        if (std::find(output.begin(), output.end(), column) == output.end()) {
            output.push_back(column);
        }
        break;
    }
    case ExpressionKind::Literal:
        break;
    case ExpressionKind::Binary: {
        const auto& binary_expression = static_cast<const BinaryExpression&>(expression);
        collect_columns(*binary_expression.left, output);
        collect_columns(*binary_expression.right, output);
        break;
    }
    case ExpressionKind::Case: {
        const auto& case_expression = static_cast<const CaseExpression&>(expression);
        if (case_expression.operand) {
            collect_columns(*case_expression.operand, output);
        }
        for (const auto& branch : case_expression.branches) {
            collect_columns(*branch.when, output);
            collect_columns(*branch.then, output);
        }
        if (case_expression.else_expression) {
            collect_columns(*case_expression.else_expression, output);
        }
        break;
    }
    case ExpressionKind::ScalarFunction: {
        for (const auto& argument : static_cast<const ScalarFunctionExpression&>(expression).arguments) {
            collect_columns(*argument, output);
        }
        break;
    }
    case ExpressionKind::Alias:
        collect_columns(*static_cast<const AliasExpression&>(expression).expression, output);
        break;
    }
}

QualifiedField unnamed_field(const Expression& expression, DataType type, bool nullable)
{
    QualifiedField field{};
    field.name = display_name(expression);
    field.type = type;
    field.nullable = nullable;
    return field;
}

PlanResult<QualifiedField> infer_case(const CaseExpression& expression, const LogicalSchema& input)
{
    if (expression.operand) {
        auto operand = infer_field(*expression.operand, input);
        if (!operand.success()) {
            return operand;
        }
    }

    DataType type = DataType::Null;
    bool nullable = !expression.else_expression;
    for (const auto& branch : expression.branches) {
        auto when = infer_field(*branch.when, input);
        if (!when.success()) {
            return when;
        }
        auto then = infer_field(*branch.then, input);
        if (!then.success()) {
            return then;
        }
        if (type == DataType::Null) {
            type = then.value->type;
        }
        nullable = nullable || then.value->nullable;
    }

    if (expression.else_expression) {
        auto otherwise = infer_field(*expression.else_expression, input);
        if (!otherwise.success()) {
            return otherwise;
        }
        if (type == DataType::Null) {
            type = otherwise.value->type;
        }
        nullable = nullable || otherwise.value->nullable;
    }

    return PlanResult<QualifiedField>::ok(unnamed_field(expression, type, nullable));
}

PlanResult<QualifiedField> infer_function(const ScalarFunctionExpression& expression, const LogicalSchema& input)
{
    std::vector<QualifiedField> arguments;
    arguments.reserve(expression.arguments.size());
    for (const auto& argument : expression.arguments) {
        auto field = infer_field(*argument, input);
        if (!field.success()) {
            return field;
        }
        arguments.push_back(std::move(*field.value));
    }

    if (expression.name == "coalesce") {
        if (arguments.empty()) {
            return PlanResult<QualifiedField>::failure(make_plan_diagnostic(
                PlanErrc::UpstreamConstruction, "coalesce requires at least one argument"));
        }
        DataType type = DataType::Null;
        bool nullable = true;
        for (const auto& argument : arguments) {
            if (type == DataType::Null) {
                type = argument.type;
            }
            nullable = nullable && argument.nullable;
        }
        return PlanResult<QualifiedField>::ok(unnamed_field(expression, type, nullable));
    }

    if (!is_aggregate_function(expression.name)) {
        return PlanResult<QualifiedField>::failure(make_plan_diagnostic(
            PlanErrc::UpstreamConstruction,
            "Unknown function '" + expression.name + "'",
            {"Supported functions are coalesce, count, sum, min and max."}));
    }

    if (expression.name == "count") {
        return PlanResult<QualifiedField>::ok(unnamed_field(expression, DataType::Int64, false));
    }

    if (arguments.size() != 1U) {
        return PlanResult<QualifiedField>::failure(make_plan_diagnostic(
            PlanErrc::UpstreamConstruction,
            "Aggregate function '" + expression.name + "' takes exactly one argument"));
    }
    return PlanResult<QualifiedField>::ok(unnamed_field(expression, arguments.front().type, true));
}

}  // namespace

std::string ColumnReference::flat_name() const
{
    if (!qualifier.has_value()) {
        return name;
    }
    return *qualifier + "." + name;
}

void Expression::accept(ExpressionVisitor& visitor) const
{
    switch (kind) {
    case ExpressionKind::Column:
        visitor.visit(static_cast<const ColumnExpression&>(*this));
        break;
    case ExpressionKind::Literal:
        visitor.visit(static_cast<const LiteralExpression&>(*this));
        break;
    case ExpressionKind::Binary:
        visitor.visit(static_cast<const BinaryExpression&>(*this));
        break;
    case ExpressionKind::Case:
        visitor.visit(static_cast<const CaseExpression&>(*this));
        break;
    case ExpressionKind::ScalarFunction:
        visitor.visit(static_cast<const ScalarFunctionExpression&>(*this));
        break;
    case ExpressionKind::Alias:
        visitor.visit(static_cast<const AliasExpression&>(*this));
        break;
    default:
        break;
    }
}

ExpressionPtr col(std::optional<std::string> qualifier, std::string name)
{
    auto expression = std::make_shared<ColumnExpression>();
    expression->column.qualifier = std::move(qualifier);
    expression->column.name = std::move(name);
    return expression;
}

ExpressionPtr col(const QualifiedField& field)
{
    return col(field.qualifier, field.name);
}

ExpressionPtr lit(ScalarValue value)
{
    auto expression = std::make_shared<LiteralExpression>();
    expression->value = std::move(value);
    return expression;
}

ExpressionPtr binary(ExpressionPtr left, BinaryOperator op, ExpressionPtr right)
{
    require_operand(left, "binary expression requires a left operand");
    require_operand(right, "binary expression requires a right operand");
    auto expression = std::make_shared<BinaryExpression>();
    expression->op = op;
    expression->left = std::move(left);
    expression->right = std::move(right);
    return expression;
}

ExpressionPtr case_when(ExpressionPtr operand,
                        std::vector<CaseExpression::WhenThen> branches,
                        ExpressionPtr else_expression)
{
    if (branches.empty()) {
        throw std::invalid_argument{"CASE expression requires at least one WHEN branch"};
    }
    for (const auto& branch : branches) {
        require_operand(branch.when, "CASE branch requires a WHEN expression");
        require_operand(branch.then, "CASE branch requires a THEN expression");
    }
    auto expression = std::make_shared<CaseExpression>();
    expression->operand = std::move(operand);
    expression->branches = std::move(branches);
    expression->else_expression = std::move(else_expression);
    return expression;
}

ExpressionPtr coalesce(std::vector<ExpressionPtr> arguments)
{
    return call("coalesce", std::move(arguments));
}

ExpressionPtr call(std::string name, std::vector<ExpressionPtr> arguments)
{
    for (const auto& argument : arguments) {
        require_operand(argument, "function call arguments must not be null");
    }
    auto expression = std::make_shared<ScalarFunctionExpression>();
    expression->name = std::move(name);
    expression->arguments = std::move(arguments);
    return expression;
}

ExpressionPtr alias_qualified(ExpressionPtr inner, std::optional<std::string> qualifier, std::string name)
{
    require_operand(inner, "alias requires an expression");
    auto expression = std::make_shared<AliasExpression>();
    expression->expression = std::move(inner);
    expression->qualifier = std::move(qualifier);
    expression->name = std::move(name);
    return expression;
}

std::string binary_operator_symbol(BinaryOperator op)
{
    switch (op) {
    case BinaryOperator::Equal:
        return "=";
    case BinaryOperator::NotEqual:
        return "<>";
    case BinaryOperator::Less:
        return "<";
    case BinaryOperator::LessOrEqual:
        return "<=";
    case BinaryOperator::Greater:
        return ">";
    case BinaryOperator::GreaterOrEqual:
        return ">=";
    case BinaryOperator::Add:
        return "+";
    case BinaryOperator::Subtract:
        return "-";
    case BinaryOperator::And:
        return "AND";
    case BinaryOperator::Or:
        return "OR";
    }
    return "?";
}

bool is_comparison(BinaryOperator op) noexcept
{
    switch (op) {
    case BinaryOperator::Equal:
    case BinaryOperator::NotEqual:
    case BinaryOperator::Less:
    case BinaryOperator::LessOrEqual:
    case BinaryOperator::Greater:
    case BinaryOperator::GreaterOrEqual:
        return true;
    default:
        return false;
    }
}

bool is_aggregate_function(std::string_view name) noexcept
{
    return std::find(kAggregateFunctions.begin(), kAggregateFunctions.end(), name) != kAggregateFunctions.end();
}

std::string display_name(const Expression& expression)
{
    switch (expression.kind) {
    case ExpressionKind::Column:
        return static_cast<const ColumnExpression&>(expression).column.flat_name();
    case ExpressionKind::Literal:
        return static_cast<const LiteralExpression&>(expression).value.to_string();
    case ExpressionKind::Binary: {
        const auto& binary_expression = static_cast<const BinaryExpression&>(expression);
        std::ostringstream stream;
        stream << '(' << display_name(*binary_expression.left) << ' '
               << binary_operator_symbol(binary_expression.op) << ' '
               << display_name(*binary_expression.right) << ')';
        return stream.str();
    }
    case ExpressionKind::Case: {
        const auto& case_expression = static_cast<const CaseExpression&>(expression);
        std::ostringstream stream;
        stream << "CASE";
        if (case_expression.operand) {
            stream << ' ' << display_name(*case_expression.operand);
        }
        for (const auto& branch : case_expression.branches) {
            stream << " WHEN " << display_name(*branch.when) << " THEN " << display_name(*branch.then);
        }
        if (case_expression.else_expression) {
            stream << " ELSE " << display_name(*case_expression.else_expression);
        }
        stream << " END";
        return stream.str();
    }
    case ExpressionKind::ScalarFunction: {
        const auto& function = static_cast<const ScalarFunctionExpression&>(expression);
        return function.name + "(" + join_arguments(function.arguments) + ")";
    }
    case ExpressionKind::Alias: {
        const auto& alias = static_cast<const AliasExpression&>(expression);
        ColumnReference target{alias.qualifier, alias.name};
        return display_name(*alias.expression) + " AS " + target.flat_name();
    }
    }
    return "<expression>";
}

bool expressions_equal(const Expression& lhs, const Expression& rhs)
{
    if (&lhs == &rhs) {
        return true;
    }
    if (lhs.kind != rhs.kind) {
        return false;
    }

    switch (lhs.kind) {
    case ExpressionKind::Column:
        return static_cast<const ColumnExpression&>(lhs).column == static_cast<const ColumnExpression&>(rhs).column;
    case ExpressionKind::Literal:
        return static_cast<const LiteralExpression&>(lhs).value == static_cast<const LiteralExpression&>(rhs).value;
    case ExpressionKind::Binary: {
        const auto& left = static_cast<const BinaryExpression&>(lhs);
        const auto& right = static_cast<const BinaryExpression&>(rhs);
        return left.op == right.op && optional_expressions_equal(left.left, right.left) &&
               optional_expressions_equal(left.right, right.right);
    }
    case ExpressionKind::Case: {
        const auto& left = static_cast<const CaseExpression&>(lhs);
        const auto& right = static_cast<const CaseExpression&>(rhs);
        if (left.branches.size() != right.branches.size()) {
            return false;
        }
        for (std::size_t index = 0U; index < left.branches.size(); ++index) {
            if (!optional_expressions_equal(left.branches[index].when, right.branches[index].when) ||
                !optional_expressions_equal(left.branches[index].then, right.branches[index].then)) {
                return false;
            }
        }
        return optional_expressions_equal(left.operand, right.operand) &&
               optional_expressions_equal(left.else_expression, right.else_expression);
    }
    case ExpressionKind::ScalarFunction: {
        const auto& left = static_cast<const ScalarFunctionExpression&>(lhs);
        const auto& right = static_cast<const ScalarFunctionExpression&>(rhs);
        return left.name == right.name && expression_lists_equal(left.arguments, right.arguments);
    }
    case ExpressionKind::Alias: {
        const auto& left = static_cast<const AliasExpression&>(lhs);
        const auto& right = static_cast<const AliasExpression&>(rhs);
        return left.qualifier == right.qualifier && left.name == right.name &&
               optional_expressions_equal(left.expression, right.expression);
    }
    }
    return false;
}

std::vector<ColumnReference> collect_columns(const Expression& expression)
{
    std::vector<ColumnReference> columns;
    collect_columns(expression, columns);
    return columns;
}

PlanResult<QualifiedField> infer_field(const Expression& expression, const LogicalSchema& input)
{
    switch (expression.kind) {
    case ExpressionKind::Column: {
        const auto& column = static_cast<const ColumnExpression&>(expression).column;
        auto index = input.index_of(column.qualifier, column.name);
        if (!index.success()) {
            return PlanResult<QualifiedField>::failure(std::move(index.diagnostics));
        }
        return PlanResult<QualifiedField>::ok(input.field(*index.value));
    }
    case ExpressionKind::Literal: {
        const auto& value = static_cast<const LiteralExpression&>(expression).value;
        return PlanResult<QualifiedField>::ok(unnamed_field(expression, value.type(), value.is_null()));
    }
    case ExpressionKind::Binary: {
        const auto& binary_expression = static_cast<const BinaryExpression&>(expression);
        auto left = infer_field(*binary_expression.left, input);
        if (!left.success()) {
            return left;
        }
        auto right = infer_field(*binary_expression.right, input);
        if (!right.success()) {
            return right;
        }
        const bool nullable = left.value->nullable || right.value->nullable;
        const bool boolean_result = is_comparison(binary_expression.op) ||
                                    binary_expression.op == BinaryOperator::And ||
                                    binary_expression.op == BinaryOperator::Or;
        const auto type = boolean_result ? DataType::Boolean : left.value->type;
        return PlanResult<QualifiedField>::ok(unnamed_field(expression, type, nullable));
    }
    case ExpressionKind::Case:
        return infer_case(static_cast<const CaseExpression&>(expression), input);
    case ExpressionKind::ScalarFunction:
        return infer_function(static_cast<const ScalarFunctionExpression&>(expression), input);
    case ExpressionKind::Alias: {
        const auto& alias = static_cast<const AliasExpression&>(expression);
        auto inner = infer_field(*alias.expression, input);
        if (!inner.success()) {
            return inner;
        }
        auto field = std::move(*inner.value);
        field.qualifier = alias.qualifier;
        field.name = alias.name;
        return PlanResult<QualifiedField>::ok(std::move(field));
    }
    }
    return PlanResult<QualifiedField>::failure(
        make_plan_diagnostic(PlanErrc::UpstreamConstruction, "Unsupported expression kind"));
}

}  // namespace tributary::planner
