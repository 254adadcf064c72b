#pragma once

#include "tributary/planner/data_type.hpp"
#include "tributary/planner/logical_schema.hpp"
#include "tributary/planner/plan_errors.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tributary::planner {

enum class ExpressionKind : std::uint8_t {
    Column = 0,
    Literal,
    Binary,
    Case,
    ScalarFunction,
    Alias
};

enum class BinaryOperator : std::uint8_t {
    Equal = 0,
    NotEqual,
    Less,
    LessOrEqual,
    Greater,
    GreaterOrEqual,
    Add,
    Subtract,
    And,
    Or
};

struct Expression;
struct ColumnExpression;
struct LiteralExpression;
struct BinaryExpression;
struct CaseExpression;
struct ScalarFunctionExpression;
struct AliasExpression;

using ExpressionPtr = std::shared_ptr<const Expression>;

class ExpressionVisitor {
public:
    virtual ~ExpressionVisitor() = default;
    virtual void visit(const ColumnExpression& expression) = 0;
    virtual void visit(const LiteralExpression& expression) = 0;
    virtual void visit(const BinaryExpression& expression) = 0;
    virtual void visit(const CaseExpression& expression) = 0;
    virtual void visit(const ScalarFunctionExpression& expression) = 0;
    virtual void visit(const AliasExpression& expression) = 0;
};

struct ColumnReference final {
    std::optional<std::string> qualifier{};
    std::string name{};

    [[nodiscard]] std::string flat_name() const;

    bool operator==(const ColumnReference& other) const = default;
};

struct Expression {
    explicit Expression(ExpressionKind kind) noexcept : kind(kind) {}
    Expression(const Expression&) = delete;
    Expression& operator=(const Expression&) = delete;
    virtual ~Expression() = default;

    void accept(ExpressionVisitor& visitor) const;

    ExpressionKind kind;
};

struct ColumnExpression final : Expression {
    ColumnExpression() noexcept : Expression(ExpressionKind::Column) {}

    ColumnReference column{};
};

struct LiteralExpression final : Expression {
    LiteralExpression() noexcept : Expression(ExpressionKind::Literal) {}

    ScalarValue value{};
};

struct BinaryExpression final : Expression {
    BinaryExpression() noexcept : Expression(ExpressionKind::Binary) {}

    BinaryOperator op = BinaryOperator::Equal;
    ExpressionPtr left{};
    ExpressionPtr right{};
};

// CASE [operand] WHEN .. THEN .. [ELSE ..] END. With an operand, WHEN values are
// matched by equality against it; without one, each WHEN is a predicate.
struct CaseExpression final : Expression {
    struct WhenThen final {
        ExpressionPtr when{};
        ExpressionPtr then{};
    };

    CaseExpression() noexcept : Expression(ExpressionKind::Case) {}

    ExpressionPtr operand{};
    std::vector<WhenThen> branches{};
    ExpressionPtr else_expression{};
};

struct ScalarFunctionExpression final : Expression {
    ScalarFunctionExpression() noexcept : Expression(ExpressionKind::ScalarFunction) {}

    std::string name{};
    std::vector<ExpressionPtr> arguments{};
};

struct AliasExpression final : Expression {
    AliasExpression() noexcept : Expression(ExpressionKind::Alias) {}

    ExpressionPtr expression{};
    std::optional<std::string> qualifier{};
    std::string name{};
};

[[nodiscard]] ExpressionPtr col(std::optional<std::string> qualifier, std::string name);
[[nodiscard]] ExpressionPtr col(const QualifiedField& field);
[[nodiscard]] ExpressionPtr lit(ScalarValue value);
[[nodiscard]] ExpressionPtr binary(ExpressionPtr left, BinaryOperator op, ExpressionPtr right);
[[nodiscard]] ExpressionPtr case_when(ExpressionPtr operand,
                                      std::vector<CaseExpression::WhenThen> branches,
                                      ExpressionPtr else_expression);
[[nodiscard]] ExpressionPtr coalesce(std::vector<ExpressionPtr> arguments);
[[nodiscard]] ExpressionPtr call(std::string name, std::vector<ExpressionPtr> arguments);
[[nodiscard]] ExpressionPtr alias_qualified(ExpressionPtr expression,
                                            std::optional<std::string> qualifier,
                                            std::string name);

[[nodiscard]] std::string binary_operator_symbol(BinaryOperator op);
[[nodiscard]] bool is_comparison(BinaryOperator op) noexcept;
[[nodiscard]] bool is_aggregate_function(std::string_view name) noexcept;

[[nodiscard]] std::string display_name(const Expression& expression);
[[nodiscard]] bool expressions_equal(const Expression& lhs, const Expression& rhs);
[[nodiscard]] std::vector<ColumnReference> collect_columns(const Expression& expression);

// Output field of `expression` when projected over `input`.
[[nodiscard]] PlanResult<QualifiedField> infer_field(const Expression& expression, const LogicalSchema& input);

}  // namespace tributary::planner
