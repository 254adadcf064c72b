#include "tributary/parser/plan_text.hpp"

#include "tributary/planner/logical_expression.hpp"
#include "tributary/planner/window_type.hpp"

#include <tao/pegtl.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace tributary::parser {

namespace {

namespace pegtl = tao::pegtl;

using planner::BinaryOperator;
using planner::DataType;
using planner::ExpressionPtr;
using planner::JoinConstraint;
using planner::JoinOn;
using planner::JoinSpec;
using planner::JoinType;
using planner::LogicalOperatorPtr;
using planner::PlanDiagnostic;
using planner::PlanErrc;
using planner::QualifiedField;
using planner::ScalarValue;
using planner::WindowType;

struct SExpression final {
    enum class Kind : std::uint8_t {
        Symbol = 0,
        String,
        List
    };

    Kind kind = Kind::Symbol;
    std::string text{};
    std::vector<SExpression> items{};
    std::size_t line = 0U;
    std::size_t column = 0U;

    [[nodiscard]] bool is_list() const noexcept { return kind == Kind::List; }
    [[nodiscard]] bool is_symbol() const noexcept { return kind == Kind::Symbol; }
    [[nodiscard]] bool is_symbol(std::string_view value) const noexcept { return is_symbol() && text == value; }

    // Leading symbol of a list form, empty otherwise.
    [[nodiscard]] std::string_view head() const noexcept
    {
        if (!is_list() || items.empty() || !items.front().is_symbol()) {
            return {};
        }
        return items.front().text;
    }
};

namespace grammar {

struct comment : pegtl::seq<pegtl::one<';'>, pegtl::until<pegtl::eolf>> {
};

struct separator : pegtl::sor<pegtl::space, comment> {
};

struct optional_space : pegtl::star<separator> {
};

struct string_char : pegtl::sor<pegtl::seq<pegtl::one<'\''>, pegtl::one<'\''>>, pegtl::not_one<'\''>> {
};

struct string_atom : pegtl::seq<pegtl::one<'\''>, pegtl::star<string_char>, pegtl::one<'\''>> {
};

struct symbol_char : pegtl::sor<pegtl::alnum, pegtl::one<'_', '.', '-', '+', '<', '>', '=', '!', '*'>> {
};

struct symbol_atom : pegtl::plus<symbol_char> {
};

struct list_open : pegtl::one<'('> {
};

struct list_close : pegtl::one<')'> {
};

struct element;

struct list : pegtl::seq<list_open, optional_space, pegtl::star<element, optional_space>, pegtl::must<list_close>> {
};

struct element : pegtl::sor<list, string_atom, symbol_atom> {
};

struct document : pegtl::seq<optional_space, pegtl::must<element>, optional_space, pegtl::must<pegtl::eof>> {
};

}  // namespace grammar

template <typename Rule>
std::string error_message()
{
    if constexpr (std::is_same_v<Rule, grammar::list_close>) {
        return "expected ')' to close the list";
    } else if constexpr (std::is_same_v<Rule, grammar::element>) {
        return "expected a plan form";
    } else if constexpr (std::is_same_v<Rule, pegtl::eof>) {
        return "unexpected input after the plan";
    } else {
        return "malformed plan text";
    }
}

template <typename Rule>
struct error_control : pegtl::normal<Rule> {
    template <typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&...)
    {
        throw pegtl::parse_error(error_message<Rule>(), in);
    }
};

struct BuildState final {
    // open.front() is the document; the rest are lists still being read.
    std::vector<SExpression> open{};
};

template <typename Input>
SExpression make_atom(const Input& in, SExpression::Kind kind, std::string text)
{
    SExpression atom{};
    atom.kind = kind;
    atom.text = std::move(text);
    atom.line = static_cast<std::size_t>(in.position().line);
    atom.column = static_cast<std::size_t>(in.position().column);
    return atom;
}

template <typename Rule>
struct build_action : pegtl::nothing<Rule> {
};

template <>
struct build_action<grammar::list_open> {
    template <typename Input>
    static void apply(const Input& in, BuildState& state)
    {
        state.open.push_back(make_atom(in, SExpression::Kind::List, {}));
    }
};

template <>
struct build_action<grammar::list_close> {
    template <typename Input>
    static void apply(const Input&, BuildState& state)
    {
        auto list = std::move(state.open.back());
        state.open.pop_back();
        state.open.back().items.push_back(std::move(list));
    }
};

template <>
struct build_action<grammar::symbol_atom> {
    template <typename Input>
    static void apply(const Input& in, BuildState& state)
    {
        state.open.back().items.push_back(make_atom(in, SExpression::Kind::Symbol, in.string()));
    }
};

template <>
struct build_action<grammar::string_atom> {
    template <typename Input>
    static void apply(const Input& in, BuildState& state)
    {
        const auto raw = in.string();
        std::string text;
        text.reserve(raw.size());
        for (std::size_t index = 1U; index + 1U < raw.size(); ++index) {
            text.push_back(raw[index]);
            if (raw[index] == '\'') {
                ++index;
            }
        }
        state.open.back().items.push_back(make_atom(in, SExpression::Kind::String, std::move(text)));
    }
};

bool is_integer_token(std::string_view token) noexcept
{
    std::size_t index = 0U;
    if (!token.empty() && (token.front() == '-' || token.front() == '+')) {
        index = 1U;
    }
    if (index >= token.size()) {
        return false;
    }
    for (; index < token.size(); ++index) {
        if (std::isdigit(static_cast<unsigned char>(token[index])) == 0) {
            return false;
        }
    }
    return true;
}

bool is_number_token(std::string_view token) noexcept
{
    std::size_t index = 0U;
    if (!token.empty() && (token.front() == '-' || token.front() == '+')) {
        index = 1U;
    }
    return index < token.size() && std::isdigit(static_cast<unsigned char>(token[index])) != 0;
}

std::optional<std::int64_t> parse_int64(std::string_view token)
{
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1U);
    }
    std::int64_t value = 0;
    const auto* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::pair<std::optional<std::string>, std::string> split_qualified(std::string_view text)
{
    const auto dot = text.rfind('.');
    if (dot == std::string_view::npos) {
        return {std::nullopt, std::string{text}};
    }
    return {std::string{text.substr(0U, dot)}, std::string{text.substr(dot + 1U)}};
}

std::optional<DataType> parse_data_type(std::string_view name)
{
    if (name == "bool" || name == "boolean") {
        return DataType::Boolean;
    }
    if (name == "int64" || name == "bigint") {
        return DataType::Int64;
    }
    if (name == "uint64") {
        return DataType::UInt64;
    }
    if (name == "float64" || name == "double") {
        return DataType::Float64;
    }
    if (name == "utf8" || name == "string" || name == "text") {
        return DataType::Utf8;
    }
    if (name == "timestamp") {
        return DataType::Timestamp;
    }
    if (name == "duration" || name == "interval") {
        return DataType::Duration;
    }
    if (name == "struct") {
        return DataType::Struct;
    }
    return std::nullopt;
}

std::optional<JoinType> parse_join_type(std::string_view name)
{
    if (name == "inner") {
        return JoinType::Inner;
    }
    if (name == "left") {
        return JoinType::LeftOuter;
    }
    if (name == "right") {
        return JoinType::RightOuter;
    }
    if (name == "full") {
        return JoinType::FullOuter;
    }
    if (name == "left-semi") {
        return JoinType::LeftSemi;
    }
    if (name == "right-semi") {
        return JoinType::RightSemi;
    }
    if (name == "left-anti") {
        return JoinType::LeftAnti;
    }
    if (name == "right-anti") {
        return JoinType::RightAnti;
    }
    return std::nullopt;
}

std::optional<BinaryOperator> parse_operator(std::string_view name)
{
    if (name == "=") {
        return BinaryOperator::Equal;
    }
    if (name == "<>" || name == "!=") {
        return BinaryOperator::NotEqual;
    }
    if (name == "<") {
        return BinaryOperator::Less;
    }
    if (name == "<=") {
        return BinaryOperator::LessOrEqual;
    }
    if (name == ">") {
        return BinaryOperator::Greater;
    }
    if (name == ">=") {
        return BinaryOperator::GreaterOrEqual;
    }
    if (name == "+") {
        return BinaryOperator::Add;
    }
    if (name == "-") {
        return BinaryOperator::Subtract;
    }
    if (name == "and") {
        return BinaryOperator::And;
    }
    if (name == "or") {
        return BinaryOperator::Or;
    }
    return std::nullopt;
}

class PlanBuilder final {
public:
    PlanTextResult build(const SExpression& root)
    {
        PlanTextResult result{};
        auto plan = build_plan(root);
        result.diagnostics = std::move(diagnostics_);
        if (plan && result.diagnostics.empty()) {
            result.plan = std::move(plan);
        }
        return result;
    }

private:
    void fail(const SExpression& at, std::string message, std::vector<std::string> hints = {})
    {
        PlanTextDiagnostic diagnostic{};
        diagnostic.code = make_error_code(PlanErrc::InvalidPlanText);
        diagnostic.message = std::move(message);
        diagnostic.line = at.line;
        diagnostic.column = at.column;
        diagnostic.remediation_hints = std::move(hints);
        diagnostics_.push_back(std::move(diagnostic));
    }

    void forward(const SExpression& at, std::vector<PlanDiagnostic> diagnostics)
    {
        for (auto& source : diagnostics) {
            PlanTextDiagnostic diagnostic{};
            diagnostic.code = source.code;
            diagnostic.message = std::move(source.message);
            diagnostic.line = at.line;
            diagnostic.column = at.column;
            diagnostic.remediation_hints = std::move(source.remediation_hints);
            diagnostics_.push_back(std::move(diagnostic));
        }
    }

    LogicalOperatorPtr finish(const SExpression& at, planner::PlanResult<LogicalOperatorPtr> result)
    {
        if (!result.success()) {
            forward(at, std::move(result.diagnostics));
            return nullptr;
        }
        return std::move(*result.value);
    }

    LogicalOperatorPtr build_plan(const SExpression& node)
    {
        const auto head = node.head();
        if (head.empty()) {
            fail(node, "expected a plan form such as (scan ...) or (join ...)");
            return nullptr;
        }
        if (head == "scan") {
            return build_scan(node);
        }
        if (head == "filter") {
            return build_filter(node);
        }
        if (head == "project") {
            return build_project(node);
        }
        if (head == "aggregate") {
            return build_aggregate(node);
        }
        if (head == "join") {
            return build_join(node);
        }
        if (head == "alias") {
            return build_alias(node);
        }
        fail(node.items.front(),
             "unknown plan form '" + std::string{head} + "'",
             {"Plan forms are scan, filter, project, aggregate, join and alias."});
        return nullptr;
    }

    LogicalOperatorPtr build_scan(const SExpression& node)
    {
        if (node.items.size() < 3U || !node.items[1].is_symbol()) {
            fail(node, "scan expects a table name and a (fields ...) clause");
            return nullptr;
        }

        const auto& table = node.items[1].text;
        std::string qualifier = table;
        std::vector<QualifiedField> fields;
        bool saw_fields = false;

        for (std::size_t index = 2U; index < node.items.size(); ++index) {
            const auto& clause = node.items[index];
            const auto head = clause.head();
            if (head == "as" && clause.items.size() == 2U && clause.items[1].is_symbol()) {
                qualifier = clause.items[1].text;
            } else if (head == "fields") {
                saw_fields = true;
                for (std::size_t field_index = 1U; field_index < clause.items.size(); ++field_index) {
                    auto field = build_field(clause.items[field_index]);
                    if (!field.has_value()) {
                        return nullptr;
                    }
                    fields.push_back(std::move(*field));
                }
            } else {
                fail(clause, "unexpected scan clause", {"Use (as <alias>) or (fields (<name> <type>) ...)."});
                return nullptr;
            }
        }

        if (!saw_fields) {
            fail(node, "scan of '" + table + "' has no (fields ...) clause");
            return nullptr;
        }
        return finish(node, planner::make_table_scan(table, std::move(qualifier), std::move(fields)));
    }

    std::optional<QualifiedField> build_field(const SExpression& node)
    {
        if (!node.is_list() || node.items.size() < 2U || node.items.size() > 3U || !node.items[0].is_symbol() ||
            !node.items[1].is_symbol()) {
            fail(node, "field must be written (<name> <type> [nullable])");
            return std::nullopt;
        }
        const auto type = parse_data_type(node.items[1].text);
        if (!type.has_value()) {
            fail(node.items[1], "unknown data type '" + node.items[1].text + "'");
            return std::nullopt;
        }
        QualifiedField field{};
        field.name = node.items[0].text;
        field.type = *type;
        field.nullable = false;
        if (node.items.size() == 3U) {
            if (!node.items[2].is_symbol("nullable")) {
                fail(node.items[2], "expected 'nullable'");
                return std::nullopt;
            }
            field.nullable = true;
        }
        return field;
    }

    LogicalOperatorPtr build_filter(const SExpression& node)
    {
        if (node.items.size() != 3U) {
            fail(node, "filter expects a predicate and an input");
            return nullptr;
        }
        auto predicate = build_expression(node.items[1]);
        auto input = build_plan(node.items[2]);
        if (!predicate || !input) {
            return nullptr;
        }
        return finish(node, planner::make_filter(std::move(predicate), std::move(input)));
    }

    LogicalOperatorPtr build_project(const SExpression& node)
    {
        if (node.items.size() < 3U) {
            fail(node, "project expects at least one item and an input");
            return nullptr;
        }
        std::vector<ExpressionPtr> expressions;
        for (std::size_t index = 1U; index + 1U < node.items.size(); ++index) {
            auto expression = build_named_expression(node.items[index]);
            if (!expression) {
                return nullptr;
            }
            expressions.push_back(std::move(expression));
        }
        auto input = build_plan(node.items.back());
        if (!input) {
            return nullptr;
        }
        return finish(node, planner::make_projection(std::move(expressions), std::move(input)));
    }

    LogicalOperatorPtr build_aggregate(const SExpression& node)
    {
        if (node.items.size() < 3U) {
            fail(node, "aggregate expects clauses and an input");
            return nullptr;
        }

        std::optional<WindowType> window{};
        std::vector<ExpressionPtr> groups;
        std::vector<ExpressionPtr> aggregates;
        for (std::size_t index = 1U; index + 1U < node.items.size(); ++index) {
            const auto& clause = node.items[index];
            const auto head = clause.head();
            if (head == "window") {
                window = build_window(clause);
                if (!window.has_value()) {
                    return nullptr;
                }
            } else if (head == "group") {
                for (std::size_t item = 1U; item < clause.items.size(); ++item) {
                    auto expression = build_expression(clause.items[item]);
                    if (!expression) {
                        return nullptr;
                    }
                    groups.push_back(std::move(expression));
                }
            } else if (head == "aggs") {
                for (std::size_t item = 1U; item < clause.items.size(); ++item) {
                    auto expression = build_aggregate_call(clause.items[item]);
                    if (!expression) {
                        return nullptr;
                    }
                    aggregates.push_back(std::move(expression));
                }
            } else {
                fail(clause, "unexpected aggregate clause", {"Use (window ...), (group ...) or (aggs ...)."});
                return nullptr;
            }
        }

        auto input = build_plan(node.items.back());
        if (!input) {
            return nullptr;
        }
        return finish(node,
                      planner::make_aggregate(window, std::move(groups), std::move(aggregates), std::move(input)));
    }

    std::optional<WindowType> build_window(const SExpression& clause)
    {
        if (clause.items.size() < 2U || !clause.items[1].is_symbol()) {
            fail(clause, "window expects a kind");
            return std::nullopt;
        }
        const auto& kind = clause.items[1].text;
        std::vector<std::chrono::microseconds> durations;
        for (std::size_t index = 2U; index < clause.items.size(); ++index) {
            const auto& item = clause.items[index];
            const auto duration = item.is_symbol() ? parse_duration(item.text) : std::nullopt;
            if (!duration.has_value()) {
                fail(item, "malformed duration", {"Durations look like 10s, 5m or 250ms."});
                return std::nullopt;
            }
            durations.push_back(*duration);
        }

        if ((kind == "tumble" || kind == "tumbling") && durations.size() == 1U) {
            return WindowType::tumbling(durations[0]);
        }
        if ((kind == "sliding" || kind == "hop") && durations.size() == 2U) {
            return WindowType::sliding(durations[0], durations[1]);
        }
        if (kind == "session" && durations.size() == 1U) {
            return WindowType::session(durations[0]);
        }
        if (kind == "instant" && durations.empty()) {
            return WindowType::instant();
        }
        fail(clause,
             "malformed window '" + kind + "'",
             {"Use (window tumble <w>), (window sliding <w> <s>), (window session <gap>) or (window instant)."});
        return std::nullopt;
    }

    ExpressionPtr build_aggregate_call(const SExpression& node)
    {
        if (!node.is_list() || node.items.size() < 2U || !node.items[0].is_symbol()) {
            fail(node, "aggregate must be written (<fn> <expr> [as <name>])");
            return nullptr;
        }
        const auto& function = node.items[0].text;
        if (!planner::is_aggregate_function(function)) {
            fail(node.items[0], "unknown aggregate function '" + function + "'");
            return nullptr;
        }

        std::size_t end = node.items.size();
        std::optional<std::string> alias{};
        if (end >= 4U && node.items[end - 2U].is_symbol("as") && node.items[end - 1U].is_symbol()) {
            alias = node.items[end - 1U].text;
            end -= 2U;
        }

        std::vector<ExpressionPtr> arguments;
        for (std::size_t index = 1U; index < end; ++index) {
            auto argument = build_expression(node.items[index]);
            if (!argument) {
                return nullptr;
            }
            arguments.push_back(std::move(argument));
        }

        auto expression = planner::call(function, std::move(arguments));
        if (!alias.has_value()) {
            return expression;
        }
        auto [qualifier, name] = split_qualified(*alias);
        return planner::alias_qualified(std::move(expression), std::move(qualifier), std::move(name));
    }

    LogicalOperatorPtr build_join(const SExpression& node)
    {
        if (node.items.size() < 4U || !node.items[1].is_symbol()) {
            fail(node, "join expects a type, optional clauses, and two inputs");
            return nullptr;
        }
        const auto join_type = parse_join_type(node.items[1].text);
        if (!join_type.has_value()) {
            fail(node.items[1],
                 "unknown join type '" + node.items[1].text + "'",
                 {"Join types are inner, left, right, full, left-semi, right-semi, left-anti and right-anti."});
            return nullptr;
        }

        JoinSpec spec{};
        spec.join_type = *join_type;
        for (std::size_t index = 2U; index + 2U < node.items.size(); ++index) {
            const auto& clause = node.items[index];
            const auto head = clause.head();
            if (head == "on") {
                for (std::size_t item = 1U; item < clause.items.size(); ++item) {
                    const auto& pair = clause.items[item];
                    if (!pair.is_list() || pair.items.size() != 2U) {
                        fail(pair, "join key must be written (<left expr> <right expr>)");
                        return nullptr;
                    }
                    auto left = build_expression(pair.items[0]);
                    auto right = build_expression(pair.items[1]);
                    if (!left || !right) {
                        return nullptr;
                    }
                    spec.on.push_back(JoinOn{std::move(left), std::move(right)});
                }
            } else if (head == "filter" && clause.items.size() == 2U) {
                spec.filter = build_expression(clause.items[1]);
                if (!spec.filter) {
                    return nullptr;
                }
            } else if (head == "constraint" && clause.items.size() == 2U && clause.items[1].is_symbol("on")) {
                spec.join_constraint = JoinConstraint::On;
            } else if (head == "constraint" && clause.items.size() == 2U && clause.items[1].is_symbol("using")) {
                spec.join_constraint = JoinConstraint::Using;
            } else if (head == "null-equals-null" && clause.items.size() == 1U) {
                spec.null_equals_null = true;
            } else {
                fail(clause,
                     "unexpected join clause",
                     {"Use (on ...), (filter ...), (constraint on|using) or (null-equals-null)."});
                return nullptr;
            }
        }

        auto left = build_plan(node.items[node.items.size() - 2U]);
        auto right = build_plan(node.items.back());
        if (!left || !right) {
            return nullptr;
        }
        return finish(node, planner::make_join(std::move(left), std::move(right), std::move(spec)));
    }

    LogicalOperatorPtr build_alias(const SExpression& node)
    {
        if (node.items.size() != 3U || !node.items[1].is_symbol()) {
            fail(node, "alias expects a name and an input");
            return nullptr;
        }
        auto input = build_plan(node.items[2]);
        if (!input) {
            return nullptr;
        }
        return finish(node, planner::make_subquery_alias(std::move(input), node.items[1].text));
    }

    ExpressionPtr build_named_expression(const SExpression& node)
    {
        if (!node.is_list() || node.items.empty()) {
            fail(node, "projection item must be written (<expr> [as <name>])");
            return nullptr;
        }
        if (node.items.size() == 1U) {
            return build_expression(node.items[0]);
        }
        if (node.items.size() == 3U && node.items[1].is_symbol("as") && node.items[2].is_symbol()) {
            auto expression = build_expression(node.items[0]);
            if (!expression) {
                return nullptr;
            }
            auto [qualifier, name] = split_qualified(node.items[2].text);
            return planner::alias_qualified(std::move(expression), std::move(qualifier), std::move(name));
        }
        // Bare expression lists such as (+ a.x 1) are accepted unwrapped.
        return build_expression(node);
    }

    ExpressionPtr build_expression(const SExpression& node)
    {
        if (node.kind == SExpression::Kind::String) {
            return planner::lit(ScalarValue::utf8(node.text));
        }
        if (node.is_symbol()) {
            return build_atom(node);
        }

        const auto head = node.head();
        if (head.empty()) {
            fail(node, "expected an expression");
            return nullptr;
        }

        std::vector<ExpressionPtr> arguments;
        const auto collect_arguments = [&]() {
            for (std::size_t index = 1U; index < node.items.size(); ++index) {
                auto argument = build_expression(node.items[index]);
                if (!argument) {
                    return false;
                }
                arguments.push_back(std::move(argument));
            }
            return true;
        };

        if (const auto op = parse_operator(head)) {
            if (node.items.size() != 3U) {
                fail(node, "operator '" + std::string{head} + "' takes two operands");
                return nullptr;
            }
            if (!collect_arguments()) {
                return nullptr;
            }
            return planner::binary(arguments[0], *op, arguments[1]);
        }
        if (head == "coalesce") {
            if (node.items.size() < 2U) {
                fail(node, "coalesce takes at least one argument");
                return nullptr;
            }
            if (!collect_arguments()) {
                return nullptr;
            }
            return planner::coalesce(std::move(arguments));
        }
        if (planner::is_aggregate_function(head)) {
            if (!collect_arguments()) {
                return nullptr;
            }
            return planner::call(std::string{head}, std::move(arguments));
        }
        if (head == "interval" && node.items.size() == 2U && node.items[1].is_symbol()) {
            const auto duration = parse_duration(node.items[1].text);
            if (!duration.has_value()) {
                fail(node.items[1], "malformed duration '" + node.items[1].text + "'");
                return nullptr;
            }
            return planner::lit(ScalarValue::duration(*duration));
        }
        if (head == "timestamp" && node.items.size() == 2U && node.items[1].is_symbol()) {
            const auto nanos = parse_int64(node.items[1].text);
            if (!nanos.has_value()) {
                fail(node.items[1], "timestamp literal expects nanoseconds since the epoch");
                return nullptr;
            }
            return planner::lit(ScalarValue::timestamp(*nanos));
        }

        fail(node.items.front(), "unknown function '" + std::string{head} + "'");
        return nullptr;
    }

    ExpressionPtr build_atom(const SExpression& node)
    {
        const auto& token = node.text;
        if (token == "null") {
            return planner::lit(ScalarValue::null());
        }
        if (token == "true" || token == "false") {
            return planner::lit(ScalarValue::boolean(token == "true"));
        }
        if (is_integer_token(token)) {
            const auto value = parse_int64(token);
            if (!value.has_value()) {
                fail(node, "integer literal '" + token + "' is out of range");
                return nullptr;
            }
            return planner::lit(ScalarValue::int64(*value));
        }
        if (is_number_token(token)) {
            char* end = nullptr;
            const double value = std::strtod(token.c_str(), &end);
            if (end != token.c_str() + token.size()) {
                fail(node, "malformed number '" + token + "'");
                return nullptr;
            }
            return planner::lit(ScalarValue::float64(value));
        }

        auto [qualifier, name] = split_qualified(token);
        if (name.empty() || (qualifier.has_value() && qualifier->empty())) {
            fail(node, "malformed column reference '" + token + "'");
            return nullptr;
        }
        return planner::col(std::move(qualifier), std::move(name));
    }

    std::vector<PlanTextDiagnostic> diagnostics_{};
};

}  // namespace

std::optional<std::chrono::microseconds> parse_duration(std::string_view text)
{
    std::size_t digits = 0U;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits])) != 0) {
        ++digits;
    }
    if (digits == 0U || digits == text.size()) {
        return std::nullopt;
    }

    std::int64_t count = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + digits, count);
    if (ec != std::errc{} || ptr != text.data() + digits) {
        return std::nullopt;
    }

    const auto unit = text.substr(digits);
    if (unit == "ns") {
        if (count % 1000 != 0) {
            return std::nullopt;
        }
        return std::chrono::microseconds{count / 1000};
    }

    std::int64_t micros_per_unit = 0;
    if (unit == "us") {
        micros_per_unit = 1;
    } else if (unit == "ms") {
        micros_per_unit = 1000;
    } else if (unit == "s") {
        micros_per_unit = 1000 * 1000;
    } else if (unit == "m") {
        micros_per_unit = 60LL * 1000 * 1000;
    } else if (unit == "h") {
        micros_per_unit = 60LL * 60 * 1000 * 1000;
    } else if (unit == "d") {
        micros_per_unit = 24LL * 60 * 60 * 1000 * 1000;
    } else {
        return std::nullopt;
    }
    if (count > std::numeric_limits<std::int64_t>::max() / micros_per_unit) {
        return std::nullopt;
    }
    return std::chrono::microseconds{count * micros_per_unit};
}

PlanTextResult parse_plan_text(std::string_view text)
{
    PlanTextResult result{};
    pegtl::memory_input in(text.data(), text.size(), "plan");
    BuildState state{};
    state.open.emplace_back();
    state.open.back().kind = SExpression::Kind::List;

    try {
        const auto parsed = pegtl::parse<grammar::document, build_action, error_control>(in, state);
        if (!parsed || state.open.size() != 1U || state.open.front().items.size() != 1U) {
            PlanTextDiagnostic diagnostic{};
            diagnostic.code = make_error_code(PlanErrc::InvalidPlanText);
            diagnostic.message = "input did not match the plan text grammar";
            diagnostic.line = 1U;
            diagnostic.column = 1U;
            result.diagnostics.push_back(std::move(diagnostic));
            return result;
        }
    } catch (const pegtl::parse_error& error) {
        PlanTextDiagnostic diagnostic{};
        diagnostic.code = make_error_code(PlanErrc::InvalidPlanText);
        diagnostic.message = std::string{error.message()};
        diagnostic.remediation_hints = {"Check that every '(' has a matching ')'."};
        if (!error.positions().empty()) {
            const auto& position = error.positions().front();
            diagnostic.line = static_cast<std::size_t>(position.line);
            diagnostic.column = static_cast<std::size_t>(position.column);
        }
        result.diagnostics.push_back(std::move(diagnostic));
        return result;
    }

    PlanBuilder builder;
    return builder.build(state.open.front().items.front());
}

}  // namespace tributary::parser
