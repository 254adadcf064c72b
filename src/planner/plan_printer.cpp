#include "tributary/planner/plan_printer.hpp"

#include "tributary/planner/extensions/key_calculation.hpp"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace tributary::planner {

namespace {

std::string join(const std::vector<std::string>& values)
{
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0U; i < values.size(); ++i) {
        if (i > 0U) {
            oss << ", ";
        }
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

std::vector<std::string> expression_names(const std::vector<ExpressionPtr>& expressions)
{
    std::vector<std::string> names;
    names.reserve(expressions.size());
    for (const auto& expression : expressions) {
        names.push_back(expression ? display_name(*expression) : std::string{"<null>"});
    }
    return names;
}

class DetailCollector final : public LogicalOperatorVisitor {
public:
    void visit(const LogicalTableScan& op) override
    {
        title = "TableScan";
        details.push_back("table=" + op.table_name);
    }

    void visit(const LogicalProjection& op) override
    {
        title = "Projection";
        details.push_back("exprs=" + join(expression_names(op.expressions)));
    }

    void visit(const LogicalFilter& op) override
    {
        title = "Filter";
        if (op.predicate) {
            details.push_back("predicate=" + display_name(*op.predicate));
        }
    }

    void visit(const LogicalAggregate& op) override
    {
        title = "Aggregate";
        details.push_back("window=" + (op.window.has_value() ? op.window->describe() : std::string{"none"}));
        details.push_back("group=" + join(expression_names(op.group_expressions)));
        details.push_back("aggs=" + join(expression_names(op.aggregate_expressions)));
    }

    void visit(const LogicalJoin& op) override
    {
        title = "Join";
        details.push_back("type=" + join_type_name(op.join_type));
        std::vector<std::string> pairs;
        pairs.reserve(op.on.size());
        for (const auto& pair : op.on) {
            pairs.push_back(display_name(*pair.left) + " = " + display_name(*pair.right));
        }
        details.push_back("on=" + join(pairs));
        if (op.filter) {
            details.push_back("filter=" + display_name(*op.filter));
        }
        if (op.join_constraint != JoinConstraint::On) {
            details.push_back("constraint=" + join_constraint_name(op.join_constraint));
        }
        if (op.null_equals_null) {
            details.push_back("null_equals_null=true");
        }
    }

    void visit(const LogicalExtension& op) override
    {
        title = "Extension";
        if (op.node) {
            details.push_back(op.node->describe());
        }
    }

    std::string title{};
    std::vector<std::string> details{};
};

std::string describe(const LogicalOperator& node, const DescribeOptions& options)
{
    DetailCollector collector;
    node.accept(collector);

    std::string description = collector.title;
    if (!collector.details.empty()) {
        description += " [";
        for (std::size_t i = 0U; i < collector.details.size(); ++i) {
            if (i > 0U) {
                description += ", ";
            }
            description += collector.details[i];
        }
        description += "]";
    }

    if (options.include_schema) {
        const auto* keyed = as_key_calculation(&node);
        const auto& schema = (keyed != nullptr && options.show_materialized_keys) ? keyed->materialized_schema()
                                                                                   : node.schema();
        description += " ";
        description += describe_schema(schema);
    }
    return description;
}

void render(const LogicalOperator& node,
            std::size_t depth,
            const DescribeOptions& options,
            std::vector<std::string>& lines)
{
    std::string line(depth * 2U, ' ');
    if (depth > 0U) {
        line += "- ";
    }
    line += describe(node, options);
    lines.push_back(std::move(line));

    for (const auto* child : node.children()) {
        if (child != nullptr) {
            render(*child, depth + 1U, options, lines);
        }
    }
}

}  // namespace

std::string describe_schema(const LogicalSchema& schema)
{
    std::string text{"{"};
    for (std::size_t i = 0U; i < schema.size(); ++i) {
        const auto& field = schema.field(i);
        if (i > 0U) {
            text += ", ";
        }
        text += field.qualified_name() + ":" + data_type_name(field.type);
        if (field.nullable) {
            text.push_back('?');
        }
    }
    text.push_back('}');
    return text;
}

std::string describe_plan(const LogicalOperator& root, DescribeOptions options)
{
    std::vector<std::string> lines;
    lines.reserve(8U);
    render(root, 0U, options, lines);

    std::ostringstream oss;
    for (std::size_t i = 0U; i < lines.size(); ++i) {
        if (i > 0U) {
            oss << '\n';
        }
        oss << lines[i];
    }
    return oss.str();
}

}  // namespace tributary::planner
