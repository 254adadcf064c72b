#include "tributary/planner/logical_plan.hpp"

#include <stdexcept>
#include <utility>

namespace tributary::planner {

namespace {

const LogicalSchema& empty_schema() noexcept
{
    static const LogicalSchema schema{};
    return schema;
}

void require_input(const LogicalOperatorPtr& input, const char* what)
{
    if (!input) {
        throw std::invalid_argument{what};
    }
}

QualifiedField with_nullable(QualifiedField field, bool force_nullable)
{
    if (force_nullable) {
        field.nullable = true;
    }
    return field;
}

template <typename Node>
PlanResult<LogicalOperatorPtr> wrap(std::unique_ptr<Node> node)
{
    return PlanResult<LogicalOperatorPtr>::ok(LogicalOperatorPtr{std::move(node)});
}

PlanResult<std::vector<QualifiedField>> infer_fields(const std::vector<ExpressionPtr>& expressions,
                                                     const LogicalSchema& input)
{
    std::vector<QualifiedField> fields;
    fields.reserve(expressions.size());
    for (const auto& expression : expressions) {
        if (!expression) {
            throw std::invalid_argument{"projection expression must not be null"};
        }
        auto field = infer_field(*expression, input);
        if (!field.success()) {
            return PlanResult<std::vector<QualifiedField>>::failure(std::move(field.diagnostics));
        }
        fields.push_back(std::move(*field.value));
    }
    return PlanResult<std::vector<QualifiedField>>::ok(std::move(fields));
}

PlanDiagnostic child_count_mismatch(LogicalOperatorKind kind, std::size_t expected, std::size_t actual)
{
    return make_plan_diagnostic(PlanErrc::UpstreamConstruction,
                                logical_operator_kind_name(kind) + " expects " + std::to_string(expected) +
                                    " input(s) but was given " + std::to_string(actual));
}

// Re-resolves the projection against a new input. Field names and metadata
// stay as declared; types and nullability follow the input.
PlanResult<LogicalOperatorPtr> rebind_projection(LogicalProjection& projection, LogicalOperatorPtr input)
{
    auto inferred = infer_fields(projection.expressions, input->schema());
    if (!inferred.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(inferred.diagnostics));
    }

    auto fields = projection.output_schema.fields();
    for (std::size_t index = 0U; index < fields.size(); ++index) {
        fields[index].type = (*inferred.value)[index].type;
        fields[index].nullable = (*inferred.value)[index].nullable;
    }
    auto schema = LogicalSchema::try_new(std::move(fields), projection.output_schema.metadata());
    if (!schema.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(schema.diagnostics));
    }
    return make_projection_with_schema(std::move(projection.expressions), std::move(input), std::move(*schema.value));
}

}  // namespace

std::string join_type_name(JoinType type)
{
    switch (type) {
    case JoinType::Inner:
        return "Inner";
    case JoinType::LeftOuter:
        return "Left";
    case JoinType::RightOuter:
        return "Right";
    case JoinType::FullOuter:
        return "Full";
    case JoinType::LeftSemi:
        return "LeftSemi";
    case JoinType::RightSemi:
        return "RightSemi";
    case JoinType::LeftAnti:
        return "LeftAnti";
    case JoinType::RightAnti:
        return "RightAnti";
    }
    return "Unknown";
}

std::string join_constraint_name(JoinConstraint constraint)
{
    switch (constraint) {
    case JoinConstraint::On:
        return "On";
    case JoinConstraint::Using:
        return "Using";
    }
    return "Unknown";
}

std::string logical_operator_kind_name(LogicalOperatorKind kind)
{
    switch (kind) {
    case LogicalOperatorKind::TableScan:
        return "TableScan";
    case LogicalOperatorKind::Projection:
        return "Projection";
    case LogicalOperatorKind::Filter:
        return "Filter";
    case LogicalOperatorKind::Aggregate:
        return "Aggregate";
    case LogicalOperatorKind::Join:
        return "Join";
    case LogicalOperatorKind::Extension:
        return "Extension";
    }
    return "Unknown";
}

void LogicalOperator::accept(LogicalOperatorVisitor& visitor) const
{
    switch (kind) {
    case LogicalOperatorKind::TableScan:
        visitor.visit(static_cast<const LogicalTableScan&>(*this));
        break;
    case LogicalOperatorKind::Projection:
        visitor.visit(static_cast<const LogicalProjection&>(*this));
        break;
    case LogicalOperatorKind::Filter:
        visitor.visit(static_cast<const LogicalFilter&>(*this));
        break;
    case LogicalOperatorKind::Aggregate:
        visitor.visit(static_cast<const LogicalAggregate&>(*this));
        break;
    case LogicalOperatorKind::Join:
        visitor.visit(static_cast<const LogicalJoin&>(*this));
        break;
    case LogicalOperatorKind::Extension:
        visitor.visit(static_cast<const LogicalExtension&>(*this));
        break;
    default:
        break;
    }
}

std::vector<const LogicalOperator*> LogicalOperator::children() const
{
    switch (kind) {
    case LogicalOperatorKind::TableScan:
        return {};
    case LogicalOperatorKind::Projection:
        return {static_cast<const LogicalProjection&>(*this).input.get()};
    case LogicalOperatorKind::Filter:
        return {static_cast<const LogicalFilter&>(*this).input.get()};
    case LogicalOperatorKind::Aggregate:
        return {static_cast<const LogicalAggregate&>(*this).input.get()};
    case LogicalOperatorKind::Join: {
        const auto& join = static_cast<const LogicalJoin&>(*this);
        return {join.left.get(), join.right.get()};
    }
    case LogicalOperatorKind::Extension: {
        const auto& extension = static_cast<const LogicalExtension&>(*this);
        return extension.node ? extension.node->inputs() : std::vector<const LogicalOperator*>{};
    }
    }
    return {};
}

const LogicalSchema& LogicalFilter::schema() const noexcept
{
    return input ? input->schema() : empty_schema();
}

const LogicalSchema& LogicalExtension::schema() const noexcept
{
    return node ? node->schema() : empty_schema();
}

PlanResult<LogicalSchema> build_join_schema(const LogicalSchema& left, const LogicalSchema& right, JoinType join_type)
{
    std::vector<QualifiedField> fields;
    fields.reserve(left.size() + right.size());

    const auto append = [&fields](const LogicalSchema& side, bool force_nullable) {
        for (const auto& field : side.fields()) {
            fields.push_back(with_nullable(field, force_nullable));
        }
    };

    switch (join_type) {
    case JoinType::Inner:
        append(left, false);
        append(right, false);
        break;
    case JoinType::LeftOuter:
        append(left, false);
        append(right, true);
        break;
    case JoinType::RightOuter:
        append(left, true);
        append(right, false);
        break;
    case JoinType::FullOuter:
        append(left, true);
        append(right, true);
        break;
    case JoinType::LeftSemi:
    case JoinType::LeftAnti:
        append(left, false);
        break;
    case JoinType::RightSemi:
    case JoinType::RightAnti:
        append(right, false);
        break;
    }

    auto metadata = left.metadata();
    for (const auto& [key, value] : right.metadata()) {
        metadata.emplace(key, value);
    }
    return LogicalSchema::try_new(std::move(fields), std::move(metadata));
}

PlanResult<LogicalOperatorPtr> make_table_scan(std::string table_name,
                                               std::string qualifier,
                                               std::vector<QualifiedField> fields,
                                               FieldMetadata metadata)
{
    for (auto& field : fields) {
        field.qualifier = qualifier;
    }
    auto schema = LogicalSchema::try_new(std::move(fields), std::move(metadata));
    if (!schema.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(schema.diagnostics));
    }

    auto scan = std::make_unique<LogicalTableScan>();
    scan->table_name = std::move(table_name);
    scan->output_schema = std::move(*schema.value);
    return wrap(std::move(scan));
}

PlanResult<LogicalOperatorPtr> make_projection(std::vector<ExpressionPtr> expressions, LogicalOperatorPtr input)
{
    require_input(input, "projection input must not be null");
    auto fields = infer_fields(expressions, input->schema());
    if (!fields.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(fields.diagnostics));
    }
    auto schema = LogicalSchema::try_new(std::move(*fields.value), input->schema().metadata());
    if (!schema.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(schema.diagnostics));
    }
    return make_projection_with_schema(std::move(expressions), std::move(input), std::move(*schema.value));
}

PlanResult<LogicalOperatorPtr> make_projection_with_schema(std::vector<ExpressionPtr> expressions,
                                                           LogicalOperatorPtr input,
                                                           LogicalSchema schema)
{
    require_input(input, "projection input must not be null");
    if (expressions.size() != schema.size()) {
        return PlanResult<LogicalOperatorPtr>::failure(make_plan_diagnostic(
            PlanErrc::UpstreamConstruction,
            "Projection has " + std::to_string(expressions.size()) + " expressions but its schema has " +
                std::to_string(schema.size()) + " fields"));
    }

    auto projection = std::make_unique<LogicalProjection>();
    projection->expressions = std::move(expressions);
    projection->input = std::move(input);
    projection->output_schema = std::move(schema);
    return wrap(std::move(projection));
}

PlanResult<LogicalOperatorPtr> make_subquery_alias(LogicalOperatorPtr input, std::string alias)
{
    require_input(input, "aliased input must not be null");
    std::vector<ExpressionPtr> expressions;
    expressions.reserve(input->schema().size());
    for (const auto& field : input->schema().fields()) {
        expressions.push_back(alias_qualified(col(field), alias, field.name));
    }
    return make_projection(std::move(expressions), std::move(input));
}

PlanResult<LogicalOperatorPtr> make_filter(ExpressionPtr predicate, LogicalOperatorPtr input)
{
    require_input(input, "filter input must not be null");
    if (!predicate) {
        throw std::invalid_argument{"filter predicate must not be null"};
    }

    auto field = infer_field(*predicate, input->schema());
    if (!field.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(field.diagnostics));
    }
    if (field.value->type != DataType::Boolean && field.value->type != DataType::Null) {
        return PlanResult<LogicalOperatorPtr>::failure(make_plan_diagnostic(
            PlanErrc::UpstreamConstruction,
            "Filter predicate '" + display_name(*predicate) + "' is " + data_type_name(field.value->type) +
                ", expected Boolean"));
    }

    auto filter = std::make_unique<LogicalFilter>();
    filter->predicate = std::move(predicate);
    filter->input = std::move(input);
    return wrap(std::move(filter));
}

PlanResult<LogicalOperatorPtr> make_aggregate(std::optional<WindowType> window,
                                              std::vector<ExpressionPtr> group_expressions,
                                              std::vector<ExpressionPtr> aggregate_expressions,
                                              LogicalOperatorPtr input)
{
    require_input(input, "aggregate input must not be null");

    auto group_fields = infer_fields(group_expressions, input->schema());
    if (!group_fields.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(group_fields.diagnostics));
    }
    auto aggregate_fields = infer_fields(aggregate_expressions, input->schema());
    if (!aggregate_fields.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(aggregate_fields.diagnostics));
    }

    std::vector<QualifiedField> fields = std::move(*group_fields.value);
    for (auto& field : *aggregate_fields.value) {
        fields.push_back(std::move(field));
    }

    QualifiedField trailing{};
    trailing.nullable = false;
    if (window.has_value()) {
        trailing.name = std::string{kTimestampField};
        trailing.type = DataType::Timestamp;
    } else {
        trailing.name = std::string{kUpdatingMetaField};
        trailing.type = DataType::Struct;
    }
    fields.push_back(std::move(trailing));

    auto schema = LogicalSchema::try_new(std::move(fields), input->schema().metadata());
    if (!schema.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(schema.diagnostics));
    }

    auto aggregate = std::make_unique<LogicalAggregate>();
    aggregate->window = window;
    aggregate->group_expressions = std::move(group_expressions);
    aggregate->aggregate_expressions = std::move(aggregate_expressions);
    aggregate->input = std::move(input);
    aggregate->output_schema = std::move(*schema.value);
    return wrap(std::move(aggregate));
}

PlanResult<LogicalOperatorPtr> make_join(LogicalOperatorPtr left, LogicalOperatorPtr right, JoinSpec spec)
{
    require_input(left, "join left input must not be null");
    require_input(right, "join right input must not be null");

    for (const auto& pair : spec.on) {
        if (!pair.left || !pair.right) {
            throw std::invalid_argument{"join key expressions must not be null"};
        }
        auto left_field = infer_field(*pair.left, left->schema());
        if (!left_field.success()) {
            return PlanResult<LogicalOperatorPtr>::failure(std::move(left_field.diagnostics));
        }
        auto right_field = infer_field(*pair.right, right->schema());
        if (!right_field.success()) {
            return PlanResult<LogicalOperatorPtr>::failure(std::move(right_field.diagnostics));
        }
    }

    auto schema = build_join_schema(left->schema(), right->schema(), spec.join_type);
    if (!schema.success()) {
        return PlanResult<LogicalOperatorPtr>::failure(std::move(schema.diagnostics));
    }

    if (spec.filter) {
        // The filter sees both sides even for semi and anti joins.
        auto combined = build_join_schema(left->schema(), right->schema(), JoinType::Inner);
        if (!combined.success()) {
            return PlanResult<LogicalOperatorPtr>::failure(std::move(combined.diagnostics));
        }
        auto field = infer_field(*spec.filter, *combined.value);
        if (!field.success()) {
            return PlanResult<LogicalOperatorPtr>::failure(std::move(field.diagnostics));
        }
    }

    auto join = std::make_unique<LogicalJoin>();
    join->left = std::move(left);
    join->right = std::move(right);
    join->on = std::move(spec.on);
    join->filter = std::move(spec.filter);
    join->join_type = spec.join_type;
    join->join_constraint = spec.join_constraint;
    join->null_equals_null = spec.null_equals_null;
    join->output_schema = std::move(*schema.value);
    return wrap(std::move(join));
}

LogicalOperatorPtr make_extension(std::unique_ptr<ExtensionNode> node)
{
    if (!node) {
        throw std::invalid_argument{"extension node must not be null"};
    }
    auto extension = std::make_unique<LogicalExtension>();
    extension->node = std::move(node);
    return extension;
}

std::vector<LogicalOperatorPtr> take_children(LogicalOperator& node)
{
    std::vector<LogicalOperatorPtr> children;
    switch (node.kind) {
    case LogicalOperatorKind::TableScan:
        break;
    case LogicalOperatorKind::Projection:
        children.push_back(std::move(static_cast<LogicalProjection&>(node).input));
        break;
    case LogicalOperatorKind::Filter:
        children.push_back(std::move(static_cast<LogicalFilter&>(node).input));
        break;
    case LogicalOperatorKind::Aggregate:
        children.push_back(std::move(static_cast<LogicalAggregate&>(node).input));
        break;
    case LogicalOperatorKind::Join: {
        auto& join = static_cast<LogicalJoin&>(node);
        children.push_back(std::move(join.left));
        children.push_back(std::move(join.right));
        break;
    }
    case LogicalOperatorKind::Extension: {
        auto& extension = static_cast<LogicalExtension&>(node);
        if (extension.node) {
            children = extension.node->take_inputs();
        }
        break;
    }
    }
    return children;
}

PlanResult<LogicalOperatorPtr> with_new_children(LogicalOperatorPtr node, std::vector<LogicalOperatorPtr> children)
{
    require_input(node, "node must not be null");
    for (const auto& child : children) {
        require_input(child, "child must not be null");
    }

    switch (node->kind) {
    case LogicalOperatorKind::TableScan:
        if (!children.empty()) {
            return PlanResult<LogicalOperatorPtr>::failure(child_count_mismatch(node->kind, 0U, children.size()));
        }
        return PlanResult<LogicalOperatorPtr>::ok(std::move(node));
    case LogicalOperatorKind::Projection:
    case LogicalOperatorKind::Filter:
    case LogicalOperatorKind::Aggregate: {
        if (children.size() != 1U) {
            return PlanResult<LogicalOperatorPtr>::failure(child_count_mismatch(node->kind, 1U, children.size()));
        }
        if (node->kind == LogicalOperatorKind::Projection) {
            return rebind_projection(static_cast<LogicalProjection&>(*node), std::move(children.front()));
        }
        if (node->kind == LogicalOperatorKind::Filter) {
            auto& filter = static_cast<LogicalFilter&>(*node);
            return make_filter(std::move(filter.predicate), std::move(children.front()));
        }
        auto& aggregate = static_cast<LogicalAggregate&>(*node);
        return make_aggregate(aggregate.window,
                              std::move(aggregate.group_expressions),
                              std::move(aggregate.aggregate_expressions),
                              std::move(children.front()));
    }
    case LogicalOperatorKind::Join: {
        if (children.size() != 2U) {
            return PlanResult<LogicalOperatorPtr>::failure(child_count_mismatch(node->kind, 2U, children.size()));
        }
        auto& join = static_cast<LogicalJoin&>(*node);
        auto schema = build_join_schema(children[0]->schema(), children[1]->schema(), join.join_type);
        if (!schema.success()) {
            return PlanResult<LogicalOperatorPtr>::failure(std::move(schema.diagnostics));
        }
        join.left = std::move(children[0]);
        join.right = std::move(children[1]);
        join.output_schema = std::move(*schema.value);
        return PlanResult<LogicalOperatorPtr>::ok(std::move(node));
    }
    case LogicalOperatorKind::Extension: {
        auto& extension = static_cast<LogicalExtension&>(*node);
        if (!extension.node) {
            throw std::invalid_argument{"extension node must not be null"};
        }
        auto rebuilt = extension.node->with_new_inputs(std::move(children));
        if (!rebuilt.success()) {
            return PlanResult<LogicalOperatorPtr>::failure(std::move(rebuilt.diagnostics));
        }
        return PlanResult<LogicalOperatorPtr>::ok(make_extension(std::move(*rebuilt.value)));
    }
    }
    return PlanResult<LogicalOperatorPtr>::ok(std::move(node));
}

std::size_t count_nodes(const LogicalOperator& root)
{
    std::size_t count = 1U;
    for (const auto* child : root.children()) {
        if (child != nullptr) {
            count += count_nodes(*child);
        }
    }
    return count;
}

}  // namespace tributary::planner
