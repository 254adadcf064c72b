#include "tributary/planner/logical_schema.hpp"

#include <set>
#include <stdexcept>
#include <utility>

namespace tributary::planner {

namespace {

std::string describe_reference(const std::optional<std::string>& qualifier, std::string_view name)
{
    std::string text;
    if (qualifier.has_value()) {
        text.append(*qualifier);
        text.push_back('.');
    }
    text.append(name);
    return text;
}

}  // namespace

std::string key_field_name(std::size_t index)
{
    return "_key_" + std::to_string(index);
}

std::string QualifiedField::qualified_name() const
{
    return describe_reference(qualifier, name);
}

LogicalSchema::LogicalSchema(std::vector<QualifiedField> fields, FieldMetadata metadata)
    : fields_{std::move(fields)}
    , metadata_{std::move(metadata)}
{
}

PlanResult<LogicalSchema> LogicalSchema::try_new(std::vector<QualifiedField> fields, FieldMetadata metadata)
{
    std::set<std::pair<std::string, std::string>> qualified_names;
    std::set<std::string> unqualified_names;

    for (const auto& field : fields) {
        if (field.qualifier.has_value()) {
            if (!qualified_names.emplace(*field.qualifier, field.name).second) {
                return PlanResult<LogicalSchema>::failure(make_plan_diagnostic(
                    PlanErrc::UpstreamConstruction,
                    "Schema contains duplicate qualified field name " + field.qualified_name(),
                    {"Alias one of the inputs so that its columns carry a distinct qualifier."}));
            }
        } else if (!unqualified_names.insert(field.name).second) {
            return PlanResult<LogicalSchema>::failure(make_plan_diagnostic(
                PlanErrc::UpstreamConstruction,
                "Schema contains duplicate unqualified field name " + field.name,
                {"Alias the conflicting expressions to distinct names."}));
        }
    }

    for (const auto& [qualifier, name] : qualified_names) {
        if (unqualified_names.count(name) != 0U) {
            return PlanResult<LogicalSchema>::failure(make_plan_diagnostic(
                PlanErrc::UpstreamConstruction,
                "Schema contains qualified field name " + qualifier + "." + name +
                    " and unqualified field name " + name + " which would be ambiguous"));
        }
    }

    return PlanResult<LogicalSchema>::ok(LogicalSchema{std::move(fields), std::move(metadata)});
}

const std::vector<QualifiedField>& LogicalSchema::fields() const noexcept
{
    return fields_;
}

const FieldMetadata& LogicalSchema::metadata() const noexcept
{
    return metadata_;
}

std::size_t LogicalSchema::size() const noexcept
{
    return fields_.size();
}

bool LogicalSchema::empty() const noexcept
{
    return fields_.empty();
}

const QualifiedField& LogicalSchema::field(std::size_t index) const
{
    if (index >= fields_.size()) {
        throw std::out_of_range{"LogicalSchema::field index out of range"};
    }
    return fields_[index];
}

PlanResult<std::size_t> LogicalSchema::index_of(const std::optional<std::string>& qualifier,
                                                std::string_view name) const
{
    std::optional<std::size_t> match{};
    for (std::size_t index = 0U; index < fields_.size(); ++index) {
        const auto& field = fields_[index];
        if (field.name != name) {
            continue;
        }
        if (qualifier.has_value() && field.qualifier != qualifier) {
            continue;
        }
        if (match.has_value()) {
            return PlanResult<std::size_t>::failure(make_plan_diagnostic(
                PlanErrc::UpstreamConstruction,
                "Ambiguous reference to field " + describe_reference(qualifier, name),
                {"Qualify the column with its relation name."}));
        }
        match = index;
    }

    if (!match.has_value()) {
        return PlanResult<std::size_t>::failure(make_plan_diagnostic(
            PlanErrc::UpstreamConstruction,
            "No field named " + describe_reference(qualifier, name)));
    }
    return PlanResult<std::size_t>::ok(*match);
}

bool LogicalSchema::has_column_with_unqualified_name(std::string_view name) const noexcept
{
    for (const auto& field : fields_) {
        if (field.name == name) {
            return true;
        }
    }
    return false;
}

std::vector<std::size_t> LogicalSchema::indices_with_unqualified_name(std::string_view name) const
{
    std::vector<std::size_t> indices;
    for (std::size_t index = 0U; index < fields_.size(); ++index) {
        if (fields_[index].name == name) {
            indices.push_back(index);
        }
    }
    return indices;
}

}  // namespace tributary::planner
