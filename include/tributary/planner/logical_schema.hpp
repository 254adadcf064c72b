#pragma once

#include "tributary/planner/data_type.hpp"
#include "tributary/planner/plan_errors.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tributary::planner {

// Event-time column every streaming input carries.
inline constexpr std::string_view kTimestampField = "_timestamp";
// Present on plans that emit change-stream (retract/append) records.
inline constexpr std::string_view kUpdatingMetaField = "_updating_meta";
// Relation qualifier for columns the planner synthesises.
inline constexpr std::string_view kInternalQualifier = "_arroyo";

[[nodiscard]] std::string key_field_name(std::size_t index);

using FieldMetadata = std::map<std::string, std::string>;

struct QualifiedField final {
    std::optional<std::string> qualifier{};
    std::string name{};
    DataType type = DataType::Null;
    bool nullable = true;
    FieldMetadata metadata{};

    [[nodiscard]] std::string qualified_name() const;

    bool operator==(const QualifiedField& other) const = default;
};

class LogicalSchema final {
public:
    LogicalSchema() = default;

    // Builds a schema after rejecting duplicate or ambiguous field names.
    static PlanResult<LogicalSchema> try_new(std::vector<QualifiedField> fields, FieldMetadata metadata = {});

    [[nodiscard]] const std::vector<QualifiedField>& fields() const noexcept;
    [[nodiscard]] const FieldMetadata& metadata() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const QualifiedField& field(std::size_t index) const;

    // Qualified lookups match exactly; unqualified lookups must match a single field.
    [[nodiscard]] PlanResult<std::size_t> index_of(const std::optional<std::string>& qualifier,
                                                   std::string_view name) const;
    [[nodiscard]] bool has_column_with_unqualified_name(std::string_view name) const noexcept;
    [[nodiscard]] std::vector<std::size_t> indices_with_unqualified_name(std::string_view name) const;

    bool operator==(const LogicalSchema& other) const = default;

private:
    LogicalSchema(std::vector<QualifiedField> fields, FieldMetadata metadata);

    std::vector<QualifiedField> fields_{};
    FieldMetadata metadata_{};
};

}  // namespace tributary::planner
