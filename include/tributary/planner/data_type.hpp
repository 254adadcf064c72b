#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace tributary::planner {

enum class DataType : std::uint8_t {
    Null = 0,
    Boolean,
    Int64,
    UInt64,
    Float64,
    Utf8,
    Timestamp,
    Duration,
    Struct
};

[[nodiscard]] std::string data_type_name(DataType type);
[[nodiscard]] bool is_numeric(DataType type) noexcept;
[[nodiscard]] std::string format_duration(std::chrono::microseconds duration);

class ScalarValue final {
public:
    using Payload = std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string>;

    ScalarValue() = default;

    static ScalarValue null(DataType type = DataType::Null);
    static ScalarValue boolean(bool value);
    static ScalarValue int64(std::int64_t value);
    static ScalarValue uint64(std::uint64_t value);
    static ScalarValue float64(double value);
    static ScalarValue utf8(std::string value);
    // Nanoseconds since the Unix epoch.
    static ScalarValue timestamp(std::int64_t nanos);
    static ScalarValue duration(std::chrono::microseconds value);

    [[nodiscard]] DataType type() const noexcept;
    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] const Payload& payload() const noexcept;

    [[nodiscard]] std::optional<bool> as_boolean() const noexcept;
    [[nodiscard]] std::optional<std::int64_t> as_int64() const noexcept;

    // SQL comparison: empty when either side is NULL or the types are not comparable.
    [[nodiscard]] std::optional<int> compare(const ScalarValue& other) const noexcept;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ScalarValue& lhs, const ScalarValue& rhs) noexcept;
    friend bool operator!=(const ScalarValue& lhs, const ScalarValue& rhs) noexcept;

private:
    ScalarValue(DataType type, Payload payload);

    DataType type_ = DataType::Null;
    Payload payload_{};
};

}  // namespace tributary::planner
