#include "tributary/planner/data_type.hpp"

#include <array>
#include <sstream>
#include <utility>

namespace tributary::planner {

namespace {

template <typename T>
int three_way(const T& lhs, const T& rhs) noexcept
{
    if (lhs < rhs) {
        return -1;
    }
    if (rhs < lhs) {
        return 1;
    }
    return 0;
}

bool is_integral_time(DataType type) noexcept
{
    return type == DataType::Timestamp || type == DataType::Duration;
}

long double widen(const ScalarValue::Payload& payload) noexcept
{
    if (const auto* signed_value = std::get_if<std::int64_t>(&payload)) {
        return static_cast<long double>(*signed_value);
    }
    if (const auto* unsigned_value = std::get_if<std::uint64_t>(&payload)) {
        return static_cast<long double>(*unsigned_value);
    }
    if (const auto* floating = std::get_if<double>(&payload)) {
        return static_cast<long double>(*floating);
    }
    return 0.0L;
}

}  // namespace

std::string data_type_name(DataType type)
{
    switch (type) {
    case DataType::Null:
        return "NULL";
    case DataType::Boolean:
        return "BOOLEAN";
    case DataType::Int64:
        return "INT64";
    case DataType::UInt64:
        return "UINT64";
    case DataType::Float64:
        return "FLOAT64";
    case DataType::Utf8:
        return "UTF8";
    case DataType::Timestamp:
        return "TIMESTAMP";
    case DataType::Duration:
        return "DURATION";
    case DataType::Struct:
        return "STRUCT";
    }
    return "UNKNOWN";
}

bool is_numeric(DataType type) noexcept
{
    return type == DataType::Int64 || type == DataType::UInt64 || type == DataType::Float64;
}

std::string format_duration(std::chrono::microseconds duration)
{
    struct Unit final {
        std::int64_t micros;
        const char* suffix;
    };
    static constexpr std::array<Unit, 6> kUnits{{
        {86'400'000'000LL, "d"},
        {3'600'000'000LL, "h"},
        {60'000'000LL, "m"},
        {1'000'000LL, "s"},
        {1'000LL, "ms"},
        {1LL, "us"},
    }};

    const auto count = duration.count();
    if (count == 0) {
        return "0s";
    }
    for (const auto& unit : kUnits) {
        if (count % unit.micros == 0) {
            return std::to_string(count / unit.micros) + unit.suffix;
        }
    }
    return std::to_string(count) + "us";
}

ScalarValue::ScalarValue(DataType type, Payload payload)
    : type_{type}
    , payload_{std::move(payload)}
{
}

ScalarValue ScalarValue::null(DataType type)
{
    return ScalarValue{type, std::monostate{}};
}

ScalarValue ScalarValue::boolean(bool value)
{
    return ScalarValue{DataType::Boolean, value};
}

ScalarValue ScalarValue::int64(std::int64_t value)
{
    return ScalarValue{DataType::Int64, value};
}

ScalarValue ScalarValue::uint64(std::uint64_t value)
{
    return ScalarValue{DataType::UInt64, value};
}

ScalarValue ScalarValue::float64(double value)
{
    return ScalarValue{DataType::Float64, value};
}

ScalarValue ScalarValue::utf8(std::string value)
{
    return ScalarValue{DataType::Utf8, std::move(value)};
}

ScalarValue ScalarValue::timestamp(std::int64_t nanos)
{
    return ScalarValue{DataType::Timestamp, nanos};
}

ScalarValue ScalarValue::duration(std::chrono::microseconds value)
{
    return ScalarValue{DataType::Duration, static_cast<std::int64_t>(value.count())};
}

DataType ScalarValue::type() const noexcept
{
    return type_;
}

bool ScalarValue::is_null() const noexcept
{
    return std::holds_alternative<std::monostate>(payload_);
}

const ScalarValue::Payload& ScalarValue::payload() const noexcept
{
    return payload_;
}

std::optional<bool> ScalarValue::as_boolean() const noexcept
{
    if (const auto* value = std::get_if<bool>(&payload_)) {
        return *value;
    }
    return std::nullopt;
}

std::optional<std::int64_t> ScalarValue::as_int64() const noexcept
{
    if (const auto* value = std::get_if<std::int64_t>(&payload_)) {
        return *value;
    }
    return std::nullopt;
}

std::optional<int> ScalarValue::compare(const ScalarValue& other) const noexcept
{
    if (is_null() || other.is_null()) {
        return std::nullopt;
    }

    if (is_integral_time(type_) || is_integral_time(other.type_)) {
        if (type_ != other.type_) {
            return std::nullopt;
        }
        return three_way(std::get<std::int64_t>(payload_), std::get<std::int64_t>(other.payload_));
    }

    if (is_numeric(type_) && is_numeric(other.type_)) {
        if (type_ == other.type_ && type_ == DataType::Int64) {
            return three_way(std::get<std::int64_t>(payload_), std::get<std::int64_t>(other.payload_));
        }
        if (type_ == other.type_ && type_ == DataType::UInt64) {
            return three_way(std::get<std::uint64_t>(payload_), std::get<std::uint64_t>(other.payload_));
        }
        return three_way(widen(payload_), widen(other.payload_));
    }

    if (type_ != other.type_) {
        return std::nullopt;
    }

    switch (type_) {
    case DataType::Boolean:
        return three_way(std::get<bool>(payload_), std::get<bool>(other.payload_));
    case DataType::Utf8:
        return three_way(std::get<std::string>(payload_), std::get<std::string>(other.payload_));
    default:
        return std::nullopt;
    }
}

std::string ScalarValue::to_string() const
{
    if (is_null()) {
        return "NULL";
    }

    switch (type_) {
    case DataType::Boolean:
        return std::get<bool>(payload_) ? "true" : "false";
    case DataType::Int64:
        return std::to_string(std::get<std::int64_t>(payload_));
    case DataType::UInt64:
        return std::to_string(std::get<std::uint64_t>(payload_));
    case DataType::Float64: {
        std::ostringstream stream;
        stream << std::get<double>(payload_);
        return stream.str();
    }
    case DataType::Utf8: {
        std::string text;
        text.push_back('\'');
        text.append(std::get<std::string>(payload_));
        text.push_back('\'');
        return text;
    }
    case DataType::Timestamp:
        return "TIMESTAMP " + std::to_string(std::get<std::int64_t>(payload_)) + "ns";
    case DataType::Duration:
        return "INTERVAL " + format_duration(std::chrono::microseconds{std::get<std::int64_t>(payload_)});
    default:
        return "<value>";
    }
}

bool operator==(const ScalarValue& lhs, const ScalarValue& rhs) noexcept
{
    return lhs.type_ == rhs.type_ && lhs.payload_ == rhs.payload_;
}

bool operator!=(const ScalarValue& lhs, const ScalarValue& rhs) noexcept
{
    return !(lhs == rhs);
}

}  // namespace tributary::planner
