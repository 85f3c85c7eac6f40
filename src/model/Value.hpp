#pragma once

#include <compare>
#include <cstdint> // int64_t for integers and nanosecond timestamps
#include <string>
#include <string_view>
#include <variant>

namespace PartitionFlow
{

    // ============================================================================
    // Timestamp — Nanoseconds since the Unix epoch (UTC)
    // ============================================================================
    // Wrapped in its own type so a timestamp never compares equal to a plain
    // integer column.
    // ============================================================================
    struct Timestamp
    {
        int64_t nanos = 0;

        auto operator<=>(const Timestamp &) const = default;
    };

    // ============================================================================
    // ColumnType — Declared type of a column
    // ============================================================================
    // The enumerator order MUST match the alternative order of Value below:
    // type_of() is a plain cast of variant::index().
    // ============================================================================
    enum class ColumnType : uint8_t
    {
        Null = 0,
        Integer = 1,
        Float = 2,
        Text = 3,
        Timestamp = 4,
        Boolean = 5
    };

    // A typed scalar. std::monostate is SQL NULL.
    using Value = std::variant<std::monostate, int64_t, double, std::string, Timestamp, bool>;

    inline ColumnType type_of(const Value &value)
    {
        return static_cast<ColumnType>(value.index());
    }

    inline bool is_null(const Value &value)
    {
        return std::holds_alternative<std::monostate>(value);
    }

    // Null conforms to every column type
    inline bool conforms(const Value &value, ColumnType type)
    {
        return is_null(value) || type_of(value) == type;
    }

    inline bool is_numeric(ColumnType type)
    {
        return type == ColumnType::Integer || type == ColumnType::Float;
    }

    std::string_view type_name(ColumnType type);

    // Three-way comparison of two non-null values. Integer and Float compare
    // numerically with each other; any other mix of types is unordered, as is
    // NaN. Null against anything is unordered too.
    std::partial_ordering compare_values(const Value &a, const Value &b);

    // Human-readable rendering used in logs and error messages.
    // Text is quoted, null prints as "null", timestamps as ISO-8601 UTC.
    std::string to_string(const Value &value);

    // Plain rendering for sinks: no quotes, empty string for null,
    // shortest round-trip form for floats, nanosecond integer for timestamps.
    std::string to_plain_string(const Value &value);

    // Integer or Float promoted to double. Throws std::invalid_argument otherwise.
    double as_double(const Value &value);

    std::string format_timestamp(Timestamp ts);

} // namespace PartitionFlow
