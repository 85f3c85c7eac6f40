#include "Value.hpp"

#include <array>
#include <charconv> // std::to_chars — shortest round-trip float formatting
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <type_traits>

namespace PartitionFlow
{

    std::string_view type_name(ColumnType type)
    {
        switch (type)
        {
        case ColumnType::Null:
            return "null";
        case ColumnType::Integer:
            return "integer";
        case ColumnType::Float:
            return "float";
        case ColumnType::Text:
            return "text";
        case ColumnType::Timestamp:
            return "timestamp";
        case ColumnType::Boolean:
            return "boolean";
        }
        return "unknown";
    }

    // =========================================================================
    // format_double
    // =========================================================================
    // std::to_chars without a precision argument writes the SHORTEST string
    // that parses back to the exact same double. 0.1 prints as "0.1", not
    // "0.10000000000000001". A 32-byte buffer covers every double.
    // =========================================================================
    static std::string format_double(double d)
    {
        std::array<char, 32> buf{};
        auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
        if (ec != std::errc())
            return std::to_string(d);
        return std::string(buf.data(), ptr);
    }

    std::string format_timestamp(Timestamp ts)
    {
        using namespace std::chrono;

        const sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
        const auto day = floor<days>(tp);
        const year_month_day ymd{day};
        const hh_mm_ss<nanoseconds> tod{tp - day};

        std::array<char, 48> buf{};
        int len = std::snprintf(buf.data(), buf.size(), "%04d-%02u-%02uT%02lld:%02lld:%02lld",
                                static_cast<int>(ymd.year()),
                                static_cast<unsigned>(ymd.month()),
                                static_cast<unsigned>(ymd.day()),
                                static_cast<long long>(tod.hours().count()),
                                static_cast<long long>(tod.minutes().count()),
                                static_cast<long long>(tod.seconds().count()));

        std::string out(buf.data(), static_cast<size_t>(len));
        const auto frac = tod.subseconds().count();
        if (frac != 0)
        {
            std::snprintf(buf.data(), buf.size(), ".%09lld", static_cast<long long>(frac));
            out += buf.data();
        }
        out += 'Z';
        return out;
    }

    std::string to_string(const Value &value)
    {
        switch (type_of(value))
        {
        case ColumnType::Null:
            return "null";
        case ColumnType::Integer:
            return std::to_string(std::get<int64_t>(value));
        case ColumnType::Float:
            return format_double(std::get<double>(value));
        case ColumnType::Text:
            return "\"" + std::get<std::string>(value) + "\"";
        case ColumnType::Timestamp:
            return format_timestamp(std::get<Timestamp>(value));
        case ColumnType::Boolean:
            return std::get<bool>(value) ? "true" : "false";
        }
        return "?";
    }

    std::string to_plain_string(const Value &value)
    {
        switch (type_of(value))
        {
        case ColumnType::Null:
            return "";
        case ColumnType::Text:
            return std::get<std::string>(value);
        case ColumnType::Timestamp:
            return std::to_string(std::get<Timestamp>(value).nanos);
        default:
            return to_string(value);
        }
    }

    std::partial_ordering compare_values(const Value &a, const Value &b)
    {
        const ColumnType ta = type_of(a);
        const ColumnType tb = type_of(b);

        if (ta == ColumnType::Null || tb == ColumnType::Null)
            return std::partial_ordering::unordered;

        if (is_numeric(ta) && is_numeric(tb))
        {
            if (ta == ColumnType::Integer && tb == ColumnType::Integer)
                return std::get<int64_t>(a) <=> std::get<int64_t>(b);
            return as_double(a) <=> as_double(b);
        }

        if (ta != tb)
            return std::partial_ordering::unordered;

        return std::visit(
            [&b](const auto &lhs) -> std::partial_ordering
            {
                using T = std::decay_t<decltype(lhs)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                    return std::partial_ordering::unordered;
                else if constexpr (std::is_same_v<T, std::string>)
                    return lhs.compare(std::get<T>(b)) <=> 0;
                else
                    return lhs <=> std::get<T>(b);
            },
            a);
    }

    double as_double(const Value &value)
    {
        if (const auto *d = std::get_if<double>(&value))
            return *d;
        if (const auto *i = std::get_if<int64_t>(&value))
            return static_cast<double>(*i);
        throw std::invalid_argument("expected a numeric value, got " +
                                    std::string(type_name(type_of(value))) +
                                    " " + to_string(value));
    }

} // namespace PartitionFlow
