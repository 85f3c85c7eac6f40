#include "AggregateAccumulator.hpp"
#include "../errors/EtlErrors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace PartitionFlow
{

    static bool is_nan(const Value &value)
    {
        const auto *d = std::get_if<double>(&value);
        return d != nullptr && std::isnan(*d);
    }

    AggregateAccumulator::AggregateAccumulator(AggregateKind kind, ColumnType input_type)
        : kind_(kind), input_type_(input_type)
    {
    }

    ColumnType AggregateAccumulator::output_type(AggregateKind kind, ColumnType input_type)
    {
        switch (kind)
        {
        case AggregateKind::Count:
            return ColumnType::Integer;
        case AggregateKind::Average:
            return ColumnType::Float;
        case AggregateKind::Sum:
        case AggregateKind::Min:
        case AggregateKind::Max:
            return input_type;
        }
        return input_type;
    }

    void AggregateAccumulator::add(const Value &value)
    {
        if (is_null(value))
            return;

        ++count_;

        switch (kind_)
        {
        case AggregateKind::Count:
            break;

        case AggregateKind::Sum:
        case AggregateKind::Average:
            if (const auto *i = std::get_if<int64_t>(&value))
            {
                int64_t sum = 0;
                if (__builtin_add_overflow(int_sum_, *i, &sum))
                    throw std::overflow_error("integer " + std::string(kind_name(kind_)) +
                                              " overflows int64 after adding " + std::to_string(*i));
                int_sum_ = sum;
            }
            else
                float_sum_ += as_double(value);
            break;

        case AggregateKind::Min:
        case AggregateKind::Max:
            fold_extreme(value);
            break;
        }
    }

    void AggregateAccumulator::fold_extreme(const Value &value)
    {
        // NaN absorbs: once seen, it stays, whichever side brought it
        if (is_nan(extreme_))
            return;
        if (is_null(extreme_) || is_nan(value))
        {
            extreme_ = value;
            return;
        }

        const auto ord = compare_values(value, extreme_);
        if ((kind_ == AggregateKind::Min && ord < 0) ||
            (kind_ == AggregateKind::Max && ord > 0))
            extreme_ = value;
    }

    void AggregateAccumulator::combine(const AggregateAccumulator &other)
    {
        if (other.kind_ != kind_ || other.input_type_ != input_type_)
        {
            throw MergeError("cannot combine " + std::string(kind_name(kind_)) + "(" +
                             std::string(type_name(input_type_)) + ") with " +
                             std::string(kind_name(other.kind_)) + "(" +
                             std::string(type_name(other.input_type_)) + ")");
        }

        int64_t int_sum = 0;
        if (__builtin_add_overflow(int_sum_, other.int_sum_, &int_sum))
        {
            throw MergeError("integer " + std::string(kind_name(kind_)) + " overflows int64 when combining " +
                             std::to_string(int_sum_) + " and " + std::to_string(other.int_sum_));
        }

        count_ += other.count_;
        int_sum_ = int_sum;
        float_sum_ += other.float_sum_;

        if (!is_null(other.extreme_))
            fold_extreme(other.extreme_);
    }

    Value AggregateAccumulator::finalize() const
    {
        switch (kind_)
        {
        case AggregateKind::Count:
            return count_;

        case AggregateKind::Sum:
            if (count_ == 0)
                return std::monostate{};
            if (input_type_ == ColumnType::Integer)
                return int_sum_;
            return float_sum_;

        case AggregateKind::Average:
        {
            if (count_ == 0)
                return std::monostate{};
            const double total = input_type_ == ColumnType::Integer
                                     ? static_cast<double>(int_sum_)
                                     : float_sum_;
            return total / static_cast<double>(count_);
        }

        case AggregateKind::Min:
        case AggregateKind::Max:
            return extreme_;
        }
        return std::monostate{};
    }

    // =========================================================================
    // GroupKeyLess
    // =========================================================================
    // Variant operator< is not a strict weak order once a NaN is involved,
    // so floats get their own three-way rule here.
    static int compare_key_values(const Value &a, const Value &b)
    {
        if (a.index() != b.index())
            return a.index() < b.index() ? -1 : 1;

        if (const auto *x = std::get_if<double>(&a))
        {
            const double y = std::get<double>(b);
            const bool x_nan = std::isnan(*x);
            const bool y_nan = std::isnan(y);
            if (x_nan || y_nan)
                return x_nan == y_nan ? 0 : (x_nan ? 1 : -1);
            return *x < y ? -1 : (y < *x ? 1 : 0);
        }

        return a < b ? -1 : (b < a ? 1 : 0);
    }

    bool GroupKeyLess::operator()(const GroupKey &a, const GroupKey &b) const
    {
        const size_t n = std::min(a.size(), b.size());
        for (size_t i = 0; i < n; ++i)
        {
            const int c = compare_key_values(a[i], b[i]);
            if (c != 0)
                return c < 0;
        }
        return a.size() < b.size();
    }

} // namespace PartitionFlow
