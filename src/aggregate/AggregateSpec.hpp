#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace PartitionFlow
{

    enum class AggregateKind
    {
        Count,
        Sum,
        Min,
        Max,
        Average
    };

    inline std::string_view kind_name(AggregateKind kind)
    {
        switch (kind)
        {
        case AggregateKind::Count:
            return "count";
        case AggregateKind::Sum:
            return "sum";
        case AggregateKind::Min:
            return "min";
        case AggregateKind::Max:
            return "max";
        case AggregateKind::Average:
            return "average";
        }
        return "unknown";
    }

    // ============================================================================
    // AggregateSpec — (input column, aggregate kind) for one output column
    // ============================================================================
    // count() without a column counts rows; count("x") counts non-null x.
    // Every other kind needs an input column.
    //
    //   AggregateSpecs specs = {
    //       {"total", AggregateSpec::sum("amount")},
    //       {"count", AggregateSpec::count()},
    //   };
    // ============================================================================
    struct AggregateSpec
    {
        std::optional<std::string> input_column;
        AggregateKind kind = AggregateKind::Count;

        static AggregateSpec count() { return {std::nullopt, AggregateKind::Count}; }
        static AggregateSpec count(std::string column) { return {std::move(column), AggregateKind::Count}; }
        static AggregateSpec sum(std::string column) { return {std::move(column), AggregateKind::Sum}; }
        static AggregateSpec min(std::string column) { return {std::move(column), AggregateKind::Min}; }
        static AggregateSpec max(std::string column) { return {std::move(column), AggregateKind::Max}; }
        static AggregateSpec average(std::string column) { return {std::move(column), AggregateKind::Average}; }

        // "sum(amount)", "count(*)"
        std::string describe() const
        {
            return std::string(kind_name(kind)) + "(" + input_column.value_or("*") + ")";
        }
    };

    // Ordered mapping: output column name -> spec. Output columns appear in
    // this order after the key columns.
    using AggregateSpecs = std::vector<std::pair<std::string, AggregateSpec>>;

} // namespace PartitionFlow
