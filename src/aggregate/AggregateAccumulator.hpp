#pragma once

// ============================================================================
// AggregateAccumulator — Per-group, per-output-column running state
// ============================================================================
//
// Each partition folds its records into its own accumulators. The merge
// phase then combines accumulators of the same group key across partitions:
//
//   partition 0: north → {count=3, sum=30.0}
//   partition 1: north → {count=2, sum=15.0}
//   ─────────────────────────────────────────
//   combined:    north → {count=5, sum=45.0}   average = 45.0 / 5 = 9.0
//
// combine() is commutative and associative for every kind: counts and sums
// add, min/max keep the extreme. Average is NEVER stored as a running
// average. It is kept as (sum, count) and divided in finalize(), after the
// last partition has been combined. avg(avg(a), avg(b)) != avg(a ∪ b).
// ============================================================================

#include <cstdint>
#include <map>
#include <vector>
#include "../model/Value.hpp"
#include "AggregateSpec.hpp"

namespace PartitionFlow
{

    class AggregateAccumulator
    {
    public:
        // input_type is the declared type of the input column (Integer for count(*))
        AggregateAccumulator(AggregateKind kind, ColumnType input_type);

        // Folds one input value in. Nulls are skipped by every kind.
        // Throws std::overflow_error when an Integer sum leaves int64 range.
        void add(const Value &value);

        // count(*): one more row, regardless of values
        void add_row() { ++count_; }

        // Throws MergeError if kind or input type differ, or if an Integer
        // sum would overflow. `this` is left unchanged on a throw.
        void combine(const AggregateAccumulator &other);

        // Final value: Integer count, Integer/Float sum, Float average,
        // min/max in the input type. Null when no value contributed
        // (except count, which is 0). A NaN seen by min/max wins on
        // every side of a combine.
        [[nodiscard]]
        Value finalize() const;

        AggregateKind kind() const { return kind_; }
        ColumnType input_type() const { return input_type_; }
        int64_t count() const { return count_; }

        // Output column type for a kind over an input type
        static ColumnType output_type(AggregateKind kind, ColumnType input_type);

    private:
        void fold_extreme(const Value &value);

        AggregateKind kind_;
        ColumnType input_type_;

        int64_t count_ = 0;      // rows (count(*)) or non-null values seen
        int64_t int_sum_ = 0;    // Integer sum / average
        double float_sum_ = 0.0; // Float sum / average
        Value extreme_;          // min or max so far; null until the first value
    };

    // Key-column values of one group, in key-column order
    using GroupKey = std::vector<Value>;

    // Strict total order over group keys: column by column, type first, then
    // value. A NaN float sorts after every other float and ties with any
    // other NaN, so NaN keys collapse into one group.
    struct GroupKeyLess
    {
        bool operator()(const GroupKey &a, const GroupKey &b) const;
    };

    // One accumulator per aggregate output column, in spec order
    using AccumulatorRow = std::vector<AggregateAccumulator>;

    // Group key → accumulators. std::map keeps keys ordered, so iterating a
    // table always yields groups in the same order.
    using GroupTable = std::map<GroupKey, AccumulatorRow, GroupKeyLess>;

} // namespace PartitionFlow
