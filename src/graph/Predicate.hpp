#pragma once

// ============================================================================
// Predicate — A pure, per-record boolean test used by Filter nodes
// ============================================================================
//
// Two families:
//
//   Checkable at build time (the engine knows what they read and return):
//     Predicate::compare("amount", CompareOp::Greater, 0.0)
//     Predicate::is_not_null("amount")
//     Predicate::column_is_true("is_online")
//
//   Opaque (a user function; only the declared read set is checkable):
//     Predicate::custom("big_north", {"amount", "region"},
//                       [](const Record &r) { return ...; })
//     Predicate::from_value("flag", {"flag"},
//                           [](const Record &r) { return r.get("flag"); })
//
// bind() validates against a schema and resolves column names to indices.
// Build-time problems throw SchemaError. Problems that only show up on a
// particular record (a from_value function returning text, a user function
// throwing) surface from evaluate() as std::exception, which the executor
// wraps into an EvaluationError naming that record.
// ============================================================================

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../model/Record.hpp"
#include "../model/Schema.hpp"
#include "../model/Value.hpp"

namespace PartitionFlow
{

    enum class CompareOp
    {
        Equal,
        NotEqual,
        Less,
        LessEqual,
        Greater,
        GreaterEqual
    };

    std::string_view op_symbol(CompareOp op);

    class Predicate
    {
    public:
        using BoolFn = std::function<bool(const Record &)>;
        using ValueFn = std::function<Value(const Record &)>;

        // column <op> literal. A null column value never satisfies the test.
        [[nodiscard]] static Predicate compare(std::string column, CompareOp op, Value literal);
        [[nodiscard]] static Predicate is_not_null(std::string column);
        [[nodiscard]] static Predicate column_is_true(std::string column);
        [[nodiscard]] static Predicate custom(std::string label, std::vector<std::string> reads, BoolFn fn);
        [[nodiscard]] static Predicate from_value(std::string label, std::vector<std::string> reads, ValueFn fn);

        // Validates against the input schema and returns a copy with column
        // indices resolved. Throws SchemaError.
        [[nodiscard]]
        Predicate bind(const Schema &schema) const;

        // Requires a bound predicate. Throws std::invalid_argument when an
        // opaque predicate yields something other than a boolean.
        [[nodiscard]]
        bool evaluate(const Record &record) const;

        const std::string &label() const { return label_; }
        const std::vector<std::string> &reads() const { return reads_; }
        bool is_bound() const { return bound_; }

    private:
        enum class Kind
        {
            Compare,
            NotNull,
            ColumnTruth,
            Custom,
            FromValue
        };

        Predicate(Kind kind, std::string label, std::vector<std::string> reads);

        Kind kind_;
        std::string label_;
        std::vector<std::string> reads_;

        CompareOp op_ = CompareOp::Equal;
        Value literal_;
        BoolFn bool_fn_;
        ValueFn value_fn_;

        size_t column_index_ = 0; // resolved by bind() for single-column kinds
        bool bound_ = false;
    };

} // namespace PartitionFlow
