#pragma once

// ============================================================================
// Projection — Describes how a Map node reshapes each record
// ============================================================================
// An ordered list of output columns. Each one either passes an input column
// through (optionally renamed) or is computed by a pure function:
//
//   Projection()
//       .keep_all()                                   // every input column
//       .derive("amount_with_tax", ColumnType::Float, {"amount"},
//               [](const Record &r) { return r.get_float("amount") * 1.18; });
//
//   Projection::select({"region", "amount"})          // subset, in this order
//
// The output schema is known at build time. Running the functions happens
// only when the graph executes.
// ============================================================================

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../model/Record.hpp"
#include "../model/Schema.hpp"

namespace PartitionFlow
{

    // A projection resolved against one input schema. Immutable, shared by
    // all partition tasks.
    class BoundProjection
    {
    public:
        using ValueFn = std::function<Value(const Record &)>;

        struct Step
        {
            std::optional<size_t> source_index; // pass-through column
            ValueFn fn;                         // derived column
            std::string name;
            ColumnType type;
        };

        BoundProjection(SchemaPtr output_schema, std::vector<Step> steps)
            : output_schema_(std::move(output_schema)), steps_(std::move(steps))
        {
        }

        const SchemaPtr &output_schema() const { return output_schema_; }

        // Throws std::invalid_argument when a derived value does not fit its
        // declared type. An Integer result for a Float column is widened.
        [[nodiscard]]
        Record apply(const Record &input) const;

    private:
        SchemaPtr output_schema_;
        std::vector<Step> steps_;
    };

    class Projection
    {
    public:
        using ValueFn = BoundProjection::ValueFn;

        Projection() = default;

        [[nodiscard]]
        static Projection select(std::vector<std::string> columns);

        Projection &keep_all();
        Projection &keep(std::string column);
        Projection &rename(std::string from, std::string to);
        Projection &derive(std::string name, ColumnType type, std::vector<std::string> reads, ValueFn fn);

        // Throws SchemaError: unknown input column, duplicate output name,
        // invalid identifier, null type, or an empty projection.
        [[nodiscard]]
        BoundProjection bind(const Schema &input) const;

        std::string describe() const;

    private:
        enum class Kind
        {
            KeepAll,
            Keep,
            Derive
        };

        struct Entry
        {
            Kind kind;
            std::string source; // Keep: input column
            std::string name;   // Keep: output name, Derive: new column
            ColumnType type = ColumnType::Null;
            std::vector<std::string> reads;
            ValueFn fn;
        };

        std::vector<Entry> entries_;
    };

} // namespace PartitionFlow
