#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "Schema.hpp"
#include "Value.hpp"

namespace PartitionFlow
{

    /**
     * @brief One row of a dataset: a schema pointer plus one Value per column.
     *
     * Values are stored positionally in schema order. Name lookups go through
     * the schema's index, so get("amount") is a map lookup, at(i) is direct.
     */
    class Record
    {
    public:
        // Throws SchemaError if the value count or any value type does not
        // match the schema. Null is accepted for every column.
        Record(SchemaPtr schema, std::vector<Value> values);

        const SchemaPtr &schema() const { return schema_; }
        const std::vector<Value> &values() const { return values_; }
        size_t size() const { return values_.size(); }

        const Value &at(size_t index) const { return values_.at(index); }

        // Throws std::out_of_range for a column the schema does not have
        [[nodiscard]]
        const Value &get(std::string_view column) const;

        bool is_null(std::string_view column) const { return PartitionFlow::is_null(get(column)); }

        // Typed accessors. Throw std::invalid_argument on null or wrong type.
        // get_float() also accepts Integer columns.
        [[nodiscard]] double get_float(std::string_view column) const;
        [[nodiscard]] int64_t get_int(std::string_view column) const;
        [[nodiscard]] const std::string &get_text(std::string_view column) const;
        [[nodiscard]] bool get_bool(std::string_view column) const;
        [[nodiscard]] Timestamp get_timestamp(std::string_view column) const;

        // {amount=12.5, region="north"}
        std::string describe() const;

        // Equal when both schemas have the same columns and all values match
        bool operator==(const Record &other) const;

    private:
        template <typename T>
        const T &typed(std::string_view column) const;

        SchemaPtr schema_;
        std::vector<Value> values_;
    };

} // namespace PartitionFlow
