#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Value.hpp"

namespace PartitionFlow
{

    struct ColumnDef
    {
        std::string name;
        ColumnType type;

        bool operator==(const ColumnDef &) const = default;
    };

    // ============================================================================
    // Schema — Ordered, fixed set of typed columns shared by every record
    // ============================================================================
    // Built once per dataset (or once per graph stage that changes the row
    // shape) and then shared read-only through SchemaPtr. Records hold the
    // pointer, not a copy, so a million rows cost one schema.
    // ============================================================================
    class Schema
    {
    public:
        Schema() = default;

        // Throws SchemaError on an invalid identifier, a duplicate name,
        // or a column declared with ColumnType::Null.
        explicit Schema(std::vector<ColumnDef> columns);

        size_t size() const { return columns_.size(); }
        bool empty() const { return columns_.empty(); }

        const std::vector<ColumnDef> &columns() const { return columns_; }
        const ColumnDef &column(size_t index) const { return columns_.at(index); }

        [[nodiscard]]
        std::optional<size_t> index_of(std::string_view name) const;

        // Like index_of, but throws SchemaError("unknown column ...")
        [[nodiscard]]
        size_t require_index(std::string_view name, std::string_view context = "") const;

        bool contains(std::string_view name) const { return index_of(name).has_value(); }

        std::vector<std::string> names() const;

        // "{amount: float, region: text}"
        std::string describe() const;

        bool operator==(const Schema &other) const { return columns_ == other.columns_; }

    private:
        std::vector<ColumnDef> columns_;
        std::map<std::string, size_t, std::less<>> index_; // std::less<> = lookup by string_view
    };

    using SchemaPtr = std::shared_ptr<const Schema>;

    inline SchemaPtr make_schema(std::vector<ColumnDef> columns)
    {
        return std::make_shared<const Schema>(std::move(columns));
    }

} // namespace PartitionFlow
