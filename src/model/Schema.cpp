#include "Schema.hpp"
#include "../errors/EtlErrors.hpp"
#include "../validator/SchemaValidator.hpp"

namespace PartitionFlow
{

    Schema::Schema(std::vector<ColumnDef> columns)
        : columns_(std::move(columns))
    {
        for (size_t i = 0; i < columns_.size(); ++i)
        {
            const auto &col = columns_[i];
            SchemaValidator::require_identifier(col.name, "column");

            if (col.type == ColumnType::Null)
                throw SchemaError("column '" + col.name + "' cannot be declared with type null");

            auto [it, inserted] = index_.emplace(col.name, i);
            if (!inserted)
                throw SchemaError("duplicate column name '" + col.name + "'");
        }
    }

    std::optional<size_t> Schema::index_of(std::string_view name) const
    {
        auto it = index_.find(name);
        if (it == index_.end())
            return std::nullopt;
        return it->second;
    }

    size_t Schema::require_index(std::string_view name, std::string_view context) const
    {
        if (auto idx = index_of(name))
            return *idx;

        std::string msg = "unknown column '" + std::string(name) + "'";
        if (!context.empty())
            msg += " in " + std::string(context);
        msg += "; schema is " + describe();
        throw SchemaError(msg);
    }

    std::vector<std::string> Schema::names() const
    {
        std::vector<std::string> out;
        out.reserve(columns_.size());
        for (const auto &c : columns_)
            out.push_back(c.name);
        return out;
    }

    std::string Schema::describe() const
    {
        std::string out = "{";
        for (size_t i = 0; i < columns_.size(); ++i)
        {
            if (i > 0)
                out += ", ";
            out += columns_[i].name;
            out += ": ";
            out += type_name(columns_[i].type);
        }
        out += "}";
        return out;
    }

} // namespace PartitionFlow
