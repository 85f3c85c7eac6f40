#include "Record.hpp"
#include "../errors/EtlErrors.hpp"

#include <stdexcept>

namespace PartitionFlow
{

    Record::Record(SchemaPtr schema, std::vector<Value> values)
        : schema_(std::move(schema)), values_(std::move(values))
    {
        if (!schema_)
            throw SchemaError("record constructed without a schema");

        if (values_.size() != schema_->size())
        {
            throw SchemaError("record has " + std::to_string(values_.size()) +
                              " values, schema " + schema_->describe() + " has " +
                              std::to_string(schema_->size()) + " columns");
        }

        for (size_t i = 0; i < values_.size(); ++i)
        {
            const auto &col = schema_->column(i);
            if (!conforms(values_[i], col.type))
            {
                throw SchemaError("column '" + col.name + "' is " +
                                  std::string(type_name(col.type)) + ", got " +
                                  std::string(type_name(type_of(values_[i]))) +
                                  " value " + to_string(values_[i]));
            }
        }
    }

    const Value &Record::get(std::string_view column) const
    {
        auto idx = schema_->index_of(column);
        if (!idx)
            throw std::out_of_range("unknown column '" + std::string(column) + "'");
        return values_[*idx];
    }

    template <typename T>
    const T &Record::typed(std::string_view column) const
    {
        const Value &v = get(column);
        if (const T *p = std::get_if<T>(&v))
            return *p;

        throw std::invalid_argument("column '" + std::string(column) + "' holds " +
                                    std::string(type_name(type_of(v))) + " " + to_string(v));
    }

    double Record::get_float(std::string_view column) const
    {
        const Value &v = get(column);
        if (PartitionFlow::is_null(v))
            throw std::invalid_argument("column '" + std::string(column) + "' is null");
        return as_double(v);
    }

    int64_t Record::get_int(std::string_view column) const
    {
        return typed<int64_t>(column);
    }

    const std::string &Record::get_text(std::string_view column) const
    {
        return typed<std::string>(column);
    }

    bool Record::get_bool(std::string_view column) const
    {
        return typed<bool>(column);
    }

    Timestamp Record::get_timestamp(std::string_view column) const
    {
        return typed<Timestamp>(column);
    }

    std::string Record::describe() const
    {
        std::string out = "{";
        for (size_t i = 0; i < values_.size(); ++i)
        {
            if (i > 0)
                out += ", ";
            out += schema_->column(i).name;
            out += '=';
            out += to_string(values_[i]);
        }
        out += "}";
        return out;
    }

    bool Record::operator==(const Record &other) const
    {
        if (values_ != other.values_)
            return false;
        return schema_ == other.schema_ || *schema_ == *other.schema_;
    }

} // namespace PartitionFlow
