#include "Projection.hpp"
#include "../errors/EtlErrors.hpp"

#include <stdexcept>

namespace PartitionFlow
{

    Record BoundProjection::apply(const Record &input) const
    {
        std::vector<Value> values;
        values.reserve(steps_.size());

        for (const auto &step : steps_)
        {
            if (step.source_index)
            {
                values.push_back(input.at(*step.source_index));
                continue;
            }

            Value v = step.fn(input);

            // Integer → Float widening is the one implicit conversion allowed
            if (step.type == ColumnType::Float && type_of(v) == ColumnType::Integer)
                v = static_cast<double>(std::get<int64_t>(v));

            if (!conforms(v, step.type))
            {
                throw std::invalid_argument("derived column '" + step.name + "' is declared " +
                                            std::string(type_name(step.type)) + " but produced " +
                                            std::string(type_name(type_of(v))) + " " + to_string(v));
            }
            values.push_back(std::move(v));
        }

        return Record(output_schema_, std::move(values));
    }

    Projection Projection::select(std::vector<std::string> columns)
    {
        Projection p;
        for (auto &c : columns)
            p.keep(std::move(c));
        return p;
    }

    Projection &Projection::keep_all()
    {
        entries_.push_back({Kind::KeepAll, {}, {}, ColumnType::Null, {}, {}});
        return *this;
    }

    Projection &Projection::keep(std::string column)
    {
        std::string name = column;
        entries_.push_back({Kind::Keep, std::move(column), std::move(name), ColumnType::Null, {}, {}});
        return *this;
    }

    Projection &Projection::rename(std::string from, std::string to)
    {
        entries_.push_back({Kind::Keep, std::move(from), std::move(to), ColumnType::Null, {}, {}});
        return *this;
    }

    Projection &Projection::derive(std::string name, ColumnType type, std::vector<std::string> reads, ValueFn fn)
    {
        if (!fn)
            throw SchemaError("derived column '" + name + "' has no function");
        entries_.push_back({Kind::Derive, {}, std::move(name), type, std::move(reads), std::move(fn)});
        return *this;
    }

    BoundProjection Projection::bind(const Schema &input) const
    {
        std::vector<BoundProjection::Step> steps;
        std::vector<ColumnDef> out_columns;

        auto add_pass_through = [&](size_t index, const std::string &name)
        {
            steps.push_back({index, {}, name, input.column(index).type});
            out_columns.push_back({name, input.column(index).type});
        };

        for (const auto &e : entries_)
        {
            switch (e.kind)
            {
            case Kind::KeepAll:
                for (size_t i = 0; i < input.size(); ++i)
                    add_pass_through(i, input.column(i).name);
                break;

            case Kind::Keep:
                add_pass_through(input.require_index(e.source, "map"), e.name);
                break;

            case Kind::Derive:
                for (const auto &r : e.reads)
                    (void)input.require_index(r, "derived column '" + e.name + "'");
                steps.push_back({std::nullopt, e.fn, e.name, e.type});
                out_columns.push_back({e.name, e.type});
                break;
            }
        }

        if (out_columns.empty())
            throw SchemaError("map projection produces no columns");

        // Schema's constructor rejects duplicate names, bad identifiers and null types
        auto schema = make_schema(std::move(out_columns));
        return BoundProjection(std::move(schema), std::move(steps));
    }

    std::string Projection::describe() const
    {
        std::string out;
        for (const auto &e : entries_)
        {
            if (!out.empty())
                out += ", ";
            switch (e.kind)
            {
            case Kind::KeepAll:
                out += "*";
                break;
            case Kind::Keep:
                out += e.source == e.name ? e.name : e.source + " AS " + e.name;
                break;
            case Kind::Derive:
                out += e.name + "=f(";
                for (size_t i = 0; i < e.reads.size(); ++i)
                    out += (i ? "," : "") + e.reads[i];
                out += ")";
                break;
            }
        }
        return out;
    }

} // namespace PartitionFlow
