#include "Predicate.hpp"
#include "../errors/EtlErrors.hpp"

#include <stdexcept>

namespace PartitionFlow
{

    std::string_view op_symbol(CompareOp op)
    {
        switch (op)
        {
        case CompareOp::Equal:
            return "==";
        case CompareOp::NotEqual:
            return "!=";
        case CompareOp::Less:
            return "<";
        case CompareOp::LessEqual:
            return "<=";
        case CompareOp::Greater:
            return ">";
        case CompareOp::GreaterEqual:
            return ">=";
        }
        return "?";
    }

    Predicate::Predicate(Kind kind, std::string label, std::vector<std::string> reads)
        : kind_(kind), label_(std::move(label)), reads_(std::move(reads))
    {
    }

    Predicate Predicate::compare(std::string column, CompareOp op, Value literal)
    {
        std::string label = column + " " + std::string(op_symbol(op)) + " " + to_string(literal);
        Predicate p(Kind::Compare, std::move(label), {std::move(column)});
        p.op_ = op;
        p.literal_ = std::move(literal);
        return p;
    }

    Predicate Predicate::is_not_null(std::string column)
    {
        std::string label = column + " is not null";
        return Predicate(Kind::NotNull, std::move(label), {std::move(column)});
    }

    Predicate Predicate::column_is_true(std::string column)
    {
        std::string label = column;
        return Predicate(Kind::ColumnTruth, std::move(label), {std::move(column)});
    }

    Predicate Predicate::custom(std::string label, std::vector<std::string> reads, BoolFn fn)
    {
        if (!fn)
            throw SchemaError("predicate '" + label + "' has no function");
        Predicate p(Kind::Custom, std::move(label), std::move(reads));
        p.bool_fn_ = std::move(fn);
        return p;
    }

    Predicate Predicate::from_value(std::string label, std::vector<std::string> reads, ValueFn fn)
    {
        if (!fn)
            throw SchemaError("predicate '" + label + "' has no function");
        Predicate p(Kind::FromValue, std::move(label), std::move(reads));
        p.value_fn_ = std::move(fn);
        return p;
    }

    // =========================================================================
    // bind() — every build-time check a predicate can get
    // =========================================================================
    Predicate Predicate::bind(const Schema &schema) const
    {
        const std::string context = "filter '" + label_ + "'";

        for (const auto &column : reads_)
            (void)schema.require_index(column, context);

        Predicate bound = *this;

        switch (kind_)
        {
        case Kind::Compare:
        {
            bound.column_index_ = schema.require_index(reads_.front(), context);
            const ColumnType col_type = schema.column(bound.column_index_).type;
            const ColumnType lit_type = type_of(literal_);

            if (lit_type == ColumnType::Null)
                throw SchemaError(context + ": cannot compare with null, use is_not_null()");

            const bool compatible = (is_numeric(col_type) && is_numeric(lit_type)) || col_type == lit_type;
            if (!compatible)
            {
                throw SchemaError(context + ": column '" + reads_.front() + "' is " +
                                  std::string(type_name(col_type)) + ", literal is " +
                                  std::string(type_name(lit_type)));
            }
            break;
        }

        case Kind::NotNull:
            bound.column_index_ = schema.require_index(reads_.front(), context);
            break;

        case Kind::ColumnTruth:
        {
            bound.column_index_ = schema.require_index(reads_.front(), context);
            const ColumnType col_type = schema.column(bound.column_index_).type;
            if (col_type != ColumnType::Boolean)
            {
                throw SchemaError(context + ": predicate yields " +
                                  std::string(type_name(col_type)) + ", not boolean");
            }
            break;
        }

        case Kind::Custom:
        case Kind::FromValue:
            break;
        }

        bound.bound_ = true;
        return bound;
    }

    bool Predicate::evaluate(const Record &record) const
    {
        switch (kind_)
        {
        case Kind::Compare:
        {
            const Value &v = record.at(column_index_);
            if (is_null(v))
                return false;

            const auto ord = compare_values(v, literal_);
            switch (op_)
            {
            case CompareOp::Equal:
                return ord == 0;
            case CompareOp::NotEqual:
                return ord != 0;
            case CompareOp::Less:
                return ord < 0;
            case CompareOp::LessEqual:
                return ord <= 0;
            case CompareOp::Greater:
                return ord > 0;
            case CompareOp::GreaterEqual:
                return ord >= 0;
            }
            return false;
        }

        case Kind::NotNull:
            return !is_null(record.at(column_index_));

        case Kind::ColumnTruth:
        {
            const Value &v = record.at(column_index_);
            return !is_null(v) && std::get<bool>(v);
        }

        case Kind::Custom:
            return bool_fn_(record);

        case Kind::FromValue:
        {
            const Value v = value_fn_(record);
            if (const bool *b = std::get_if<bool>(&v))
                return *b;
            throw std::invalid_argument("predicate '" + label_ + "' produced " +
                                        std::string(type_name(type_of(v))) + " " +
                                        to_string(v) + ", expected boolean");
        }
        }
        return false;
    }

} // namespace PartitionFlow
