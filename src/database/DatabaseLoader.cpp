#include "DatabaseLoader.hpp"
#include "../errors/EtlErrors.hpp"
#include "../validator/SchemaValidator.hpp"

#include <iostream>

namespace PartitionFlow
{

    // No connection is opened here; each method opens (and closes) its own.
    DatabaseLoader::DatabaseLoader(std::string connection_string)
        : conn_str_(std::move(connection_string))
    {
    }

    std::string DatabaseLoader::sql_type(ColumnType type)
    {
        switch (type)
        {
        case ColumnType::Integer:
            return "BIGINT";
        case ColumnType::Float:
            return "DOUBLE PRECISION";
        case ColumnType::Text:
            return "TEXT";
        case ColumnType::Timestamp:
            return "BIGINT";
        case ColumnType::Boolean:
            return "BOOLEAN";
        case ColumnType::Null:
            break;
        }
        throw SinkError("[DB] no SQL type for column type " + std::string(type_name(type)));
    }

    // Names are validated identifiers already, so they go in unquoted and
    // PostgreSQL folds them to lower case like any hand-written DDL.
    std::string DatabaseLoader::column_definitions(const Schema &schema)
    {
        std::string sql;
        for (const auto &col : schema.columns())
        {
            if (!sql.empty())
                sql += ", ";
            sql += col.name + " " + sql_type(col.type);
        }
        return sql;
    }

    std::vector<std::optional<std::string>> DatabaseLoader::to_copy_row(const Record &record)
    {
        std::vector<std::optional<std::string>> row;
        row.reserve(record.size());
        for (const Value &v : record.values())
        {
            if (is_null(v))
                row.emplace_back(std::nullopt);
            else
                row.emplace_back(to_plain_string(v));
        }
        return row;
    }

    // =============================================================================
    // init_table()
    // =============================================================================
    // IF NOT EXISTS keeps repeated pipeline runs idempotent. An existing table
    // with different columns is not altered; the COPY in load() then fails.
    // =============================================================================
    void DatabaseLoader::init_table(const std::string &table, const Schema &schema)
    {
        SchemaValidator::require_identifier(table, "table");

        try
        {
            pqxx::connection C(conn_str_);
            pqxx::work W(C);

            W.exec("CREATE TABLE IF NOT EXISTS " + table + " (" + column_definitions(schema) + ")");

            W.commit();
            std::cout << "[DB] Table ready: " << table << " " << schema.describe() << "\n";
        }
        catch (const std::exception &e)
        {
            std::cerr << "[DB ERROR] init_table failed: " << e.what() << "\n";
            throw SinkError(std::string("[DB] init_table: ") + e.what());
        }
    }

    // =============================================================================
    // load()
    // =============================================================================
    // TRUNCATE and COPY share one transaction: a failed COPY leaves the
    // previous contents in place.
    // =============================================================================
    size_t DatabaseLoader::load(const std::string &table, const FinalResult &result)
    {
        SchemaValidator::require_identifier(table, "table");

        const std::vector<Record> rows = result.to_rows();

        try
        {
            pqxx::connection C(conn_str_);
            pqxx::work W(C);

            W.exec("TRUNCATE TABLE " + table);

            std::string columns;
            for (const auto &name : result.schema()->names())
            {
                if (!columns.empty())
                    columns += ",";
                columns += name;
            }

            auto stream = pqxx::stream_to::raw_table(W, table, columns);
            for (const auto &record : rows)
                stream.write_row(to_copy_row(record));
            stream.complete();

            W.commit();

            std::cout << "[DB] COPY complete.\n";
            std::cout << "[DB]   Table    : " << table << "\n";
            std::cout << "[DB]   Inserted : " << rows.size() << " rows\n";
            return rows.size();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[DB ERROR] load failed: " << e.what() << "\n";
            throw SinkError(std::string("[DB] load: ") + e.what());
        }
    }

} // namespace PartitionFlow
