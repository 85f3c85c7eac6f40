#pragma once

#include <optional>
#include <string>
#include <vector>
#include <pqxx/pqxx>
#include "../execution/FinalResult.hpp"
#include "../model/Schema.hpp"

namespace PartitionFlow
{

    // ============================================================================
    // DatabaseLoader — Loads a FinalResult into a PostgreSQL table
    // ============================================================================
    //
    //   init_table()   CREATE TABLE IF NOT EXISTS, columns from the result schema
    //   load()         TRUNCATE, then COPY every row in one stream
    //
    // Type mapping:
    //   integer -> BIGINT   float -> DOUBLE PRECISION   text -> TEXT
    //   timestamp -> BIGINT (nanoseconds since epoch)   boolean -> BOOLEAN
    //
    // Every method opens its own pqxx::connection, so one loader per thread
    // is safe. Failures are logged with [DB ERROR] and rethrown as SinkError.
    // ============================================================================
    class DatabaseLoader
    {
    public:
        explicit DatabaseLoader(std::string connection_string);

        void init_table(const std::string &table, const Schema &schema);

        // Returns the number of rows copied
        size_t load(const std::string &table, const FinalResult &result);

        // Helpers below touch no connection

        [[nodiscard]]
        static std::string sql_type(ColumnType type);

        // Column list without the CREATE TABLE wrapper: "region TEXT, total DOUBLE PRECISION"
        [[nodiscard]]
        static std::string column_definitions(const Schema &schema);

        // One COPY row; nulls become std::nullopt
        [[nodiscard]]
        static std::vector<std::optional<std::string>> to_copy_row(const Record &record);

    private:
        std::string conn_str_;
    };

} // namespace PartitionFlow
