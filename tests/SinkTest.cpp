#include <gtest/gtest.h>

#include <filesystem>

#include "TestData.hpp"
#include "database/DatabaseLoader.hpp"
#include "errors/EtlErrors.hpp"
#include "execution/Scheduler.hpp"
#include "graph/OperationGraph.hpp"
#include "output/ParquetWriter.hpp"
#include "partitioning/Partitioner.hpp"

using namespace PartitionFlow;
using namespace PartitionFlow::testing;

namespace
{
    FinalResult region_totals()
    {
        auto graph = OperationGraph::source(sales_schema())
                         .group_aggregate({"region"},
                                          {{"total", AggregateSpec::sum("amount")},
                                           {"n", AggregateSpec::count()}});

        ExecutionConfig config;
        config.concurrency = 2;
        return Scheduler(config).run(graph, Partitioner::partition(sales_schema(), sales_records(200), 50)).result;
    }
} // namespace

// ============================================================================
// ParquetWriter
// ============================================================================

TEST(ParquetWriterTest, WritesGroupedResult)
{
    FinalResult result = region_totals();
    auto path = std::filesystem::temp_directory_path() / "partitionflow_region_totals.parquet";

    long long ns = ParquetWriter::write(result, path);
    EXPECT_GT(ns, 0);

    ParquetFileInfo info = ParquetWriter::inspect(path);
    EXPECT_EQ(info.num_rows, static_cast<int64_t>(result.size()));
    EXPECT_EQ(info.column_names, (std::vector<std::string>{"region", "total", "n"}));

    std::filesystem::remove(path);
}

TEST(ParquetWriterTest, WritesRowsWithNulls)
{
    auto schema = make_schema({{"id", ColumnType::Integer},
                               {"when", ColumnType::Timestamp},
                               {"ok", ColumnType::Boolean},
                               {"note", ColumnType::Text}});
    std::vector<Record> rows = {
        Record(schema, {int64_t{1}, Timestamp{0}, true, std::string("first")}),
        Record(schema, {Value{}, Value{}, Value{}, Value{}}),
    };
    FinalResult result(schema, std::move(rows));

    auto path = std::filesystem::temp_directory_path() / "partitionflow_rows.parquet";
    (void)ParquetWriter::write(result, path);

    ParquetFileInfo info = ParquetWriter::inspect(path);
    EXPECT_EQ(info.num_rows, 2);
    EXPECT_EQ(info.column_names.size(), 4u);

    std::filesystem::remove(path);
}

TEST(ParquetWriterTest, InspectingAMissingFileIsASinkError)
{
    auto path = std::filesystem::temp_directory_path() / "partitionflow_missing.parquet";
    std::filesystem::remove(path);

    EXPECT_THROW((void)ParquetWriter::inspect(path), SinkError);
}

TEST(ParquetWriterTest, OutputPathCarriesPrefixAndExtension)
{
    auto path = ParquetWriter::make_output_path("out", "revenue_by_region");

    EXPECT_EQ(path.parent_path(), std::filesystem::path("out"));
    EXPECT_EQ(path.extension(), ".parquet");
    EXPECT_EQ(path.filename().string().rfind("revenue_by_region_", 0), 0u);
}

// ============================================================================
// DatabaseLoader (no server needed for these)
// ============================================================================

TEST(DatabaseLoaderTest, MapsColumnTypes)
{
    EXPECT_EQ(DatabaseLoader::sql_type(ColumnType::Integer), "BIGINT");
    EXPECT_EQ(DatabaseLoader::sql_type(ColumnType::Float), "DOUBLE PRECISION");
    EXPECT_EQ(DatabaseLoader::sql_type(ColumnType::Text), "TEXT");
    EXPECT_EQ(DatabaseLoader::sql_type(ColumnType::Timestamp), "BIGINT");
    EXPECT_EQ(DatabaseLoader::sql_type(ColumnType::Boolean), "BOOLEAN");
    EXPECT_THROW((void)DatabaseLoader::sql_type(ColumnType::Null), SinkError);
}

TEST(DatabaseLoaderTest, ColumnDefinitionsFollowSchemaOrder)
{
    EXPECT_EQ(DatabaseLoader::column_definitions(*region_totals().schema()),
              "region TEXT, total DOUBLE PRECISION, n BIGINT");
}

TEST(DatabaseLoaderTest, CopyRowsKeepNullsAsNull)
{
    auto row = DatabaseLoader::to_copy_row(Record(sales_schema(), {Value{}, std::string("west")}));

    ASSERT_EQ(row.size(), 2u);
    EXPECT_FALSE(row[0].has_value());
    EXPECT_EQ(row[1], std::optional<std::string>("west"));

    auto priced = DatabaseLoader::to_copy_row(sale(12.25, "north"));
    EXPECT_EQ(priced[0], std::optional<std::string>("12.25"));
}

TEST(DatabaseLoaderTest, RejectsUnsafeTableNames)
{
    DatabaseLoader loader("host=localhost dbname=unused");

    EXPECT_THROW(loader.init_table("results; DROP TABLE x", *sales_schema()), SchemaError);
}
