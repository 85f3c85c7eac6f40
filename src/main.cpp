#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "benchmark/Benchmarker.hpp"
#include "database/DatabaseLoader.hpp"
#include "execution/Scheduler.hpp"
#include "graph/OperationGraph.hpp"
#include "output/ParquetWriter.hpp"
#include "output/ResultPrinter.hpp"
#include "parser/CsvRecordSource.hpp"
#include "partitioning/Partitioner.hpp"
#include "tools/DataGenerator.hpp"

// ============================================================================
// etl_pipeline
//
// Usage:
//   ./etl_pipeline [rows] [partition_size] [concurrency]
//                  [--csv <path>] [--parquet <dir>] [--pg <connection string>]
//
//   rows            synthetic transactions to generate (ignored with --csv)
//   partition_size  records per partition (default 100000)
//   concurrency     worker threads (default: hardware threads)
//   --csv           read transactions from a CSV written by generate_data
//   --parquet       write the result to <dir>/revenue_by_region_<time>.parquet
//   --pg            load the result into table revenue_by_region;
//                   PARTITIONFLOW_PG is used when the flag is absent
// ============================================================================

using namespace PartitionFlow;

namespace
{
    struct PipelineOptions
    {
        size_t rows = 1'000'000;
        int64_t partition_size = Partitioner::kDefaultPartitionSize;
        int concurrency = default_concurrency();
        std::optional<std::filesystem::path> csv;
        std::optional<std::filesystem::path> parquet_dir;
        std::optional<std::string> pg;
    };

    PipelineOptions parse_options(int argc, char *argv[])
    {
        PipelineOptions opts;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw InvalidConfiguration(arg + " needs a value");
                return argv[++i];
            };

            if (arg == "--csv")
                opts.csv = value();
            else if (arg == "--parquet")
                opts.parquet_dir = value();
            else if (arg == "--pg")
                opts.pg = value();
            else
                positional.push_back(arg);
        }

        if (positional.size() > 3)
            throw InvalidConfiguration("too many arguments");
        if (positional.size() > 0)
            opts.rows = std::stoul(positional[0]);
        if (positional.size() > 1)
            opts.partition_size = std::stoll(positional[1]);
        if (positional.size() > 2)
            opts.concurrency = std::stoi(positional[2]);

        if (!opts.pg)
        {
            if (const char *env = std::getenv("PARTITIONFLOW_PG"))
                opts.pg = std::string(env);
        }

        return opts;
    }

    // ========================================================================
    // Revenue by region
    //
    //   source
    //     -> filter  amount is present
    //     -> filter  amount > 0            (refunds out)
    //     -> map     + amount_with_tax = amount * 1.18
    //     -> group_aggregate by region:
    //          total_revenue, transactions, avg_ticket, smallest, largest
    // ========================================================================
    OperationGraph build_revenue_graph(const SchemaPtr &schema)
    {
        return OperationGraph::source(schema)
            .filter(Predicate::is_not_null("amount"))
            .filter(Predicate::compare("amount", CompareOp::Greater, 0.0))
            .map(Projection().keep_all().derive(
                "amount_with_tax", ColumnType::Float, {"amount"},
                [](const Record &r)
                { return Value{r.get_float("amount") * 1.18}; }))
            .group_aggregate({"region"},
                             {{"total_revenue", AggregateSpec::sum("amount_with_tax")},
                              {"transactions", AggregateSpec::count()},
                              {"avg_ticket", AggregateSpec::average("amount_with_tax")},
                              {"smallest", AggregateSpec::min("amount")},
                              {"largest", AggregateSpec::max("amount")}});
    }
} // namespace

int main(int argc, char *argv[])
{
    std::ios_base::sync_with_stdio(false);

    std::cout << "===================================================\n";
    std::cout << "   PartitionFlow ETL | Partitioned Lazy Execution\n";
    std::cout << "===================================================\n\n";

    std::vector<BenchmarkResult> bench_results;

    try
    {
        const PipelineOptions opts = parse_options(argc, argv);

        ExecutionConfig config;
        config.target_partition_size = opts.partition_size;
        config.concurrency = opts.concurrency;
        config.validate();

        const SchemaPtr schema = DataGenerator::transaction_schema();

        // ── STAGE 1: EXTRACT + PARTITION ─────────────────────────────────
        std::cout << "[STAGE 1] EXTRACT + PARTITION\n";
        std::vector<Partition> partitions;
        if (opts.csv)
        {
            Benchmarker bm("Extract CSV", 0, bench_results);
            CsvRecordSource source(*opts.csv, schema);
            partitions = Partitioner::partition(source, config.target_partition_size);
        }
        else
        {
            std::vector<Record> records;
            {
                Benchmarker bm("Generate", opts.rows, bench_results);
                records = DataGenerator::generate_records(opts.rows);
            }
            Benchmarker bm("Partition", records.size(), bench_results);
            partitions = Partitioner::partition(schema, std::move(records), config.target_partition_size);
        }

        size_t total_records = 0;
        for (const auto &p : partitions)
            total_records += p.size();
        if (opts.csv)
            bench_results.back().item_count = total_records;

        std::cout << "[PARTITIONER] " << total_records << " records in " << partitions.size()
                  << " partitions of at most " << config.target_partition_size << "\n\n";

        // ── STAGE 2: DESCRIBE (nothing runs yet) ─────────────────────────
        std::cout << "[STAGE 2] BUILD GRAPH\n";
        const OperationGraph graph = build_revenue_graph(schema);
        std::cout << "[GRAPH] " << graph.explain() << "\n";
        std::cout << "[GRAPH] output " << graph.output_schema()->describe() << "\n\n";

        // ── STAGE 3: RUN, parallel and sequential baseline ───────────────
        std::cout << "[STAGE 3] RUN (concurrency " << config.concurrency << " vs 1)\n";
        std::optional<ComparisonReport> comparison;
        {
            Benchmarker bm("Run x2", total_records * 2, bench_results);
            comparison = compare_against_sequential(graph, partitions, config);
        }

        print_execution_report(comparison->parallel.report);
        std::cout << "[MONITOR] parallel   : " << std::fixed << std::setprecision(3)
                  << comparison->parallel.report.total_ms() << " ms\n";
        std::cout << "[MONITOR] sequential : " << comparison->sequential.report.total_ms() << " ms\n";
        std::cout << "[MONITOR] speedup    : " << std::setprecision(2) << comparison->speedup << "x\n";
        std::cout << "[MONITOR] identical  : " << (comparison->identical_results ? "yes" : "NO") << "\n"
                  << std::defaultfloat;

        if (!comparison->identical_results)
        {
            std::cerr << "[CRITICAL] Parallel and sequential results differ. Aborting.\n";
            return 1;
        }

        const FinalResult &result = comparison->parallel.result;
        ResultPrinter::print(result);

        // ── STAGE 4: LOAD ────────────────────────────────────────────────
        if (opts.parquet_dir)
        {
            std::cout << "[STAGE 4] LOAD PARQUET\n";
            std::filesystem::create_directories(*opts.parquet_dir);
            auto path = ParquetWriter::make_output_path(*opts.parquet_dir, "revenue_by_region");
            long long ns = ParquetWriter::write(result, path);
            bench_results.push_back({"Parquet", ns, result.size()});
            std::cout << "\n";
        }

        if (opts.pg)
        {
            std::cout << "[STAGE 5] LOAD POSTGRESQL\n";
            Benchmarker bm("PostgreSQL", result.size(), bench_results);
            DatabaseLoader loader(*opts.pg);
            loader.init_table("revenue_by_region", *result.schema());
            loader.load("revenue_by_region", result);
            std::cout << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "[CRITICAL ERROR] " << e.what() << "\n";
        return 1;
    }

    print_benchmark_report(bench_results);
    std::cout << "[PIPELINE] Finished.\n";
    return 0;
}
