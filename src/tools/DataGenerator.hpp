#pragma once

// ============================================================================
// DataGenerator — Reproducible synthetic retail transactions
// ============================================================================
//
// Schema (transaction_schema()):
//
//   transaction_id  integer    1'000'000 + row number
//   customer_id     integer    ~50k customers, a few of them very active
//   amount          float      cents-rounded purchase; ~4% refunds (< 0),
//                              ~1% missing (null)
//   region          text       weighted towards the larger regions
//   category        text
//   timestamp       timestamp  increasing, 0.1 to 5 seconds apart
//   is_online       boolean    ~35% online
//
// Same seed = same rows, row for row, whether emitted as Records or as CSV.
// The pipeline's default graph exercises exactly these quirks: it drops
// the missing amounts and the refunds before aggregating.
// ============================================================================

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "../errors/EtlErrors.hpp"
#include "../model/Record.hpp"
#include "../model/Schema.hpp"

namespace PartitionFlow
{

    class DataGenerator
    {
    public:
        static SchemaPtr transaction_schema()
        {
            static const SchemaPtr schema = make_schema({
                {"transaction_id", ColumnType::Integer},
                {"customer_id", ColumnType::Integer},
                {"amount", ColumnType::Float},
                {"region", ColumnType::Text},
                {"category", ColumnType::Text},
                {"timestamp", ColumnType::Timestamp},
                {"is_online", ColumnType::Boolean},
            });
            return schema;
        }

        // ====================================================================
        // generate_records() — the in-memory form
        // ====================================================================
        static std::vector<Record> generate_records(size_t num_rows = 1'000'000, uint64_t seed = 42)
        {
            std::vector<Record> records;
            records.reserve(num_rows);

            RowStream stream(seed);
            for (size_t i = 0; i < num_rows; ++i)
                records.emplace_back(transaction_schema(), stream.next_row(i));

            return records;
        }

        // ====================================================================
        // generate_csv() — the same rows, written as a CSV file that
        // CsvRecordSource reads back with transaction_schema()
        // ====================================================================
        static void generate_csv(const std::filesystem::path &output_path,
                                 size_t num_rows = 1'000'000,
                                 uint64_t seed = 42)
        {
            std::cout << "[GENERATOR] Generating " << num_rows << " synthetic transactions...\n";

            auto gen_start = std::chrono::high_resolution_clock::now();

            std::ofstream file(output_path, std::ios::binary);
            if (!file.is_open())
                throw SourceError("cannot create file: " + output_path.string());

            const auto &columns = transaction_schema()->columns();
            for (size_t c = 0; c < columns.size(); ++c)
                file << (c == 0 ? "" : ",") << columns[c].name;
            file << '\n';

            RowStream stream(seed);
            for (size_t i = 0; i < num_rows; ++i)
            {
                std::vector<Value> row = stream.next_row(i);
                for (size_t c = 0; c < row.size(); ++c)
                    file << (c == 0 ? "" : ",") << to_plain_string(row[c]);
                file << '\n';
            }

            file.flush();
            if (!file)
                throw SourceError("write failed: " + output_path.string());
            file.close();

            auto gen_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::high_resolution_clock::now() - gen_start)
                              .count();

            double file_size_mb = static_cast<double>(std::filesystem::file_size(output_path)) /
                                  (1024.0 * 1024.0);

            std::cout << "[GENERATOR] Done!\n";
            std::cout << "[GENERATOR]   Rows generated : " << num_rows << "\n";
            std::cout << "[GENERATOR]   File size      : "
                      << std::fixed << std::setprecision(1) << file_size_mb << " MB\n";
            std::cout << "[GENERATOR]   Generation time: " << gen_ms << "ms\n";
            std::cout << "[GENERATOR]   Written to     : " << output_path << "\n";
            std::cout << std::defaultfloat;
        }

    private:
        // One seeded engine + distributions; next_row(i) yields row i
        class RowStream
        {
        public:
            explicit RowStream(uint64_t seed) : rng_(seed) {}

            std::vector<Value> next_row(size_t i)
            {
                // 3x / 2x weights for the busier regions
                static const std::vector<std::string> regions = {
                    "north", "north", "north",
                    "south", "south",
                    "east", "east",
                    "west",
                    "central"};
                static const std::vector<std::string> categories = {
                    "grocery", "electronics", "apparel", "home", "toys", "books"};

                std::uniform_int_distribution<size_t> region_dist(0, regions.size() - 1);
                std::uniform_int_distribution<size_t> category_dist(0, categories.size() - 1);

                // Most customers appear rarely; the first 500 IDs are regulars
                int64_t customer = percent_dist_(rng_) < 30
                                       ? 10'000 + static_cast<int64_t>(regular_dist_(rng_))
                                       : 10'000 + static_cast<int64_t>(customer_dist_(rng_));

                double amount = std::round(amount_dist_(rng_) * 100.0) / 100.0;
                if (amount < 0.5)
                    amount = 0.5;

                int roll = percent_dist_(rng_);
                Value amount_value;
                if (roll == 0)
                    amount_value = Value{}; // missing
                else if (roll < 5)
                    amount_value = -amount; // refund
                else
                    amount_value = amount;

                timestamp_ += gap_dist_(rng_);

                const std::string &region = regions[region_dist(rng_)];
                const std::string &category = categories[category_dist(rng_)];
                bool online = percent_dist_(rng_) < 35;

                return {
                    static_cast<int64_t>(1'000'000 + i),
                    customer,
                    amount_value,
                    region,
                    category,
                    Timestamp{timestamp_},
                    online,
                };
            }

        private:
            std::mt19937_64 rng_;
            std::uniform_int_distribution<int> percent_dist_{0, 99};
            std::uniform_int_distribution<int> regular_dist_{0, 499};
            std::uniform_int_distribution<int> customer_dist_{0, 49'999};

            // Basket values: log-normal, median around 33
            std::lognormal_distribution<double> amount_dist_{3.5, 0.9};

            // 0.1 s to 5 s between transactions, in nanoseconds
            std::uniform_int_distribution<int64_t> gap_dist_{100'000'000LL, 5'000'000'000LL};

            // 2024-01-01T00:00:00Z
            int64_t timestamp_ = 1'704'067'200'000'000'000LL;
        };
    };

} // namespace PartitionFlow
