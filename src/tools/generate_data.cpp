#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include "DataGenerator.hpp"

// ============================================================================
// generate_data — Writes a synthetic transactions CSV for etl_pipeline --csv
//
// Usage:
//   ./generate_data                               -> 1,000,000 rows, transactions.csv, seed 42
//   ./generate_data 500000                        -> 500,000 rows
//   ./generate_data 500000 data/tx.csv 7          -> custom output path and seed
// ============================================================================
int main(int argc, char *argv[])
{
    size_t num_rows = 1'000'000;
    std::filesystem::path output = "transactions.csv";
    uint64_t seed = 42;

    std::cout << "===================================================\n";
    std::cout << "   PartitionFlow — Synthetic Transaction Generator\n";
    std::cout << "===================================================\n\n";

    try
    {
        if (argc > 1)
            num_rows = std::stoul(argv[1]);
        if (argc > 2)
            output = argv[2];
        if (argc > 3)
            seed = std::stoull(argv[3]);

        PartitionFlow::DataGenerator::generate_csv(output, num_rows, seed);

        std::cout << "\nRun the pipeline with:\n";
        std::cout << "  ./etl_pipeline --csv " << output.string() << "\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
