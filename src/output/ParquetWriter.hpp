#pragma once

// ============================================================================
// ParquetWriter — Writes a FinalResult as a Parquet file
// ============================================================================
//
// Column mapping (one Arrow array per result column):
//
//   integer    -> int64
//   float      -> float64
//   text       -> dictionary<utf8>   (group keys repeat a lot)
//   timestamp  -> timestamp[ns, UTC]
//   boolean    -> bool
//
// Null values stay null. Grouped results are written in key order,
// row results in partition order. Snappy compression, one row group.
// ============================================================================

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../execution/FinalResult.hpp"

namespace PartitionFlow
{

    struct ParquetFileInfo
    {
        int64_t num_rows = 0;
        std::vector<std::string> column_names;
    };

    class ParquetWriter
    {
    public:
        // Returns the time spent in nanoseconds (feeds BenchmarkResult).
        // Throws SinkError when Arrow or Parquet reports a failure.
        [[nodiscard]]
        static long long write(const FinalResult &result, const std::filesystem::path &output_path);

        // <directory>/<prefix>_YYYYMMDD_HHMMSS.parquet
        static std::filesystem::path make_output_path(const std::filesystem::path &directory = ".",
                                                      const std::string &prefix = "results");

        // Row count and column names from the file footer
        [[nodiscard]]
        static ParquetFileInfo inspect(const std::filesystem::path &path);
    };

} // namespace PartitionFlow
