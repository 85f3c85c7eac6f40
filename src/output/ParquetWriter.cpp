#include "ParquetWriter.hpp"
#include "../errors/EtlErrors.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/file_reader.h>
#include <parquet/properties.h>

// Arrow reports failures through arrow::Status; turn them into SinkError.
// Kept in this translation unit only.
#define THROW_IF_NOT_OK(expr)                                          \
    do                                                                 \
    {                                                                  \
        ::arrow::Status _s = (expr);                                   \
        if (!_s.ok())                                                  \
        {                                                              \
            throw ::PartitionFlow::SinkError(                          \
                std::string("[PARQUET] ") + #expr + " -> " + _s.ToString()); \
        }                                                              \
    } while (0)

namespace PartitionFlow
{

    std::filesystem::path ParquetWriter::make_output_path(const std::filesystem::path &directory,
                                                          const std::string &prefix)
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);

        std::tm tm_now{};
        localtime_r(&time_t_now, &tm_now);

        std::ostringstream oss;
        oss << prefix << "_" << std::put_time(&tm_now, "%Y%m%d_%H%M%S") << ".parquet";

        return directory / oss.str();
    }

    // =========================================================================
    // Per-type column builders
    // =========================================================================
    // Fixed-width builders are reserved to n up front. Every append goes
    // through Append/AppendNull because any row may hold a null.
    // =========================================================================
    template <typename Builder, typename T, typename Convert>
    static std::shared_ptr<arrow::Array> fill(Builder &builder,
                                              const std::vector<Record> &rows,
                                              size_t col,
                                              Convert convert)
    {
        THROW_IF_NOT_OK(builder.Reserve(static_cast<int64_t>(rows.size())));
        for (const auto &row : rows)
        {
            const Value &v = row.at(col);
            if (is_null(v))
                THROW_IF_NOT_OK(builder.AppendNull());
            else
                THROW_IF_NOT_OK(builder.Append(convert(std::get<T>(v))));
        }

        std::shared_ptr<arrow::Array> array;
        THROW_IF_NOT_OK(builder.Finish(&array));
        return array;
    }

    static std::shared_ptr<arrow::Array> build_column(const std::vector<Record> &rows,
                                                      size_t col,
                                                      ColumnType type)
    {
        auto *pool = arrow::default_memory_pool();
        auto same = [](const auto &x)
        { return x; };

        switch (type)
        {
        case ColumnType::Integer:
        {
            arrow::Int64Builder builder(pool);
            return fill<arrow::Int64Builder, int64_t>(builder, rows, col, same);
        }
        case ColumnType::Float:
        {
            arrow::DoubleBuilder builder(pool);
            return fill<arrow::DoubleBuilder, double>(builder, rows, col, same);
        }
        case ColumnType::Text:
        {
            arrow::StringDictionaryBuilder builder(pool);
            return fill<arrow::StringDictionaryBuilder, std::string>(
                builder, rows, col, [](const std::string &s)
                { return std::string_view(s); });
        }
        case ColumnType::Timestamp:
        {
            arrow::TimestampBuilder builder(arrow::timestamp(arrow::TimeUnit::NANO, "UTC"), pool);
            return fill<arrow::TimestampBuilder, Timestamp>(
                builder, rows, col, [](const Timestamp &ts)
                { return ts.nanos; });
        }
        case ColumnType::Boolean:
        {
            arrow::BooleanBuilder builder(pool);
            return fill<arrow::BooleanBuilder, bool>(builder, rows, col, same);
        }
        case ColumnType::Null:
            break;
        }
        throw SinkError("[PARQUET] column " + std::to_string(col) + " has no storable type");
    }

    long long ParquetWriter::write(const FinalResult &result, const std::filesystem::path &output_path)
    {
        auto t0 = std::chrono::high_resolution_clock::now();

        try
        {
            const std::vector<Record> rows = result.to_rows();
            const auto &columns = result.schema()->columns();
            const size_t n = rows.size();

            std::cout << "[PARQUET] Converting " << n << " rows x " << columns.size()
                      << " columns to columnar format...\n";

            // The field type comes from the finished array: the dictionary
            // builder picks its own index width.
            arrow::FieldVector fields;
            arrow::ArrayVector arrays;
            for (size_t c = 0; c < columns.size(); ++c)
            {
                auto array = build_column(rows, c, columns[c].type);
                fields.push_back(arrow::field(columns[c].name, array->type(), /*nullable=*/true));
                arrays.push_back(std::move(array));
            }

            auto table = arrow::Table::Make(arrow::schema(fields), arrays, static_cast<int64_t>(n));

            auto outfile_result = arrow::io::FileOutputStream::Open(output_path.string());
            if (!outfile_result.ok())
            {
                throw SinkError("[PARQUET] cannot create output file: " + output_path.string() +
                                " -> " + outfile_result.status().ToString());
            }
            auto outfile = outfile_result.ValueOrDie();

            auto writer_props = parquet::WriterProperties::Builder()
                                    .compression(arrow::Compression::SNAPPY)
                                    ->build();

            auto arrow_props = parquet::ArrowWriterProperties::Builder()
                                   .store_schema()
                                   ->build();

            // Parquet rejects a zero row-group length
            const int64_t row_group = std::max<int64_t>(1, static_cast<int64_t>(n));

            THROW_IF_NOT_OK(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                                       row_group, writer_props, arrow_props));

            // Without Close() the footer is never written
            THROW_IF_NOT_OK(outfile->Close());

            auto t1 = std::chrono::high_resolution_clock::now();
            long long ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();

            double file_kb = static_cast<double>(std::filesystem::file_size(output_path)) / 1024.0;

            std::cout << "[PARQUET] Complete!\n";
            std::cout << "[PARQUET]   Output file    : " << output_path.filename() << "\n";
            std::cout << "[PARQUET]   Rows written   : " << n << "\n";
            std::cout << "[PARQUET]   File size      : "
                      << std::fixed << std::setprecision(1) << file_kb << " KB\n"
                      << std::defaultfloat;
            std::cout << "[PARQUET]   Duration       : " << ns / 1'000'000 << "ms\n";

            return ns;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[PARQUET ERROR] " << e.what() << "\n";
            throw;
        }
    }

    ParquetFileInfo ParquetWriter::inspect(const std::filesystem::path &path)
    {
        try
        {
            std::unique_ptr<parquet::ParquetFileReader> reader =
                parquet::ParquetFileReader::OpenFile(path.string());

            auto metadata = reader->metadata();

            ParquetFileInfo info;
            info.num_rows = metadata->num_rows();
            for (int i = 0; i < metadata->num_columns(); ++i)
                info.column_names.push_back(metadata->schema()->Column(i)->name());
            return info;
        }
        catch (const parquet::ParquetException &e)
        {
            throw SinkError("[PARQUET] cannot read " + path.string() + ": " + e.what());
        }
    }

} // namespace PartitionFlow
