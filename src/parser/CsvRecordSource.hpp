#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>
#include "../model/Record.hpp"
#include "../model/Schema.hpp"
#include "../partitioning/RecordSource.hpp"

namespace PartitionFlow
{

    /**
     * @brief Forward-only RecordSource over a header-first CSV file.
     *
     * The file is read into memory with one call in the constructor; records
     * are parsed one line at a time as next() is called, so the Partitioner
     * drives the pace. The header must name exactly the schema's columns, in
     * order.
     *
     * Field rules:
     *   - empty field                  -> null
     *   - integer / float              -> std::from_chars, whole field consumed;
 *                                     floats must be finite
     *   - boolean                      -> true / false / 1 / 0
     *   - timestamp                    -> integer nanoseconds since the epoch, or
     *                                     YYYY-MM-DD[T ]HH:MM:SS[.fraction][Z] (UTC)
     *   - text                         -> as is, or double-quoted with "" escapes
     *
     * Any violation throws SourceError carrying the 1-based line number.
     */
    class CsvRecordSource : public RecordSource
    {
    public:
        CsvRecordSource(const std::filesystem::path &file_path, SchemaPtr schema);

        const SchemaPtr &schema() const override { return schema_; }

        [[nodiscard]]
        std::optional<Record> next() override;

        // Lines consumed so far, header included
        size_t line_number() const { return line_number_; }

        // Parses one field as the given column type; exposed for tests
        [[nodiscard]]
        static Value parse_field(std::string_view field, ColumnType type);

        // Splits one line into raw fields, undoing quoting
        [[nodiscard]]
        static std::vector<std::string> split_line(std::string_view line);

    private:
        // Next non-empty line, or nullopt at end of file
        std::optional<std::string_view> next_line();

        SchemaPtr schema_;
        std::filesystem::path path_;
        std::vector<char> buffer_;
        std::string_view content_;
        size_t position_ = 0;
        size_t line_number_ = 0;
    };

} // namespace PartitionFlow
