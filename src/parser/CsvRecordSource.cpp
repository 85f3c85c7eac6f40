#include "CsvRecordSource.hpp"
#include "../errors/EtlErrors.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <ctre.hpp>
#include <fstream>
#include <stdexcept>

namespace PartitionFlow
{

    // =========================================================================
    // Number parsing: the whole field must be consumed, "12abc" is an error
    // =========================================================================
    template <typename T>
    static T parse_number(std::string_view field, std::string_view what)
    {
        T value{};
        auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
        if (ec != std::errc{} || ptr != field.data() + field.size())
            throw std::invalid_argument("'" + std::string(field) + "' is not a valid " + std::string(what));
        return value;
    }

    // =========================================================================
    // ISO-8601 timestamps
    // =========================================================================
    //   2024-03-01T09:15:00Z
    //   2024-03-01 09:15:00.123456789
    //
    // The fraction is right-padded to nanoseconds: ".5" = 500'000'000 ns.
    // A trailing Z is accepted; every timestamp is taken as UTC.
    // =========================================================================
    static Timestamp parse_iso_timestamp(std::string_view field)
    {
        auto [whole, y, mo, d, h, mi, s, frac] =
            ctre::match<"([0-9]{4})-([0-9]{2})-([0-9]{2})[T ]([0-9]{2}):([0-9]{2}):([0-9]{2})(?:\\.([0-9]{1,9}))?Z?">(field);

        if (!whole)
            throw std::invalid_argument("'" + std::string(field) + "' is not a timestamp");

        using namespace std::chrono;

        const year_month_day ymd{year{parse_number<int>(y.to_view(), "year")},
                                 month{parse_number<unsigned>(mo.to_view(), "month")},
                                 day{parse_number<unsigned>(d.to_view(), "day")}};
        if (!ymd.ok())
            throw std::invalid_argument("'" + std::string(field) + "' is not a calendar date");

        const int hh = parse_number<int>(h.to_view(), "hour");
        const int mm = parse_number<int>(mi.to_view(), "minute");
        const int ss = parse_number<int>(s.to_view(), "second");
        if (hh > 23 || mm > 59 || ss > 60)
            throw std::invalid_argument("'" + std::string(field) + "' has an out-of-range time of day");

        int64_t fraction_ns = 0;
        if (frac)
        {
            std::string digits(frac.to_view());
            digits.resize(9, '0');
            fraction_ns = parse_number<int64_t>(digits, "fraction");
        }

        const sys_days date{ymd};
        const nanoseconds since_epoch = duration_cast<nanoseconds>(date.time_since_epoch()) +
                                        hours(hh) + minutes(mm) + seconds(ss) +
                                        nanoseconds(fraction_ns);
        return Timestamp{since_epoch.count()};
    }

    Value CsvRecordSource::parse_field(std::string_view field, ColumnType type)
    {
        if (field.empty())
            return Value{};

        switch (type)
        {
        case ColumnType::Integer:
            return parse_number<int64_t>(field, "integer");

        case ColumnType::Float:
        {
            // from_chars also accepts "nan" and "inf"
            const double value = parse_number<double>(field, "float");
            if (!std::isfinite(value))
                throw std::invalid_argument("'" + std::string(field) + "' is not a finite float");
            return value;
        }

        case ColumnType::Text:
            return std::string(field);

        case ColumnType::Boolean:
            if (field == "true" || field == "1")
                return true;
            if (field == "false" || field == "0")
                return false;
            throw std::invalid_argument("'" + std::string(field) + "' is not a boolean");

        case ColumnType::Timestamp:
            if (ctre::match<"-?[0-9]+">(field))
                return Timestamp{parse_number<int64_t>(field, "timestamp")};
            return parse_iso_timestamp(field);

        case ColumnType::Null:
            break;
        }
        throw std::invalid_argument("column of type null cannot hold data");
    }

    // =========================================================================
    // split_line — comma-separated fields, RFC 4180 style quoting
    // =========================================================================
    // Unquoted fields are taken verbatim. A field starting with '"' runs to
    // the next lone '"'; "" inside it stands for one quote character.
    // =========================================================================
    std::vector<std::string> CsvRecordSource::split_line(std::string_view line)
    {
        std::vector<std::string> fields;
        size_t pos = 0;

        while (true)
        {
            std::string field;

            if (pos < line.size() && line[pos] == '"')
            {
                ++pos;
                bool closed = false;
                while (pos < line.size())
                {
                    char c = line[pos++];
                    if (c != '"')
                    {
                        field.push_back(c);
                        continue;
                    }
                    if (pos < line.size() && line[pos] == '"')
                    {
                        field.push_back('"');
                        ++pos;
                        continue;
                    }
                    closed = true;
                    break;
                }

                if (!closed)
                    throw std::invalid_argument("unterminated quoted field");
                if (pos < line.size() && line[pos] != ',')
                    throw std::invalid_argument("unexpected character after closing quote");
            }
            else
            {
                size_t comma = line.find(',', pos);
                size_t end = comma == std::string_view::npos ? line.size() : comma;
                field.assign(line.substr(pos, end - pos));
                pos = end;
            }

            fields.push_back(std::move(field));

            if (pos >= line.size())
                break;
            ++pos; // skip the comma
            if (pos == line.size())
            {
                // Trailing comma: one more, empty field
                fields.emplace_back();
                break;
            }
        }

        return fields;
    }

    CsvRecordSource::CsvRecordSource(const std::filesystem::path &file_path, SchemaPtr schema)
        : schema_(std::move(schema)), path_(file_path)
    {
        // One read for the whole file, then views into the buffer
        std::ifstream file(file_path, std::ios::binary | std::ios::ate);
        if (!file.is_open())
            throw SourceError("cannot open " + file_path.string());

        std::streamsize file_size = file.tellg();
        file.seekg(0, std::ios::beg);

        buffer_.resize(static_cast<size_t>(file_size));
        if (file_size > 0 && !file.read(buffer_.data(), file_size))
            throw SourceError("read failed: " + file_path.string());

        content_ = std::string_view(buffer_.data(), buffer_.size());

        auto header = next_line();
        if (!header)
            throw SourceError(path_.string() + ": file is empty, expected a header line");

        std::vector<std::string> names;
        try
        {
            names = split_line(*header);
        }
        catch (const std::invalid_argument &e)
        {
            throw SourceError(path_.string() + ":" + std::to_string(line_number_) + ": " + e.what());
        }

        if (names != schema_->names())
        {
            std::string found;
            for (const auto &n : names)
                found += (found.empty() ? "" : ",") + n;
            throw SchemaError(path_.string() + ": header '" + found +
                              "' does not match schema " + schema_->describe());
        }
    }

    std::optional<std::string_view> CsvRecordSource::next_line()
    {
        while (position_ < content_.size())
        {
            size_t end = content_.find('\n', position_);
            if (end == std::string_view::npos)
                end = content_.size();

            std::string_view line = content_.substr(position_, end - position_);
            position_ = end + 1;
            ++line_number_;

            // Windows line endings
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            if (!line.empty())
                return line;
        }
        return std::nullopt;
    }

    std::optional<Record> CsvRecordSource::next()
    {
        auto line = next_line();
        if (!line)
            return std::nullopt;

        const std::string where = path_.string() + ":" + std::to_string(line_number_);
        const auto &columns = schema_->columns();

        std::vector<std::string> fields;
        try
        {
            fields = split_line(*line);
        }
        catch (const std::invalid_argument &e)
        {
            throw SourceError(where + ": " + e.what());
        }

        if (fields.size() != columns.size())
        {
            throw SourceError(where + ": expected " + std::to_string(columns.size()) +
                              " fields, found " + std::to_string(fields.size()));
        }

        std::vector<Value> values;
        values.reserve(columns.size());
        for (size_t i = 0; i < columns.size(); ++i)
        {
            try
            {
                values.push_back(parse_field(fields[i], columns[i].type));
            }
            catch (const std::invalid_argument &e)
            {
                throw SourceError(where + ": column '" + columns[i].name + "': " + e.what());
            }
        }

        return Record(schema_, std::move(values));
    }

} // namespace PartitionFlow
