#pragma once

#include <optional>
#include <vector>
#include "../model/Record.hpp"
#include "../model/Schema.hpp"

namespace PartitionFlow
{

    // ============================================================================
    // RecordSource — Forward-only read interface over an input dataset
    // ============================================================================
    // The engine never asks how many records there are and never seeks back.
    // next() returns std::nullopt once the source is exhausted, and keeps
    // returning std::nullopt afterwards.
    // ============================================================================
    class RecordSource
    {
    public:
        virtual ~RecordSource() = default;

        virtual const SchemaPtr &schema() const = 0;

        [[nodiscard]]
        virtual std::optional<Record> next() = 0;
    };

    // In-memory source. Records are moved out one at a time.
    class VectorRecordSource : public RecordSource
    {
    public:
        VectorRecordSource(SchemaPtr schema, std::vector<Record> records)
            : schema_(std::move(schema)), records_(std::move(records))
        {
        }

        const SchemaPtr &schema() const override { return schema_; }

        std::optional<Record> next() override
        {
            if (position_ >= records_.size())
                return std::nullopt;
            return std::move(records_[position_++]);
        }

    private:
        SchemaPtr schema_;
        std::vector<Record> records_;
        size_t position_ = 0;
    };

} // namespace PartitionFlow
