#pragma once

#include <cstddef>
#include <map>
#include <variant>
#include <vector>
#include "../aggregate/AggregateAccumulator.hpp"
#include "../model/Record.hpp"
#include "../model/Schema.hpp"

namespace PartitionFlow
{

    /**
     * @brief The merged answer of one graph evaluation.
     *
     * Non-aggregate graphs: rows in partition-index order, input order inside
     * each partition. GroupAggregate graphs: one finalized record per group
     * key (key columns first, then aggregate outputs), ordered by key.
     */
    class FinalResult
    {
    public:
        using Groups = std::map<GroupKey, Record, GroupKeyLess>;

        FinalResult(SchemaPtr schema, std::vector<Record> rows)
            : schema_(std::move(schema)), data_(std::move(rows))
        {
        }

        FinalResult(SchemaPtr schema, Groups groups)
            : schema_(std::move(schema)), data_(std::move(groups))
        {
        }

        const SchemaPtr &schema() const { return schema_; }

        bool is_grouped() const { return std::holds_alternative<Groups>(data_); }

        // Throw std::bad_variant_access when asked for the other form
        const std::vector<Record> &rows() const { return std::get<std::vector<Record>>(data_); }
        const Groups &groups() const { return std::get<Groups>(data_); }

        size_t size() const
        {
            return is_grouped() ? groups().size() : rows().size();
        }

        bool empty() const { return size() == 0; }

        // nullptr when the key is absent or the result is not grouped
        const Record *find_group(const GroupKey &key) const
        {
            if (!is_grouped())
                return nullptr;
            auto it = groups().find(key);
            return it == groups().end() ? nullptr : &it->second;
        }

        // Either form as a flat row list (groups in key order)
        std::vector<Record> to_rows() const
        {
            if (!is_grouped())
                return rows();

            std::vector<Record> out;
            out.reserve(groups().size());
            for (const auto &[key, record] : groups())
                out.push_back(record);
            return out;
        }

        bool operator==(const FinalResult &other) const
        {
            return *schema_ == *other.schema_ && data_ == other.data_;
        }

    private:
        SchemaPtr schema_;
        std::variant<std::vector<Record>, Groups> data_;
    };

} // namespace PartitionFlow
