#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "model/Record.hpp"
#include "model/Schema.hpp"

namespace PartitionFlow::testing
{

    inline SchemaPtr sales_schema()
    {
        static const SchemaPtr schema = make_schema({
            {"amount", ColumnType::Float},
            {"region", ColumnType::Text},
        });
        return schema;
    }

    inline const std::vector<std::string> &regions()
    {
        static const std::vector<std::string> r = {"north", "south", "east", "west"};
        return r;
    }

    // Amounts are multiples of 0.25 in [-25, 100], so every partial sum is
    // exact in binary floating point and any summation order agrees.
    inline std::vector<Record> sales_records(size_t n, uint64_t seed = 7)
    {
        std::mt19937_64 rng(seed);
        std::uniform_int_distribution<int> quarters(-100, 400);
        std::uniform_int_distribution<size_t> region(0, regions().size() - 1);

        std::vector<Record> out;
        out.reserve(n);
        for (size_t i = 0; i < n; ++i)
        {
            double amount = quarters(rng) * 0.25;
            out.emplace_back(sales_schema(), std::vector<Value>{amount, regions()[region(rng)]});
        }
        return out;
    }

    inline Record sale(double amount, std::string region)
    {
        return Record(sales_schema(), {amount, std::move(region)});
    }

} // namespace PartitionFlow::testing
