#pragma once

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include "../execution/FinalResult.hpp"

namespace PartitionFlow
{

    // ============================================================================
    // ResultPrinter — Box-drawn console table of a FinalResult
    // ============================================================================
    //   ╔════════╦═══════╦═══════╗
    //   ║ region ║ total ║ count ║
    //   ╠════════╬═══════╬═══════╣
    //   ║ "east" ║ 812.5 ║    31 ║
    //   ╚════════╩═══════╩═══════╝
    //
    // Column widths fit the widest shown cell, capped at 24 characters.
    // Text columns are left-aligned, everything else right-aligned.
    // ============================================================================
    class ResultPrinter
    {
    public:
        static void print(const FinalResult &result, size_t max_rows = 20, std::ostream &out = std::cout)
        {
            const auto &columns = result.schema()->columns();
            const std::vector<Record> rows = result.to_rows();
            const size_t shown = std::min(max_rows, rows.size());

            std::vector<std::vector<std::string>> cells(shown);
            std::vector<size_t> widths;
            for (const auto &col : columns)
                widths.push_back(col.name.size());

            for (size_t r = 0; r < shown; ++r)
            {
                for (size_t c = 0; c < columns.size(); ++c)
                {
                    std::string cell = to_string(rows[r].at(c));
                    if (cell.size() > kMaxWidth)
                        cell = cell.substr(0, kMaxWidth - 3) + "...";
                    widths[c] = std::max(widths[c], cell.size());
                    cells[r].push_back(std::move(cell));
                }
            }

            out << "\n";
            rule(out, widths, "╔", "╦", "╗");
            out << "║";
            for (size_t c = 0; c < columns.size(); ++c)
                out << " " << std::left << std::setw(static_cast<int>(widths[c])) << columns[c].name << " ║";
            out << "\n";
            rule(out, widths, "╠", "╬", "╣");

            for (const auto &row : cells)
            {
                out << "║";
                for (size_t c = 0; c < row.size(); ++c)
                {
                    if (columns[c].type == ColumnType::Text)
                        out << " " << std::left;
                    else
                        out << " " << std::right;
                    out << std::setw(static_cast<int>(widths[c])) << row[c] << " ║";
                }
                out << "\n";
            }

            rule(out, widths, "╚", "╩", "╝");
            out << std::left;

            if (rows.size() > shown)
                out << "  ... " << rows.size() - shown << " more rows\n";
            out << "  " << rows.size() << (result.is_grouped() ? " groups" : " rows") << "\n\n";
        }

    private:
        static constexpr size_t kMaxWidth = 24;

        static void rule(std::ostream &out, const std::vector<size_t> &widths,
                         const char *left, const char *mid, const char *right)
        {
            out << left;
            for (size_t c = 0; c < widths.size(); ++c)
            {
                for (size_t i = 0; i < widths[c] + 2; ++i)
                    out << "═";
                out << (c + 1 == widths.size() ? right : mid);
            }
            if (widths.empty())
                out << right;
            out << "\n";
        }
    };

} // namespace PartitionFlow
