#pragma once

// ============================================================================
// SchemaValidator — Compile-time regex checks for schema identifiers
// ============================================================================
// CTRE (Compile-Time Regular Expressions) builds the matcher while the
// compiler runs; at runtime a check is a handful of character comparisons.
//
// Column names end up as Parquet field names and PostgreSQL column names,
// so they are held to the portable SQL identifier shape:
//
//   [A-Za-z_]        first character: letter or underscore
//   [A-Za-z0-9_]{0,62}  then up to 62 more (PostgreSQL truncates at 63)
//
// Table names for the database sink follow the same rule.
// ============================================================================

#include <ctre.hpp>
#include <string>
#include <string_view>
#include "../errors/EtlErrors.hpp"

namespace PartitionFlow
{

    class SchemaValidator
    {
    public:
        [[nodiscard]]
        static bool is_valid_identifier(std::string_view name)
        {
            return static_cast<bool>(ctre::match<"[A-Za-z_][A-Za-z0-9_]{0,62}">(name));
        }

        // Throws SchemaError naming what was being declared ("column", "table", ...)
        static void require_identifier(std::string_view name, std::string_view what)
        {
            if (!is_valid_identifier(name))
            {
                throw SchemaError("invalid " + std::string(what) + " name '" +
                                  std::string(name) +
                                  "': must match [A-Za-z_][A-Za-z0-9_]{0,62}");
            }
        }
    };

} // namespace PartitionFlow
