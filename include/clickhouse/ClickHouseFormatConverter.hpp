#pragma once

/**
 * @file ClickHouseFormatConverter.hpp
 * @brief ClickHouse quoting rules and catalog row helpers.
 *
 * Rows arrive as JSONEachRow and are already Values; ClickHouse quotes
 * 64-bit integers as strings, so counts are read with countFromValue().
 */

#include "FormatConverter.hpp"
#include "Models.hpp"

namespace dbbridge {

class ClickHouseFormatConverter : public FormatConverter {
public:
    /**
     * @brief Wrap in backticks, escaping backslashes and backticks.
     */
    static std::string escapeIdentifier(const std::string& identifier);

    /**
     * @brief Single-quoted string literal with backslash escaping.
     */
    static std::string quoteString(const std::string& value);

    /**
     * @brief `db`.`table`, or `table` when db is empty.
     */
    static std::string qualifiedName(const std::string& database, const std::string& table);

    /**
     * @brief Build a ColumnInfo from (name, type, default_kind, default_expression, is_in_primary_key).
     *
     * Nullable(...) types are nullable, defaults read "<kind> <expr>".
     */
    static ColumnInfo toColumn(const Value& name, const Value& type, const Value& defaultKind,
                               const Value& defaultExpression, const Value& primaryKey);

    static std::string stringOf(const Value& value, const std::string& fallback = "");
};

}  // namespace dbbridge
