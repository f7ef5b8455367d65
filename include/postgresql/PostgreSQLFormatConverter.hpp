#pragma once

/**
 * @file PostgreSQLFormatConverter.hpp
 * @brief Converts PostgreSQL result rows into Values.
 *
 * Results are fetched in text format, so every cell arrives as a string and
 * the column's type Oid decides how it is interpreted.
 */

#include "FormatConverter.hpp"
#include "PostgreSQLResultSet.hpp"
#include <libpq-fe.h>

namespace dbbridge {

/**
 * @class PostgreSQLFormatConverter
 * @brief Static per-type dispatch from PostgreSQL Oids to Values.
 *
 * | Oid family                          | Value          |
 * |-------------------------------------|----------------|
 * | int2, int4, int8, oid               | integer        |
 * | float4, float8, numeric             | floating point |
 * | bool                                | boolean        |
 * | text, varchar, bpchar, name, char   | string         |
 * | uuid                                | string         |
 * | timestamp[tz], date, time[tz]       | string         |
 * | json, jsonb                         | parsed JSON    |
 * | bytea                               | "\x..." hex    |
 *
 * Anything else is passed through as its text form. Cells that cannot be
 * read at all become "<typename>".
 */
class PostgreSQLFormatConverter : public FormatConverter {
public:
    static Value toValue(Oid type, const char* text, int length);

    /**
     * @brief Convert one row to an object keyed by column name.
     */
    static Value rowToValue(const PostgreSQLResultSet& result, int row);

    /**
     * @brief Convert every row of a result.
     */
    static std::vector<Value> toValues(const PostgreSQLResultSet& result);

    /**
     * @brief Readable name for an Oid ("int4", "jsonb", "oid:1234").
     */
    static std::string typeName(Oid type);

    /**
     * @brief Double embedded quotes and wrap in double quotes.
     */
    static std::string escapeIdentifier(const std::string& identifier);

    /**
     * @brief Escape a string literal body (quotes doubled, no surrounding quotes).
     */
    static std::string escapeString(const std::string& str);

    /**
     * @brief "schema"."table"
     */
    static std::string qualifiedName(const std::string& schema, const std::string& table);
};

}  // namespace dbbridge
