#pragma once

/**
 * @file SQLiteFormatConverter.hpp
 * @brief Converts SQLite result rows into Values.
 */

#include "FormatConverter.hpp"
#include "SQLiteResultSet.hpp"

namespace dbbridge {

/**
 * @class SQLiteFormatConverter
 * @brief Static per-type dispatch from SQLite columns to Values.
 *
 * SQLite is dynamically typed, so the declared column type selects the
 * conversion and the value's storage class is the fallback:
 *
 * | Declared type                        | Value                          |
 * |--------------------------------------|--------------------------------|
 * | INTEGER                              | integer                        |
 * | REAL                                 | floating point                 |
 * | TEXT                                 | string                         |
 * | BLOB                                 | "\x..." hex                    |
 * | BOOLEAN, BOOL                        | boolean (nonzero is true)      |
 * | DATETIME, DATE, TIME, TIMESTAMP      | string                         |
 * | none (expressions such as COUNT(*))  | by storage class               |
 *
 * TEXT that is not valid UTF-8 is reported like a BLOB, as "\x..." hex.
 *
 * SQLite Escaping Rules:
 * - Identifiers: double quotes with internal quotes doubled ("table""name")
 */
class SQLiteFormatConverter : public FormatConverter {
public:
    /**
     * @brief Convert the current row's column to a Value.
     */
    static Value toValue(const SQLiteResultSet& result, int col);

    /**
     * @brief Convert the current row to an object keyed by column name.
     */
    static Value rowToValue(const SQLiteResultSet& result);

    /**
     * @brief Step through the remaining rows and convert each one.
     */
    static std::vector<Value> toValues(SQLiteResultSet& result);

    static std::string escapeIdentifier(const std::string& identifier);

    /**
     * @brief Escape a string value for use in SQLite SQL (no surrounding quotes).
     */
    static std::string escapeSQL(const std::string& value);

private:
    static Value byStorageClass(const SQLiteResultSet& result, int col);
    static Value textValue(const SQLiteResultSet& result, int col);
};

}  // namespace dbbridge
