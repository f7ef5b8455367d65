#pragma once

/**
 * @file MutationBuilder.hpp
 * @brief Builds INSERT/UPDATE/DELETE text from structured row edits.
 */

#include "Config.hpp"
#include "FormatConverter.hpp"
#include <string>
#include <vector>

namespace dbbridge {

// One column assignment. With rawSql set, value must be a string naming one
// of the allowed SQL functions and is emitted verbatim.
struct ColumnValue {
    std::string column;
    Value value;
    bool rawSql = false;
};

enum class MutationKind {
    Update,
    Insert,
    Delete
};

// A row edit as submitted by a client
struct RowEdit {
    MutationKind kind = MutationKind::Update;
    std::string schema;
    std::string table;
    std::vector<std::string> primaryKeyColumns;
    std::vector<Value> primaryKeyValues;
    std::vector<ColumnValue> values;
};

/**
 * @class MutationBuilder
 * @brief Stateless SQL assembly for row edits.
 *
 * Identifiers are double-quoted with embedded quotes doubled. Literals are
 * rendered from Value; raw SQL is accepted only when it matches the allow-list
 * returned by allowedRawSqlFunctions() (or its case-insensitive subset).
 *
 * Every check runs before any SQL text is produced. Violations throw
 * ValidationError.
 */
class MutationBuilder {
public:
    /**
     * @brief Raw SQL values accepted verbatim (exact, case-sensitive match).
     *
     * Clients that offer function shortcuts keep their own copy of this list
     * in sync with it.
     */
    static const std::vector<std::string>& allowedRawSqlFunctions();

    /**
     * @brief Lowercase raw SQL values also accepted in any letter case.
     */
    static const std::vector<std::string>& caseInsensitiveRawSqlFunctions();

    /**
     * @brief Fragments that mark a rejected raw SQL value as dangerous.
     */
    static const std::vector<std::string>& dangerousPatterns();

    /**
     * @brief Double every '"'. a"b becomes a""b.
     */
    static std::string escapeIdentifier(const std::string& identifier);

    /**
     * @brief Escaped identifier wrapped in double quotes.
     */
    static std::string quoteIdentifier(const std::string& identifier);

    /**
     * @brief "table" for SQLite, "schema"."table" for the other backends.
     */
    static std::string tableRef(DatabaseType type, const std::string& schema, const std::string& table);

    /**
     * @brief SQL literal for a value.
     *
     * null -> NULL, bool -> TRUE/FALSE, numbers as written, strings single
     * quoted with ' doubled, arrays and objects as quoted JSON text.
     */
    static std::string formatLiteral(const Value& value);

    /**
     * @brief Accept a raw SQL value or throw ValidationError.
     *
     * The message names the first dangerous pattern found, or says the value
     * is not whitelisted.
     */
    static void validateRawSql(const std::string& value);

    static std::string buildUpdate(DatabaseType type, const std::string& schema, const std::string& table,
                                   const std::vector<std::string>& primaryKeyColumns,
                                   const std::vector<Value>& primaryKeyValues,
                                   const std::vector<ColumnValue>& updates);

    static std::string buildDelete(DatabaseType type, const std::string& schema, const std::string& table,
                                   const std::vector<std::string>& primaryKeyColumns,
                                   const std::vector<Value>& primaryKeyValues);

    static std::string buildInsert(DatabaseType type, const std::string& schema, const std::string& table,
                                   const std::vector<ColumnValue>& values);

    static std::string build(DatabaseType type, const RowEdit& edit);

    /**
     * @brief Parse a JSON edit request.
     *
     * Shape:
     * {"op": "update"|"insert"|"delete", "schema": ..., "table": ...,
     *  "primary_key_columns": [...], "primary_key_values": [...],
     *  "values": [{"column": ..., "value": ..., "is_raw_sql": bool}] or {"col": value}}
     *
     * @throws ValidationError on a malformed request.
     */
    static RowEdit parseEdit(const Value& request);

private:
    static std::string formatColumnValue(const ColumnValue& value);
    static std::string whereClause(const std::vector<std::string>& primaryKeyColumns,
                                   const std::vector<Value>& primaryKeyValues);
    static void checkPrimaryKey(const std::vector<std::string>& primaryKeyColumns,
                                const std::vector<Value>& primaryKeyValues);
};

}  // namespace dbbridge
