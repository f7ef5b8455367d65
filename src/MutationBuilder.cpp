#include "MutationBuilder.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>

namespace dbbridge {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::string quoteText(const std::string& text) {
    std::string result = "'";
    for (char c : text) {
        if (c == '\'') result += '\'';
        result += c;
    }
    result += "'";
    return result;
}

std::string requireString(const Value& object, const char* field) {
    auto it = object.find(field);
    if (it == object.end() || !it->is_string()) {
        throw ValidationError(std::string("Missing ") + field);
    }
    return it->get<std::string>();
}

}  // namespace

// ============================================================================
// Allow-list
// ============================================================================

const std::vector<std::string>& MutationBuilder::allowedRawSqlFunctions() {
    static const std::vector<std::string> functions = {
        // PostgreSQL
        "now()", "current_timestamp", "localtimestamp", "current_date", "now()::date",
        "current_time", "localtime", "gen_random_uuid()", "uuid_generate_v4()",
        "DEFAULT", "TRUE", "FALSE",
        "'{}'::json", "'[]'::json", "'{}'::jsonb", "'[]'::jsonb",
        // SQLite
        "datetime('now')", "datetime('now', 'localtime')",
        "date('now')", "date('now', 'localtime')",
        "time('now')", "time('now', 'localtime')",
        "NULL", "1", "0",
        // ClickHouse
        "now64()", "today()", "yesterday()", "generateUUIDv4()",
        "true", "false", "'{}'",
    };
    return functions;
}

const std::vector<std::string>& MutationBuilder::caseInsensitiveRawSqlFunctions() {
    static const std::vector<std::string> functions = {
        "true", "false", "null", "default",
        "now()", "current_timestamp", "localtimestamp", "current_date", "current_time", "localtime",
        "gen_random_uuid()", "uuid_generate_v4()",
        "datetime('now')", "datetime('now', 'localtime')",
        "date('now')", "date('now', 'localtime')",
        "time('now')", "time('now', 'localtime')",
        "now64()", "today()", "yesterday()", "generateuuidv4()",
    };
    return functions;
}

const std::vector<std::string>& MutationBuilder::dangerousPatterns() {
    static const std::vector<std::string> patterns = {
        "drop", "delete", "truncate", "alter", "create", "insert", "update",
        "exec", "execute", "union", "select", "from", "where", "having",
        "grant", "revoke", "commit", "rollback", "begin", "transaction",
        ";", "--", "/*", "*/", "xp_", "sp_", "script", "javascript",
    };
    return patterns;
}

void MutationBuilder::validateRawSql(const std::string& value) {
    std::string trimmed = FormatConverter::trim(value);
    if (trimmed.empty()) {
        throw ValidationError("Raw SQL value cannot be empty");
    }

    const auto& exact = allowedRawSqlFunctions();
    if (std::find(exact.begin(), exact.end(), trimmed) != exact.end()) {
        return;
    }

    std::string lower = FormatConverter::toLower(trimmed);
    const auto& relaxed = caseInsensitiveRawSqlFunctions();
    if (std::find(relaxed.begin(), relaxed.end(), lower) != relaxed.end()) {
        return;
    }

    for (const auto& pattern : dangerousPatterns()) {
        if (lower.find(pattern) != std::string::npos) {
            throw ValidationError("Raw SQL value contains potentially dangerous pattern: '" + pattern +
                                  "'. Only whitelisted SQL functions are allowed.");
        }
    }

    throw ValidationError("Raw SQL value '" + trimmed +
                          "' is not in the whitelist of allowed functions. "
                          "Only predefined SQL functions are allowed for security.");
}

// ============================================================================
// Identifiers and Literals
// ============================================================================

std::string MutationBuilder::escapeIdentifier(const std::string& identifier) {
    std::string result;
    result.reserve(identifier.size());
    for (char c : identifier) {
        if (c == '"') result += '"';
        result += c;
    }
    return result;
}

std::string MutationBuilder::quoteIdentifier(const std::string& identifier) {
    return "\"" + escapeIdentifier(identifier) + "\"";
}

std::string MutationBuilder::tableRef(DatabaseType type, const std::string& schema, const std::string& table) {
    if (type == DatabaseType::SQLite) {
        return quoteIdentifier(table);
    }
    return quoteIdentifier(schema) + "." + quoteIdentifier(table);
}

std::string MutationBuilder::formatLiteral(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:
        case Value::value_t::discarded:
            return "NULL";
        case Value::value_t::boolean:
            return value.get<bool>() ? "TRUE" : "FALSE";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return value.dump();
        case Value::value_t::string:
            return quoteText(value.get<std::string>());
        default:
            return quoteText(value.dump());
    }
}

std::string MutationBuilder::formatColumnValue(const ColumnValue& value) {
    if (!value.rawSql) {
        return formatLiteral(value.value);
    }
    if (!value.value.is_string()) {
        throw ValidationError("Raw SQL value must be a string");
    }

    std::string raw = value.value.get<std::string>();
    try {
        validateRawSql(raw);
    } catch (const ValidationError& e) {
        throw ValidationError(std::string("Invalid raw SQL value: ") + e.what());
    }
    return FormatConverter::trim(raw);
}

// ============================================================================
// Statements
// ============================================================================

void MutationBuilder::checkPrimaryKey(const std::vector<std::string>& primaryKeyColumns,
                                      const std::vector<Value>& primaryKeyValues) {
    if (primaryKeyColumns.empty() || primaryKeyColumns.size() != primaryKeyValues.size()) {
        throw ValidationError("Primary key columns and values must match");
    }
}

std::string MutationBuilder::whereClause(const std::vector<std::string>& primaryKeyColumns,
                                         const std::vector<Value>& primaryKeyValues) {
    std::vector<std::string> parts;
    parts.reserve(primaryKeyColumns.size());
    for (size_t i = 0; i < primaryKeyColumns.size(); ++i) {
        parts.push_back(quoteIdentifier(primaryKeyColumns[i]) + " = " + formatLiteral(primaryKeyValues[i]));
    }
    return join(parts, " AND ");
}

std::string MutationBuilder::buildUpdate(DatabaseType type, const std::string& schema, const std::string& table,
                                         const std::vector<std::string>& primaryKeyColumns,
                                         const std::vector<Value>& primaryKeyValues,
                                         const std::vector<ColumnValue>& updates) {
    checkPrimaryKey(primaryKeyColumns, primaryKeyValues);
    if (updates.empty()) {
        throw ValidationError("No updates provided");
    }

    std::vector<std::string> assignments;
    assignments.reserve(updates.size());
    for (const auto& update : updates) {
        assignments.push_back(quoteIdentifier(update.column) + " = " + formatColumnValue(update));
    }

    return "UPDATE " + tableRef(type, schema, table) + " SET " + join(assignments, ", ") +
           " WHERE " + whereClause(primaryKeyColumns, primaryKeyValues);
}

std::string MutationBuilder::buildDelete(DatabaseType type, const std::string& schema, const std::string& table,
                                         const std::vector<std::string>& primaryKeyColumns,
                                         const std::vector<Value>& primaryKeyValues) {
    checkPrimaryKey(primaryKeyColumns, primaryKeyValues);
    return "DELETE FROM " + tableRef(type, schema, table) +
           " WHERE " + whereClause(primaryKeyColumns, primaryKeyValues);
}

std::string MutationBuilder::buildInsert(DatabaseType type, const std::string& schema, const std::string& table,
                                         const std::vector<ColumnValue>& values) {
    if (values.empty()) {
        throw ValidationError("No values provided");
    }

    std::vector<std::string> columns;
    std::vector<std::string> literals;
    columns.reserve(values.size());
    literals.reserve(values.size());
    for (const auto& value : values) {
        columns.push_back(quoteIdentifier(value.column));
        literals.push_back(formatColumnValue(value));
    }

    return "INSERT INTO " + tableRef(type, schema, table) + " (" + join(columns, ", ") +
           ") VALUES (" + join(literals, ", ") + ")";
}

std::string MutationBuilder::build(DatabaseType type, const RowEdit& edit) {
    switch (edit.kind) {
        case MutationKind::Update:
            return buildUpdate(type, edit.schema, edit.table, edit.primaryKeyColumns,
                               edit.primaryKeyValues, edit.values);
        case MutationKind::Insert:
            return buildInsert(type, edit.schema, edit.table, edit.values);
        case MutationKind::Delete:
            return buildDelete(type, edit.schema, edit.table, edit.primaryKeyColumns,
                               edit.primaryKeyValues);
    }
    throw ValidationError("Unknown mutation kind");
}

// ============================================================================
// Request Parsing
// ============================================================================

RowEdit MutationBuilder::parseEdit(const Value& request) {
    if (!request.is_object()) {
        throw ValidationError("Edit request must be a JSON object");
    }

    RowEdit edit;
    std::string op = FormatConverter::toLower(requireString(request, "op"));
    if (op == "update") {
        edit.kind = MutationKind::Update;
    } else if (op == "insert") {
        edit.kind = MutationKind::Insert;
    } else if (op == "delete") {
        edit.kind = MutationKind::Delete;
    } else {
        throw ValidationError("Unknown edit operation: " + op);
    }

    edit.table = requireString(request, "table");
    edit.schema = request.value("schema", std::string());

    if (auto it = request.find("primary_key_columns"); it != request.end()) {
        if (!it->is_array()) throw ValidationError("primary_key_columns must be an array");
        for (const auto& column : *it) {
            if (!column.is_string()) throw ValidationError("Primary key column names must be strings");
            edit.primaryKeyColumns.push_back(column.get<std::string>());
        }
    }
    if (auto it = request.find("primary_key_values"); it != request.end()) {
        if (!it->is_array()) throw ValidationError("primary_key_values must be an array");
        edit.primaryKeyValues.assign(it->begin(), it->end());
    }

    if (auto it = request.find("values"); it != request.end()) {
        if (it->is_object()) {
            for (const auto& item : it->items()) {
                edit.values.push_back(ColumnValue{item.key(), item.value(), false});
            }
        } else if (it->is_array()) {
            for (const auto& entry : *it) {
                if (!entry.is_object()) throw ValidationError("Each value must be an object");
                ColumnValue value;
                value.column = requireString(entry, "column");
                auto valueIt = entry.find("value");
                if (valueIt == entry.end()) throw ValidationError("Missing value");
                value.value = *valueIt;
                value.rawSql = entry.value("is_raw_sql", false);
                edit.values.push_back(std::move(value));
            }
        } else {
            throw ValidationError("values must be an array or an object");
        }
    }

    return edit;
}

}  // namespace dbbridge
