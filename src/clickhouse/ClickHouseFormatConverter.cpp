#include "ClickHouseFormatConverter.hpp"

namespace dbbridge {

std::string ClickHouseFormatConverter::escapeIdentifier(const std::string& identifier) {
    std::string result = "`";
    for (char c : identifier) {
        if (c == '`' || c == '\\') result += '\\';
        result += c;
    }
    result += "`";
    return result;
}

std::string ClickHouseFormatConverter::quoteString(const std::string& value) {
    std::string result = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') result += '\\';
        result += c;
    }
    result += "'";
    return result;
}

std::string ClickHouseFormatConverter::qualifiedName(const std::string& database, const std::string& table) {
    if (database.empty()) return escapeIdentifier(table);
    return escapeIdentifier(database) + "." + escapeIdentifier(table);
}

std::string ClickHouseFormatConverter::stringOf(const Value& value, const std::string& fallback) {
    return value.is_string() ? value.get<std::string>() : fallback;
}

ColumnInfo ClickHouseFormatConverter::toColumn(const Value& name, const Value& type, const Value& defaultKind,
                                               const Value& defaultExpression, const Value& primaryKey) {
    ColumnInfo col;
    col.name = stringOf(name);
    col.type = stringOf(type);
    col.nullable = col.type.rfind("Nullable(", 0) == 0;

    std::string expression = stringOf(defaultExpression);
    if (!expression.empty()) {
        col.defaultValue = stringOf(defaultKind) + " " + expression;
    }

    col.primaryKey = countFromValue(primaryKey) == 1;
    return col;
}

}  // namespace dbbridge
