/**
 * @file SQLiteFormatConverter.cpp
 * @brief Implementation of SQLite value conversion.
 */

#include "SQLiteFormatConverter.hpp"

namespace dbbridge {

// ============================================================================
// Value Conversion
// ============================================================================

Value SQLiteFormatConverter::byStorageClass(const SQLiteResultSet& result, int col) {
    switch (result.columnType(col)) {
        case SQLITE_INTEGER:
            return Value(result.getInt64(col));
        case SQLITE_FLOAT:
            return Value(result.getDouble(col));
        case SQLITE_TEXT:
            return textValue(result, col);
        case SQLITE_BLOB: {
            int length = 0;
            const unsigned char* data = result.getBlob(col, length);
            return Value(bytesToHex(data, static_cast<size_t>(length)));
        }
        case SQLITE_NULL:
            return Value(nullptr);
        default:
            return placeholder("unknown");
    }
}

Value SQLiteFormatConverter::textValue(const SQLiteResultSet& result, int col) {
    std::string text = result.getString(col);
    if (isValidUtf8(text.data(), text.size())) {
        return Value(std::move(text));
    }
    return Value(bytesToHex(reinterpret_cast<const unsigned char*>(text.data()), text.size()));
}

Value SQLiteFormatConverter::toValue(const SQLiteResultSet& result, int col) {
    if (result.isNull(col)) {
        return Value(nullptr);
    }

    std::string declType = toUpper(result.columnDeclType(col));
    int storage = result.columnType(col);

    if (declType == "INTEGER") {
        if (storage == SQLITE_INTEGER) return Value(result.getInt64(col));
        return byStorageClass(result, col);
    }

    if (declType == "REAL") {
        if (storage == SQLITE_INTEGER || storage == SQLITE_FLOAT) return Value(result.getDouble(col));
        return byStorageClass(result, col);
    }

    if (declType == "TEXT") {
        if (storage == SQLITE_BLOB) return byStorageClass(result, col);
        return textValue(result, col);
    }

    if (declType == "BLOB") {
        int length = 0;
        const unsigned char* data = result.getBlob(col, length);
        return Value(bytesToHex(data, static_cast<size_t>(length)));
    }

    if (declType == "BOOLEAN" || declType == "BOOL") {
        if (storage == SQLITE_INTEGER) return Value(result.getInt64(col) != 0);
        if (storage == SQLITE_TEXT) {
            std::string text = toLower(result.getString(col));
            if (text == "true" || text == "1") return Value(true);
            if (text == "false" || text == "0") return Value(false);
        }
        return byStorageClass(result, col);
    }

    // Dates are stored as TEXT, REAL or INTEGER; always report the text form
    if (declType == "DATETIME" || declType == "DATE" || declType == "TIME" || declType == "TIMESTAMP") {
        return textValue(result, col);
    }

    return byStorageClass(result, col);
}

Value SQLiteFormatConverter::rowToValue(const SQLiteResultSet& result) {
    Value obj = Value::object();
    int count = result.columnCount();
    for (int col = 0; col < count; ++col) {
        obj[result.columnName(col)] = toValue(result, col);
    }
    return obj;
}

std::vector<Value> SQLiteFormatConverter::toValues(SQLiteResultSet& result) {
    std::vector<Value> rows;
    while (result.step()) {
        rows.push_back(rowToValue(result));
    }
    return rows;
}

// ============================================================================
// Escaping Utilities
// ============================================================================

std::string SQLiteFormatConverter::escapeIdentifier(const std::string& identifier) {
    std::string result = "\"";
    for (char c : identifier) {
        if (c == '"') {
            result += "\"\"";
        } else {
            result += c;
        }
    }
    result += "\"";
    return result;
}

std::string SQLiteFormatConverter::escapeSQL(const std::string& value) {
    std::string result;
    result.reserve(value.size() * 2);

    for (char c : value) {
        if (c == '\'') {
            result += "''";
        } else {
            result += c;
        }
    }

    return result;
}

}  // namespace dbbridge
