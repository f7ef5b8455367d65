#include "PostgreSQLFormatConverter.hpp"

namespace dbbridge {

// PostgreSQL OID constants (pg_type.dat)
constexpr Oid BOOLOID = 16;
constexpr Oid BYTEAOID = 17;
constexpr Oid CHAROID = 18;
constexpr Oid NAMEOID = 19;
constexpr Oid INT8OID = 20;
constexpr Oid INT2OID = 21;
constexpr Oid INT4OID = 23;
constexpr Oid TEXTOID = 25;
constexpr Oid OIDOID = 26;
constexpr Oid JSONOID = 114;
constexpr Oid FLOAT4OID = 700;
constexpr Oid FLOAT8OID = 701;
constexpr Oid BPCHAROID = 1042;
constexpr Oid VARCHAROID = 1043;
constexpr Oid DATEOID = 1082;
constexpr Oid TIMEOID = 1083;
constexpr Oid TIMESTAMPOID = 1114;
constexpr Oid TIMESTAMPTZOID = 1184;
constexpr Oid TIMETZOID = 1266;
constexpr Oid NUMERICOID = 1700;
constexpr Oid UUIDOID = 2950;
constexpr Oid JSONBOID = 3802;

std::string PostgreSQLFormatConverter::typeName(Oid type) {
    switch (type) {
        case BOOLOID: return "bool";
        case BYTEAOID: return "bytea";
        case CHAROID: return "char";
        case NAMEOID: return "name";
        case INT8OID: return "int8";
        case INT2OID: return "int2";
        case INT4OID: return "int4";
        case TEXTOID: return "text";
        case OIDOID: return "oid";
        case JSONOID: return "json";
        case FLOAT4OID: return "float4";
        case FLOAT8OID: return "float8";
        case BPCHAROID: return "bpchar";
        case VARCHAROID: return "varchar";
        case DATEOID: return "date";
        case TIMEOID: return "time";
        case TIMESTAMPOID: return "timestamp";
        case TIMESTAMPTZOID: return "timestamptz";
        case TIMETZOID: return "timetz";
        case NUMERICOID: return "numeric";
        case UUIDOID: return "uuid";
        case JSONBOID: return "jsonb";
        default: return "oid:" + std::to_string(type);
    }
}

Value PostgreSQLFormatConverter::toValue(Oid type, const char* text, int length) {
    if (!text) {
        return placeholder(typeName(type));
    }

    std::string value(text, static_cast<size_t>(length));

    switch (type) {
        case INT2OID:
        case INT4OID:
        case INT8OID:
        case OIDOID:
            if (auto i = parseInt64(value)) return Value(*i);
            return Value(value);

        case FLOAT4OID:
        case FLOAT8OID:
        case NUMERICOID:
            if (auto d = parseDouble(value)) return Value(*d);
            return Value(value);

        case BOOLOID:
            return Value(value == "t" || value == "true");

        case JSONOID:
        case JSONBOID:
            return parseJsonOrString(value);

        // Text output of bytea is already "\x..." hex
        case BYTEAOID:
        case TEXTOID:
        case VARCHAROID:
        case BPCHAROID:
        case NAMEOID:
        case CHAROID:
        case UUIDOID:
        case TIMESTAMPOID:
        case TIMESTAMPTZOID:
        case DATEOID:
        case TIMEOID:
        case TIMETZOID:
        default:
            return Value(value);
    }
}

Value PostgreSQLFormatConverter::rowToValue(const PostgreSQLResultSet& result, int row) {
    Value obj = Value::object();
    PGresult* res = result.get();
    int numFields = result.numFields();

    for (int col = 0; col < numFields; ++col) {
        const char* name = PQfname(res, col);
        if (PQgetisnull(res, row, col)) {
            obj[name] = nullptr;
            continue;
        }
        obj[name] = toValue(PQftype(res, col), PQgetvalue(res, row, col), PQgetlength(res, row, col));
    }
    return obj;
}

std::vector<Value> PostgreSQLFormatConverter::toValues(const PostgreSQLResultSet& result) {
    std::vector<Value> rows;
    if (!result.hasData()) {
        return rows;
    }

    int numRows = result.numRows();
    rows.reserve(static_cast<size_t>(numRows));
    for (int row = 0; row < numRows; ++row) {
        rows.push_back(rowToValue(result, row));
    }
    return rows;
}

std::string PostgreSQLFormatConverter::escapeIdentifier(const std::string& identifier) {
    std::string result = "\"";
    for (char c : identifier) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

std::string PostgreSQLFormatConverter::escapeString(const std::string& str) {
    std::string result;
    result.reserve(str.size() * 2);
    for (char c : str) {
        if (c == '\'') result += "''";
        else result += c;
    }
    return result;
}

std::string PostgreSQLFormatConverter::qualifiedName(const std::string& schema, const std::string& table) {
    return escapeIdentifier(schema) + "." + escapeIdentifier(table);
}

}  // namespace dbbridge
