#include "Models.hpp"

namespace dbbridge {

namespace {

template<typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

void to_json(json& j, const TableInfo& v) {
    j = json{{"schema", v.schema}, {"name", v.name}, {"type", v.type}};
}

void to_json(json& j, const ColumnInfo& v) {
    j = json{
        {"name", v.name},
        {"type", v.type},
        {"nullable", v.nullable},
        {"default", optionalToJson(v.defaultValue)},
        {"primary_key", v.primaryKey},
    };
}

void to_json(json& j, const IndexInfo& v) {
    j = json{
        {"name", v.name},
        {"columns", v.columns},
        {"unique", v.unique},
        {"primary", v.primary},
    };
}

void to_json(json& j, const ForeignKeyInfo& v) {
    j = json{
        {"name", v.name},
        {"column", v.column},
        {"references_table", v.referencesTable},
        {"references_column", v.referencesColumn},
    };
}

void to_json(json& j, const TableStructure& v) {
    j = json{
        {"columns", v.columns},
        {"indexes", v.indexes},
        {"foreign_keys", v.foreignKeys},
    };
}

void to_json(json& j, const TableWithStructure& v) {
    j = json{
        {"schema", v.schema},
        {"name", v.name},
        {"type", v.type},
        {"columns", v.columns},
        {"indexes", v.indexes},
        {"foreign_keys", v.foreignKeys},
    };
}

void to_json(json& j, const SchemaOverview& v) {
    j = json{{"tables", v.tables}};
}

void to_json(json& j, const TableDataResponse& v) {
    j = json{
        {"data", v.data},
        {"total", v.total},
        {"page", v.page},
        {"limit", v.limit},
    };
}

void to_json(json& j, const QueryResult& v) {
    j = json{
        {"data", v.data},
        {"row_count", v.rowCount},
        {"error", optionalToJson(v.error)},
        {"time_taken_ms", optionalToJson(v.timeTakenMs)},
    };
}

void to_json(json& j, const TestConnectionResult& v) {
    j = json{{"success", v.success}, {"message", v.message}};
}

void to_json(json& j, const RedisKeyInfo& v) {
    j = json{
        {"key", v.key},
        {"type", v.type},
        {"ttl", v.ttl},
        {"size", optionalToJson(v.size)},
    };
}

void to_json(json& j, const RedisKeyListResponse& v) {
    j = json{
        {"keys", v.keys},
        {"total", v.total},
        {"cursor", v.cursor},
        {"scan_complete", v.scanComplete},
        {"time_taken_ms", v.timeTakenMs},
    };
}

void to_json(json& j, const RedisKeyDetails& v) {
    j = json{
        {"key", v.key},
        {"type", v.type},
        {"ttl", v.ttl},
        {"value", v.value},
        {"size", optionalToJson(v.size)},
        {"length", optionalToJson(v.length)},
        {"encoding", optionalToJson(v.encoding)},
    };
}

}  // namespace dbbridge
