#pragma once

#include "FormatConverter.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace dbbridge {

struct TableInfo {
    std::string schema;
    std::string name;
    std::string type;  // table, view, keyspace, or a ClickHouse engine name
};

struct ColumnInfo {
    std::string name;
    std::string type;
    bool nullable = true;
    std::optional<std::string> defaultValue;
    bool primaryKey = false;
};

struct IndexInfo {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
    bool primary = false;
};

struct ForeignKeyInfo {
    std::string name;
    std::string column;
    std::string referencesTable;
    std::string referencesColumn;
};

struct TableStructure {
    std::vector<ColumnInfo> columns;
    std::vector<IndexInfo> indexes;
    std::vector<ForeignKeyInfo> foreignKeys;
};

struct TableWithStructure {
    std::string schema;
    std::string name;
    std::string type;
    std::vector<ColumnInfo> columns;
    std::vector<IndexInfo> indexes;
    std::vector<ForeignKeyInfo> foreignKeys;
};

struct SchemaOverview {
    std::vector<TableWithStructure> tables;
};

// Parameters of a paged table read. Pages are 1-indexed.
struct TableDataRequest {
    std::string schema;
    std::string table;
    uint32_t page = 1;
    uint32_t limit = 100;
    std::optional<std::string> filter;
    std::optional<std::string> sortColumn;
    std::optional<std::string> sortDirection;

    uint64_t offset() const {
        return page > 0 ? static_cast<uint64_t>(page - 1) * limit : 0;
    }
};

struct TableDataResponse {
    std::vector<Value> data;
    uint64_t total = 0;
    uint32_t page = 1;
    uint32_t limit = 100;
};

struct QueryResult {
    std::vector<Value> data;
    uint64_t rowCount = 0;
    std::optional<std::string> error;
    std::optional<uint64_t> timeTakenMs;
};

struct TestConnectionResult {
    bool success = false;
    std::string message;
};

// ----- Redis key model -----

struct RedisKeyInfo {
    std::string key;
    std::string type;
    int64_t ttl = -1;  // -1 no expiry, -2 missing
    std::optional<int64_t> size;
};

struct RedisKeyListResponse {
    std::vector<RedisKeyInfo> keys;
    uint64_t total = 0;
    std::string cursor = "0";
    bool scanComplete = true;
    uint64_t timeTakenMs = 0;
};

struct RedisKeyDetails {
    std::string key;
    std::string type;
    int64_t ttl = -1;
    Value value;
    std::optional<int64_t> size;
    std::optional<int64_t> length;
    std::optional<std::string> encoding;
};

// JSON serialization (snake_case keys)
void to_json(json& j, const TableInfo& v);
void to_json(json& j, const ColumnInfo& v);
void to_json(json& j, const IndexInfo& v);
void to_json(json& j, const ForeignKeyInfo& v);
void to_json(json& j, const TableStructure& v);
void to_json(json& j, const TableWithStructure& v);
void to_json(json& j, const SchemaOverview& v);
void to_json(json& j, const TableDataResponse& v);
void to_json(json& j, const QueryResult& v);
void to_json(json& j, const TestConnectionResult& v);
void to_json(json& j, const RedisKeyInfo& v);
void to_json(json& j, const RedisKeyListResponse& v);
void to_json(json& j, const RedisKeyDetails& v);

}  // namespace dbbridge
