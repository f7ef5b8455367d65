/**
 * @file RedisDriver.cpp
 * @brief Implementation of the Redis driver and key operations.
 */

#include "RedisDriver.hpp"
#include "RedisFormatConverter.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cctype>
#include <sstream>

namespace dbbridge {

namespace {

struct ScanCursor {
    std::string position = "0";
    size_t skip = 0;
};

ScanCursor parseCursor(const std::string& cursor) {
    ScanCursor parsed;
    if (cursor.empty()) return parsed;

    std::string position = cursor;
    auto colon = cursor.find(':');
    if (colon != std::string::npos) {
        position = cursor.substr(0, colon);
        auto skip = FormatConverter::parseUInt64(cursor.substr(colon + 1));
        if (!skip) {
            throw ValidationError("Invalid scan cursor: " + cursor);
        }
        parsed.skip = static_cast<size_t>(*skip);
    }

    if (!FormatConverter::parseUInt64(position)) {
        throw ValidationError("Invalid scan cursor: " + cursor);
    }
    parsed.position = position;
    return parsed;
}

void requireKey(const std::string& key) {
    if (key.empty()) {
        throw ValidationError("Key must not be empty");
    }
}

void requireTtl(std::optional<int64_t> ttl) {
    if (ttl && *ttl <= 0) {
        throw ValidationError("TTL must be a positive number of seconds");
    }
}

std::string formatScore(double score) {
    std::ostringstream out;
    out.precision(17);
    out << score;
    return out.str();
}

uint64_t elapsedSince(std::chrono::steady_clock::time_point start) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

}  // namespace

// ============================================================================
// Construction and Connection Management
// ============================================================================

RedisDriver::RedisDriver(ConnectionConfig config, const DriverSettings& settings)
    : m_config(std::move(config)),
      m_scan(settings.redis),
      m_connectTimeout(settings.timeouts.redis_connect) {
    if (!m_config.database.empty()) {
        auto db = FormatConverter::parseInt64(m_config.database);
        if (!db || *db < 0) {
            throw ValidationError("Invalid Redis database index: " + m_config.database);
        }
        m_database = static_cast<int>(*db);
    }
}

RedisDriver::~RedisDriver() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connection) {
        spdlog::debug("Closing Redis connection to {}:{}", m_config.effectiveHost(), m_config.effectivePort());
        m_connection.reset();
    }
}

std::unique_ptr<RedisConnection> RedisDriver::openConnection() const {
    auto conn = std::make_unique<RedisConnection>(m_config.effectiveHost(), m_config.effectivePort(),
                                                  m_connectTimeout, m_config.ssl);
    conn->authenticate(m_config.username, m_config.password);
    conn->selectDatabase(m_database);
    return conn;
}

RedisConnection& RedisDriver::connectionLocked() {
    if (!m_connection || m_connection->isBroken()) {
        m_connection = openConnection();
    }
    return *m_connection;
}

// Serializes fn on the shared connection. A transport failure drops the
// connection before the error propagates.
template<typename Func>
auto RedisDriver::withConnection(Func&& fn) {
    std::lock_guard<std::mutex> lock(m_mutex);
    RedisConnection& conn = connectionLocked();
    try {
        return fn(conn);
    } catch (const ConnectionError& e) {
        spdlog::warn("[Redis] Connection error, resetting connection: {}", e.what());
        m_connection.reset();
        throw;
    }
}

// ============================================================================
// Driver Operations
// ============================================================================

TestConnectionResult RedisDriver::testConnection() {
    try {
        withConnection([](RedisConnection& conn) {
            conn.commandChecked({"PING"});
        });
        return {true, "Connection successful!"};
    } catch (const DatabaseError& e) {
        spdlog::debug("Redis connection test failed: {}", e.what());
        return {false, std::string("Connection failed: ") + e.what()};
    }
}

std::vector<TableInfo> RedisDriver::listTables() {
    return {TableInfo{"redis", "keys", "keyspace"}};
}

TableDataResponse RedisDriver::getTableData(const TableDataRequest& /*request*/) {
    // Keys are browsed with searchKeys()
    TableDataResponse response;
    response.page = 1;
    response.limit = 100;
    return response;
}

TableStructure RedisDriver::getTableStructure(const std::string& /*schema*/, const std::string& /*table*/) {
    return {};
}

SchemaOverview RedisDriver::getSchemaOverview() {
    return {};
}

std::vector<std::string> RedisDriver::tokenizeCommand(const std::string& command) {
    std::vector<std::string> tokens;
    std::string current;
    bool inQuotes = false;
    bool hasToken = false;

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        if (inQuotes) {
            if (c == '\\' && i + 1 < command.size() && command[i + 1] == '"') {
                current += '"';
                ++i;
            } else if (c == '"') {
                inQuotes = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            inQuotes = true;
            hasToken = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (hasToken) {
                tokens.push_back(current);
                current.clear();
                hasToken = false;
            }
        } else {
            current += c;
            hasToken = true;
        }
    }

    if (hasToken) {
        tokens.push_back(current);
    }
    return tokens;
}

QueryResult RedisDriver::executeQuery(const std::string& sql) {
    auto start = std::chrono::steady_clock::now();

    QueryResult result;
    std::vector<std::string> args = tokenizeCommand(sql);
    if (args.empty()) {
        result.error = "Empty query";
        result.timeTakenMs = elapsedSince(start);
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    RedisConnection& conn = connectionLocked();

    try {
        RedisReplyPtr reply = conn.command(args);
        if (reply->type == REDIS_REPLY_ERROR) {
            result.error = "Redis command failed: " + RedisFormatConverter::toString(reply.get());
        } else if (FormatConverter::toUpper(args[0]) == "INFO") {
            result.data.push_back({{"info", RedisFormatConverter::toString(reply.get())}});
            result.rowCount = 1;
        } else {
            result.data.push_back(RedisFormatConverter::toValue(reply.get()));
            result.rowCount = 1;
        }
    } catch (const ConnectionError& e) {
        spdlog::warn("[Redis] Connection error detected, resetting connection: {}", e.what());
        m_connection.reset();
        result.error = std::string("Redis command failed: ") + e.what();
    }

    result.timeTakenMs = elapsedSince(start);
    return result;
}

// ============================================================================
// Key Search
// ============================================================================

RedisKeyListResponse RedisDriver::searchKeys(const std::string& pattern, size_t limit,
                                             const std::string& cursor,
                                             const ScanProgress& progress) {
    if (limit == 0) {
        throw ValidationError("Limit must be greater than zero");
    }

    auto start = std::chrono::steady_clock::now();
    ScanCursor resume = parseCursor(cursor);
    std::string match = pattern.empty() ? "*" : pattern;

    return withConnection([&](RedisConnection& conn) {
        RedisKeyListResponse response;
        std::vector<std::string> keys;

        std::string position = resume.position;
        size_t skip = resume.skip;
        std::string nextCursor = "0";
        bool complete = false;
        uint32_t iteration = 0;

        while (iteration < m_scan.scan_max_iterations) {
            RedisReplyPtr reply = conn.commandChecked({"SCAN", position, "MATCH", match,
                                                       "COUNT", std::to_string(m_scan.scan_count)});
            if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
                throw QueryError("Unexpected SCAN reply");
            }

            std::string newPosition = RedisFormatConverter::toString(reply->element[0]);
            const redisReply* batchReply = reply->element[1];
            ++iteration;

            std::vector<std::string> batch;
            for (size_t i = 0; i < batchReply->elements; ++i) {
                batch.push_back(RedisFormatConverter::toString(batchReply->element[i]));
            }

            bool stopped = false;
            for (size_t i = skip; i < batch.size(); ++i) {
                if (keys.size() >= limit) {
                    // Resume inside this batch next time
                    nextCursor = position + ":" + std::to_string(i);
                    stopped = true;
                    break;
                }
                keys.push_back(batch[i]);
            }
            skip = 0;

            if (progress) {
                progress(iteration, m_scan.scan_max_iterations, keys.size(), batch);
            }

            if (stopped) break;

            if (newPosition == "0") {
                complete = true;
                nextCursor = "0";
                break;
            }

            position = newPosition;
            nextCursor = newPosition;
            if (keys.size() >= limit) break;
        }

        // TYPE, TTL and MEMORY USAGE for every key in one round trip
        std::vector<std::vector<std::string>> commands;
        commands.reserve(keys.size() * 3);
        for (const auto& key : keys) {
            commands.push_back({"TYPE", key});
            commands.push_back({"TTL", key});
            commands.push_back({"MEMORY", "USAGE", key});
        }
        std::vector<RedisReplyPtr> replies = conn.pipeline(commands);

        for (size_t i = 0; i < keys.size(); ++i) {
            const redisReply* typeReply = replies[i * 3].get();
            const redisReply* ttlReply = replies[i * 3 + 1].get();
            const redisReply* sizeReply = replies[i * 3 + 2].get();

            RedisKeyInfo info;
            info.key = keys[i];
            info.type = typeReply->type == REDIS_REPLY_ERROR ? "none" : RedisFormatConverter::toString(typeReply);
            info.ttl = ttlReply->type == REDIS_REPLY_INTEGER ? ttlReply->integer : -1;
            if (sizeReply->type == REDIS_REPLY_INTEGER && info.type != "none") {
                info.size = sizeReply->integer;
            }
            response.keys.push_back(std::move(info));
        }

        response.total = response.keys.size();
        response.cursor = nextCursor;
        response.scanComplete = complete;
        response.timeTakenMs = elapsedSince(start);

        spdlog::debug("Redis scan '{}' returned {} keys in {} iterations (complete: {})",
                      match, response.total, iteration, complete);
        return response;
    });
}

// ============================================================================
// Key Details
// ============================================================================

RedisKeyDetails RedisDriver::getKeyDetails(const std::string& key) {
    requireKey(key);

    return withConnection([&](RedisConnection& conn) {
        RedisReplyPtr exists = conn.commandChecked({"EXISTS", key});
        if (exists->type != REDIS_REPLY_INTEGER || exists->integer == 0) {
            throw QueryError("Key '" + key + "' does not exist");
        }

        RedisKeyDetails details;
        details.key = key;
        details.type = RedisFormatConverter::toString(conn.commandChecked({"TYPE", key}).get());

        RedisReplyPtr ttl = conn.commandChecked({"TTL", key});
        details.ttl = ttl->type == REDIS_REPLY_INTEGER ? ttl->integer : -1;

        const std::string& type = details.type;
        std::vector<std::string> lengthCommand;
        if (type == "string") {
            details.value = RedisFormatConverter::toValue(conn.commandChecked({"GET", key}).get());
            lengthCommand = {"STRLEN", key};
        } else if (type == "list") {
            details.value = RedisFormatConverter::toValue(conn.commandChecked({"LRANGE", key, "0", "-1"}).get());
            lengthCommand = {"LLEN", key};
        } else if (type == "set") {
            details.value = RedisFormatConverter::toValue(conn.commandChecked({"SMEMBERS", key}).get());
            lengthCommand = {"SCARD", key};
        } else if (type == "zset") {
            details.value = RedisFormatConverter::scoredMembers(
                conn.commandChecked({"ZRANGE", key, "0", "-1", "WITHSCORES"}).get());
            lengthCommand = {"ZCARD", key};
        } else if (type == "hash") {
            details.value = RedisFormatConverter::pairsToObject(conn.commandChecked({"HGETALL", key}).get());
            lengthCommand = {"HLEN", key};
        } else if (type == "stream") {
            details.value = RedisFormatConverter::streamEntries(
                conn.commandChecked({"XRANGE", key, "-", "+", "COUNT", "100"}).get());
            lengthCommand = {"XLEN", key};
        } else {
            details.value = nullptr;
        }

        // Optional metadata; servers may refuse MEMORY or OBJECT
        RedisReplyPtr size = conn.command({"MEMORY", "USAGE", key});
        if (size->type == REDIS_REPLY_INTEGER) {
            details.size = size->integer;
        }

        if (!lengthCommand.empty()) {
            RedisReplyPtr length = conn.command(lengthCommand);
            if (length->type == REDIS_REPLY_INTEGER) {
                details.length = length->integer;
            }
        }

        RedisReplyPtr encoding = conn.command({"OBJECT", "ENCODING", key});
        if (encoding->type == REDIS_REPLY_STRING || encoding->type == REDIS_REPLY_STATUS) {
            details.encoding = RedisFormatConverter::toString(encoding.get());
        }

        return details;
    });
}

// ============================================================================
// Key Mutation
// ============================================================================

bool RedisDriver::deleteKey(const std::string& key) {
    requireKey(key);

    return withConnection([&](RedisConnection& conn) {
        RedisReplyPtr reply = conn.commandChecked({"DEL", key});
        return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
    });
}

void RedisDriver::setStringKey(const std::string& key, const std::string& value, std::optional<int64_t> ttl) {
    requireKey(key);
    requireTtl(ttl);

    std::vector<std::string> args{"SET", key, value};
    if (ttl) {
        args.push_back("EX");
        args.push_back(std::to_string(*ttl));
    }

    withConnection([&](RedisConnection& conn) {
        conn.commandChecked(args);
    });
}

void RedisDriver::replaceKey(const std::string& key, std::vector<std::string> write, std::optional<int64_t> ttl) {
    std::vector<std::vector<std::string>> commands;
    commands.push_back({"MULTI"});
    commands.push_back({"DEL", key});
    commands.push_back(std::move(write));
    if (ttl) {
        commands.push_back({"EXPIRE", key, std::to_string(*ttl)});
    }
    commands.push_back({"EXEC"});

    withConnection([&](RedisConnection& conn) {
        std::vector<RedisReplyPtr> replies = conn.pipeline(commands);

        for (const auto& reply : replies) {
            if (reply->type == REDIS_REPLY_ERROR) {
                throw QueryError(RedisFormatConverter::toString(reply.get()));
            }
        }

        const redisReply* exec = replies.back().get();
        if (exec->type == REDIS_REPLY_NIL) {
            throw QueryError("Transaction aborted for key '" + key + "'");
        }
        for (size_t i = 0; i < exec->elements; ++i) {
            if (exec->element[i]->type == REDIS_REPLY_ERROR) {
                throw QueryError(RedisFormatConverter::toString(exec->element[i]));
            }
        }
    });
}

void RedisDriver::setListKey(const std::string& key, const std::vector<std::string>& values,
                             std::optional<int64_t> ttl) {
    requireKey(key);
    requireTtl(ttl);
    if (values.empty()) {
        throw ValidationError("Cannot set an empty list");
    }

    std::vector<std::string> write{"RPUSH", key};
    write.insert(write.end(), values.begin(), values.end());
    replaceKey(key, std::move(write), ttl);
}

void RedisDriver::setSetKey(const std::string& key, const std::vector<std::string>& members,
                            std::optional<int64_t> ttl) {
    requireKey(key);
    requireTtl(ttl);
    if (members.empty()) {
        throw ValidationError("Cannot set an empty set");
    }

    std::vector<std::string> write{"SADD", key};
    write.insert(write.end(), members.begin(), members.end());
    replaceKey(key, std::move(write), ttl);
}

void RedisDriver::setHashKey(const std::string& key, const std::vector<std::pair<std::string, std::string>>& fields,
                             std::optional<int64_t> ttl) {
    requireKey(key);
    requireTtl(ttl);
    if (fields.empty()) {
        throw ValidationError("Cannot set an empty hash");
    }

    std::vector<std::string> write{"HSET", key};
    for (const auto& [field, value] : fields) {
        write.push_back(field);
        write.push_back(value);
    }
    replaceKey(key, std::move(write), ttl);
}

void RedisDriver::setZsetKey(const std::string& key, const std::vector<std::pair<std::string, double>>& members,
                             std::optional<int64_t> ttl) {
    requireKey(key);
    requireTtl(ttl);
    if (members.empty()) {
        throw ValidationError("Cannot set an empty sorted set");
    }

    std::vector<std::string> write{"ZADD", key};
    for (const auto& [member, score] : members) {
        write.push_back(formatScore(score));
        write.push_back(member);
    }
    replaceKey(key, std::move(write), ttl);
}

void RedisDriver::updateTtl(const std::string& key, std::optional<int64_t> ttl) {
    requireKey(key);
    requireTtl(ttl);

    withConnection([&](RedisConnection& conn) {
        RedisReplyPtr exists = conn.commandChecked({"EXISTS", key});
        if (exists->type != REDIS_REPLY_INTEGER || exists->integer == 0) {
            throw QueryError("Key '" + key + "' does not exist");
        }

        if (ttl) {
            conn.commandChecked({"EXPIRE", key, std::to_string(*ttl)});
        } else {
            conn.commandChecked({"PERSIST", key});
        }
    });
}

}  // namespace dbbridge
