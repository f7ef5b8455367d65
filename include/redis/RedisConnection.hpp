#pragma once

/**
 * @file RedisConnection.hpp
 * @brief RAII wrapper for a synchronous hiredis context.
 */

#include <hiredis/hiredis.h>
#include <hiredis/hiredis_ssl.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace dbbridge {

struct RedisReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply) freeReplyObject(reply);
    }
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

/**
 * @class RedisConnection
 * @brief One blocking connection to a Redis server.
 *
 * hiredis API usage:
 * - redisConnectWithTimeout() bounded by the connect timeout
 * - redisCreateSSLContext() + redisInitiateSSLWithContext() when TLS is
 *   requested; the server certificate is verified against the system CA store
 * - redisCommandArgv() so keys and values are sent binary-safe
 * - redisAppendCommandArgv() + redisGetReply() for pipelines
 *
 * Once the context reports an I/O or protocol error it cannot be reused;
 * every later call throws ConnectionError and the owner must open a new one.
 *
 * Thread Safety:
 * - Not thread-safe; callers serialize access
 */
class RedisConnection {
public:
    /**
     * @param tls Negotiate TLS right after the TCP connect.
     * @throws TimeoutError if the connect timeout expires.
     * @throws ConnectionError for any other connect or TLS failure.
     */
    RedisConnection(const std::string& host, uint16_t port, std::chrono::seconds connectTimeout,
                    bool tls = false);
    ~RedisConnection() = default;

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    /**
     * @brief AUTH [username] password.
     * @throws ConnectionError if the server rejects the credentials.
     */
    void authenticate(const std::string& username, const std::string& password);

    /**
     * @brief SELECT db.
     * @throws ConnectionError if the index is rejected.
     */
    void selectDatabase(int db);

    /**
     * @brief Send one command and read its reply.
     * @return Reply, which may be of type REDIS_REPLY_ERROR.
     * @throws ConnectionError if the transport failed.
     */
    RedisReplyPtr command(const std::vector<std::string>& args);

    /**
     * @brief Like command(), but error replies become QueryError.
     */
    RedisReplyPtr commandChecked(const std::vector<std::string>& args);

    /**
     * @brief Send several commands in one round trip.
     * @return One reply per command, in order.
     * @throws ConnectionError if the transport failed.
     */
    std::vector<RedisReplyPtr> pipeline(const std::vector<std::vector<std::string>>& commands);

    /**
     * @brief True once the context has hit an unrecoverable error.
     */
    bool isBroken() const;

    std::string lastError() const;

private:
    void append(const std::vector<std::string>& args);
    void initiateTls(const std::string& host);

    // Must outlive m_context
    std::unique_ptr<redisSSLContext, decltype(&redisFreeSSLContext)> m_sslContext;
    std::unique_ptr<redisContext, decltype(&redisFree)> m_context;
    std::string m_endpoint;
};

}  // namespace dbbridge
