/**
 * @file RedisConnection.cpp
 * @brief Implementation of the hiredis connection wrapper.
 */

#include "RedisConnection.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace dbbridge {

namespace {

std::once_flag g_openSslInit;

std::string replyText(const redisReply* reply) {
    if (!reply || !reply->str) return "";
    return std::string(reply->str, reply->len);
}

}  // namespace

// ============================================================================
// Connection Setup
// ============================================================================

RedisConnection::RedisConnection(const std::string& host, uint16_t port,
                                 std::chrono::seconds connectTimeout, bool tls)
    : m_sslContext(nullptr, redisFreeSSLContext),
      m_context(nullptr, redisFree),
      m_endpoint(host + ":" + std::to_string(port)) {
    struct timeval timeout = {
        static_cast<time_t>(connectTimeout.count()),
        0
    };

    redisContext* raw = redisConnectWithTimeout(host.c_str(), port, timeout);
    if (!raw) {
        throw ConnectionError("Failed to connect to Redis: cannot allocate redis context");
    }

    if (raw->err) {
        std::string error = raw->errstr;
        int code = raw->err;
        redisFree(raw);

        spdlog::error("Redis connection to {} failed: {}", m_endpoint, error);
        if (code == REDIS_ERR_TIMEOUT || FormatConverter::toLower(error).find("timed out") != std::string::npos) {
            throw TimeoutError("Connection timed out after " + std::to_string(connectTimeout.count()) + " seconds");
        }
        throw ConnectionError("Failed to connect to Redis: " + error);
    }

    m_context.reset(raw);
    if (tls) {
        initiateTls(host);
    }
    spdlog::debug("Connected to Redis at {}{}", m_endpoint, tls ? " (TLS)" : "");
}

void RedisConnection::initiateTls(const std::string& host) {
    std::call_once(g_openSslInit, []() { redisInitOpenSSL(); });

    redisSSLContextError sslError = REDIS_SSL_CTX_NONE;
    m_sslContext.reset(redisCreateSSLContext(nullptr, nullptr, nullptr, nullptr, host.c_str(), &sslError));
    if (!m_sslContext) {
        std::string error = redisSSLContextGetError(sslError);
        spdlog::error("Redis TLS setup for {} failed: {}", m_endpoint, error);
        throw ConnectionError("Failed to create Redis TLS context: " + error);
    }

    if (redisInitiateSSLWithContext(m_context.get(), m_sslContext.get()) != REDIS_OK) {
        std::string error = lastError();
        spdlog::error("Redis TLS handshake with {} failed: {}", m_endpoint, error);
        throw ConnectionError("Redis TLS handshake failed: " + error);
    }
}

void RedisConnection::authenticate(const std::string& username, const std::string& password) {
    if (password.empty()) return;

    std::vector<std::string> args{"AUTH"};
    if (!username.empty()) args.push_back(username);
    args.push_back(password);

    RedisReplyPtr reply = command(args);
    if (reply->type == REDIS_REPLY_ERROR) {
        throw ConnectionError("Redis authentication failed: " + replyText(reply.get()));
    }
}

void RedisConnection::selectDatabase(int db) {
    if (db == 0) return;

    RedisReplyPtr reply = command({"SELECT", std::to_string(db)});
    if (reply->type == REDIS_REPLY_ERROR) {
        throw ConnectionError("Redis database selection failed (db=" + std::to_string(db) +
                              "): " + replyText(reply.get()));
    }
}

// ============================================================================
// Command Execution
// ============================================================================

RedisReplyPtr RedisConnection::command(const std::vector<std::string>& args) {
    if (isBroken()) {
        throw ConnectionError("Redis connection is broken: " + lastError());
    }

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    void* raw = redisCommandArgv(m_context.get(), static_cast<int>(args.size()), argv.data(), argvlen.data());
    if (!raw) {
        throw ConnectionError("Redis connection error: " + lastError());
    }
    return RedisReplyPtr(static_cast<redisReply*>(raw));
}

RedisReplyPtr RedisConnection::commandChecked(const std::vector<std::string>& args) {
    RedisReplyPtr reply = command(args);
    if (reply->type == REDIS_REPLY_ERROR) {
        throw QueryError(replyText(reply.get()));
    }
    return reply;
}

void RedisConnection::append(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    if (redisAppendCommandArgv(m_context.get(), static_cast<int>(args.size()), argv.data(), argvlen.data()) != REDIS_OK) {
        throw ConnectionError("Redis connection error: " + lastError());
    }
}

std::vector<RedisReplyPtr> RedisConnection::pipeline(const std::vector<std::vector<std::string>>& commands) {
    if (isBroken()) {
        throw ConnectionError("Redis connection is broken: " + lastError());
    }

    for (const auto& args : commands) {
        append(args);
    }

    std::vector<RedisReplyPtr> replies;
    replies.reserve(commands.size());
    for (size_t i = 0; i < commands.size(); ++i) {
        void* raw = nullptr;
        if (redisGetReply(m_context.get(), &raw) != REDIS_OK || !raw) {
            throw ConnectionError("Redis connection error: " + lastError());
        }
        replies.emplace_back(static_cast<redisReply*>(raw));
    }
    return replies;
}

// ============================================================================
// Status
// ============================================================================

bool RedisConnection::isBroken() const {
    return !m_context || m_context->err != 0;
}

std::string RedisConnection::lastError() const {
    if (!m_context) return "no connection";
    if (m_context->err == 0) return "";
    return m_context->errstr;
}

}  // namespace dbbridge
