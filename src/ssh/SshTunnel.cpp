/**
 * @file SshTunnel.cpp
 * @brief Implementation of the libssh2 port forwarder.
 */

#include "SshTunnel.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace dbbridge {

namespace {

constexpr int kKeepaliveIntervalSeconds = 15;
constexpr int kAcceptPollMs = 1000;
constexpr int kCopyPollMs = 50;
constexpr int kCloseAttempts = 20;
constexpr size_t kBufferSize = 16384;

std::once_flag g_libssh2InitFlag;

void initLibssh2() {
    std::call_once(g_libssh2InitFlag, [] {
        if (libssh2_init(0) != 0) {
            throw ConnectionError("Failed to initialize libssh2");
        }
    });
}

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return static_cast<int>(std::max<long long>(left, 0));
}

bool sendAll(int fd, const char* data, size_t length) {
    size_t sent = 0;
    while (sent < length) {
        ssize_t n = ::send(fd, data + sent, length - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

SshTunnel::SshTunnel(const SshConfig& ssh, std::string remoteHost, uint16_t remotePort,
                     std::chrono::seconds timeout)
    : m_remoteHost(std::move(remoteHost)), m_remotePort(remotePort), m_timeout(timeout) {
    spdlog::info("[SSH] Creating tunnel to {}:{} -> {}:{}", ssh.host, ssh.port, m_remoteHost, m_remotePort);

    auto deadline = Clock::now() + m_timeout;
    try {
        initLibssh2();
        connectSocket(ssh, deadline);
        startSession(deadline);
        authenticate(ssh, deadline);
        bindListener();
    } catch (const DatabaseError&) {
        releaseResources();
        throw;
    }

    libssh2_session_set_blocking(m_session, 0);
    m_running = true;
    m_acceptThread = std::thread(&SshTunnel::acceptLoop, this);
    spdlog::info("[SSH] Tunnel listening on 127.0.0.1:{}", m_localPort);
}

SshTunnel::~SshTunnel() {
    close();
}

std::string SshTunnel::expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string SshTunnel::lastSessionError() {
    if (!m_session) return "no session";
    char* message = nullptr;
    int length = 0;
    libssh2_session_last_error(m_session, &message, &length, 0);
    return message ? std::string(message, static_cast<size_t>(length)) : "unknown error";
}

// ============================================================================
// Setup
// ============================================================================

void SshTunnel::connectSocket(const SshConfig& ssh, Clock::time_point deadline) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* resolved = nullptr;
    std::string port = std::to_string(ssh.port);
    int rc = ::getaddrinfo(ssh.host.c_str(), port.c_str(), &hints, &resolved);
    if (rc != 0) {
        throw ConnectionError("Failed to resolve SSH host '" + ssh.host + "': " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(resolved, &::freeaddrinfo);

    std::string lastError = "no usable address";
    for (addrinfo* ai = resolved; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastError = std::strerror(errno);
            continue;
        }

        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, remainingMs(deadline));
            if (ready == 0) {
                ::close(fd);
                throw TimeoutError("SSH connection timed out after " +
                                   std::to_string(m_timeout.count()) + " seconds");
            }
            if (ready < 0) {
                lastError = std::strerror(errno);
                ::close(fd);
                continue;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
            rc = soError == 0 ? 0 : -1;
            if (soError != 0) lastError = std::strerror(soError);
        } else if (rc != 0) {
            lastError = std::strerror(errno);
        }

        if (rc == 0) {
            ::fcntl(fd, F_SETFL, flags);
            m_socket = fd;
            spdlog::debug("[SSH] TCP connection established to {}:{}", ssh.host, ssh.port);
            return;
        }
        ::close(fd);
    }

    throw ConnectionError("Failed to connect to SSH server: " + lastError);
}

void SshTunnel::startSession(Clock::time_point deadline) {
    m_session = libssh2_session_init();
    if (!m_session) {
        throw ConnectionError("Failed to create SSH session");
    }

    int left = remainingMs(deadline);
    if (left == 0) {
        throw TimeoutError("SSH connection timed out after " + std::to_string(m_timeout.count()) + " seconds");
    }
    libssh2_session_set_blocking(m_session, 1);
    libssh2_session_set_timeout(m_session, left);

    int rc = libssh2_session_handshake(m_session, m_socket);
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        throw TimeoutError("SSH connection timed out after " + std::to_string(m_timeout.count()) + " seconds");
    }
    if (rc != 0) {
        throw ConnectionError("SSH handshake failed: " + lastSessionError());
    }

    libssh2_keepalive_config(m_session, 1, kKeepaliveIntervalSeconds);
    spdlog::debug("[SSH] Handshake complete, keep-alive every {}s", kKeepaliveIntervalSeconds);
}

void SshTunnel::authenticate(const SshConfig& ssh, Clock::time_point deadline) {
    int left = remainingMs(deadline);
    if (left == 0) {
        throw TimeoutError("SSH connection timed out after " + std::to_string(m_timeout.count()) + " seconds");
    }
    libssh2_session_set_timeout(m_session, left);

    if (!ssh.key_path.empty()) {
        std::string privateKey = expandHome(ssh.key_path);
        std::string publicKey = privateKey + ".pub";
        std::error_code ec;
        const char* publicKeyPath = std::filesystem::exists(publicKey, ec) ? publicKey.c_str() : nullptr;

        spdlog::debug("[SSH] Attempting key authentication with {}", privateKey);
        int rc = libssh2_userauth_publickey_fromfile(m_session, ssh.user.c_str(), publicKeyPath,
                                                     privateKey.c_str(), nullptr);
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            throw TimeoutError("SSH connection timed out after " + std::to_string(m_timeout.count()) + " seconds");
        }
        if (rc != 0) {
            spdlog::warn("[SSH] Key authentication failed: {}", lastSessionError());
        }
    }

    if (!libssh2_userauth_authenticated(m_session) && !ssh.password.empty()) {
        spdlog::debug("[SSH] Attempting password authentication");
        int rc = libssh2_userauth_password(m_session, ssh.user.c_str(), ssh.password.c_str());
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            throw TimeoutError("SSH connection timed out after " + std::to_string(m_timeout.count()) + " seconds");
        }
        if (rc != 0) {
            throw ConnectionError("SSH password authentication failed: " + lastSessionError());
        }
    }

    if (!libssh2_userauth_authenticated(m_session)) {
        throw ConnectionError("SSH authentication failed - check credentials");
    }
    spdlog::debug("[SSH] Authenticated as {}", ssh.user);
}

void SshTunnel::bindListener() {
    m_listenFd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (m_listenFd < 0) {
        throw ConnectionError(std::string("Failed to bind local port: ") + std::strerror(errno));
    }

    int reuse = 1;
    ::setsockopt(m_listenFd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (::bind(m_listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(m_listenFd, SOMAXCONN) != 0) {
        throw ConnectionError(std::string("Failed to bind local port: ") + std::strerror(errno));
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(m_listenFd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        throw ConnectionError(std::string("Failed to get local address: ") + std::strerror(errno));
    }
    m_localPort = ntohs(addr.sin_port);

    ::fcntl(m_listenFd, F_SETFL, ::fcntl(m_listenFd, F_GETFL, 0) | O_NONBLOCK);

    if (::pipe(m_shutdownPipe) != 0) {
        throw ConnectionError(std::string("Failed to create shutdown pipe: ") + std::strerror(errno));
    }
}

// ============================================================================
// Forwarding
// ============================================================================

void SshTunnel::acceptLoop() {
    spdlog::debug("[SSH] Forwarding thread started");

    while (m_running) {
        pollfd fds[2] = {{m_listenFd, POLLIN, 0}, {m_shutdownPipe[0], POLLIN, 0}};
        int rc = ::poll(fds, 2, kAcceptPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("[SSH] Accept poll failed: {}", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) {
            spdlog::debug("[SSH] Shutdown requested");
            break;
        }

        if (fds[0].revents & POLLIN) {
            sockaddr_storage peer{};
            socklen_t len = sizeof(peer);
            int clientFd = ::accept(m_listenFd, reinterpret_cast<sockaddr*>(&peer), &len);
            if (clientFd < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    spdlog::warn("[SSH] Accept error: {}", std::strerror(errno));
                }
            } else {
                spdlog::debug("[SSH] New local connection on port {}", m_localPort);
                auto done = std::make_shared<std::atomic<bool>>(false);
                std::lock_guard<std::mutex> lock(m_workersMutex);
                m_workers.push_back(Worker{std::thread([this, clientFd, done] {
                    forward(clientFd);
                    *done = true;
                }), done});
            }
        }

        reapWorkers(false);

        int nextKeepalive = 0;
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        int keepalive = libssh2_keepalive_send(m_session, &nextKeepalive);
        if (keepalive != 0 && keepalive != LIBSSH2_ERROR_EAGAIN) {
            spdlog::warn("[SSH] Keep-alive failed: {}", lastSessionError());
        }
    }

    spdlog::debug("[SSH] Forwarding thread stopped");
}

LIBSSH2_CHANNEL* SshTunnel::openChannel() {
    spdlog::debug("[SSH] Opening channel to {}:{}", m_remoteHost, m_remotePort);

    std::lock_guard<std::mutex> lock(m_sessionMutex);
    auto deadline = Clock::now() + m_timeout;
    while (m_running) {
        LIBSSH2_CHANNEL* channel = libssh2_channel_direct_tcpip(m_session, m_remoteHost.c_str(), m_remotePort);
        if (channel) return channel;

        if (libssh2_session_last_errno(m_session) != LIBSSH2_ERROR_EAGAIN) {
            spdlog::error("[SSH] Failed to open channel: {}", lastSessionError());
            return nullptr;
        }
        if (Clock::now() >= deadline) {
            spdlog::error("[SSH] Opening channel to {}:{} timed out", m_remoteHost, m_remotePort);
            return nullptr;
        }
        waitSocket(libssh2_session_block_directions(m_session), kCopyPollMs);
    }
    return nullptr;
}

void SshTunnel::waitSocket(int directions, int timeoutMs) {
    short events = 0;
    if (directions & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    pollfd fds[2] = {{m_socket, events, 0}, {m_shutdownPipe[0], POLLIN, 0}};
    ::poll(fds, 2, timeoutMs);
}

bool SshTunnel::writeToChannel(LIBSSH2_CHANNEL* channel, const char* data, size_t length) {
    size_t written = 0;
    while (written < length && m_running) {
        ssize_t rc;
        int directions = 0;
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            rc = libssh2_channel_write(channel, data + written, length - written);
            if (rc == LIBSSH2_ERROR_EAGAIN || rc == 0) {
                directions = libssh2_session_block_directions(m_session);
            }
        }

        if (rc > 0) {
            written += static_cast<size_t>(rc);
        } else if (rc == LIBSSH2_ERROR_EAGAIN || rc == 0) {
            waitSocket(directions, kCopyPollMs);
        } else {
            spdlog::debug("[SSH] Channel write failed with code {}", rc);
            return false;
        }
    }
    return written == length;
}

void SshTunnel::closeChannel(LIBSSH2_CHANNEL* channel) {
    for (int attempt = 0; attempt < kCloseAttempts; ++attempt) {
        int rc;
        int directions;
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            rc = libssh2_channel_close(channel);
            directions = libssh2_session_block_directions(m_session);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        waitSocket(directions, kCopyPollMs);
    }

    for (int attempt = 0; attempt < kCloseAttempts; ++attempt) {
        int rc;
        int directions;
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            rc = libssh2_channel_free(channel);
            directions = libssh2_session_block_directions(m_session);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return;
        waitSocket(directions, kCopyPollMs);
    }
    spdlog::warn("[SSH] Channel to {}:{} could not be released cleanly", m_remoteHost, m_remotePort);
}

void SshTunnel::forward(int clientFd) {
    LIBSSH2_CHANNEL* channel = openChannel();
    if (!channel) {
        ::close(clientFd);
        return;
    }
    spdlog::debug("[SSH] Channel opened");

    std::vector<char> buffer(kBufferSize);
    uint64_t bytesUp = 0;
    uint64_t bytesDown = 0;
    bool open = true;

    while (open && m_running) {
        pollfd fds[3] = {{clientFd, POLLIN, 0}, {m_socket, POLLIN, 0}, {m_shutdownPipe[0], POLLIN, 0}};
        int rc = ::poll(fds, 3, kCopyPollMs);
        if (rc < 0 && errno != EINTR) break;
        if (fds[2].revents & POLLIN) break;

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = ::recv(clientFd, buffer.data(), buffer.size(), 0);
            if (n <= 0) {
                open = false;
            } else if (!writeToChannel(channel, buffer.data(), static_cast<size_t>(n))) {
                open = false;
            } else {
                bytesUp += static_cast<uint64_t>(n);
            }
        }

        // Drain whatever the channel has buffered; packets for this channel may
        // have been read off the socket by another connection's thread.
        while (open) {
            ssize_t n;
            bool eof;
            {
                std::lock_guard<std::mutex> lock(m_sessionMutex);
                n = libssh2_channel_read(channel, buffer.data(), buffer.size());
                eof = libssh2_channel_eof(channel) != 0;
            }

            if (n > 0) {
                if (!sendAll(clientFd, buffer.data(), static_cast<size_t>(n))) {
                    open = false;
                } else {
                    bytesDown += static_cast<uint64_t>(n);
                }
                continue;
            }
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
                if (eof) open = false;
                break;
            }
            spdlog::debug("[SSH] Channel read failed with code {}", n);
            open = false;
        }
    }

    closeChannel(channel);
    ::close(clientFd);
    spdlog::debug("[SSH] Tunnel connection closed. Bytes: {} up, {} down", bytesUp, bytesDown);
}

void SshTunnel::reapWorkers(bool all) {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if (all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================================
// Shutdown
// ============================================================================

void SshTunnel::close() {
    std::call_once(m_closeOnce, [this] {
        bool wasRunning = m_running.exchange(false);

        if (m_shutdownPipe[1] >= 0) {
            char signal = 1;
            if (::write(m_shutdownPipe[1], &signal, 1) < 0) {
                spdlog::debug("[SSH] Shutdown signal failed: {}", std::strerror(errno));
            }
        }

        if (m_acceptThread.joinable()) m_acceptThread.join();
        reapWorkers(true);
        releaseResources();

        if (wasRunning) {
            spdlog::info("[SSH] Tunnel on 127.0.0.1:{} closed", m_localPort);
        }
    });
}

void SshTunnel::releaseResources() {
    if (m_session) {
        libssh2_session_set_blocking(m_session, 1);
        libssh2_session_set_timeout(m_session, 1000);
        libssh2_session_disconnect(m_session, "Tunnel closed");
        libssh2_session_free(m_session);
        m_session = nullptr;
    }
    closeFd(m_listenFd);
    closeFd(m_shutdownPipe[0]);
    closeFd(m_shutdownPipe[1]);
    closeFd(m_socket);
}

}  // namespace dbbridge
