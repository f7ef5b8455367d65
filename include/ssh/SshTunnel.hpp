#pragma once

/**
 * @file SshTunnel.hpp
 * @brief Local port forwarding through an SSH server using libssh2.
 */

#include "Config.hpp"
#include <libssh2.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dbbridge {

/**
 * @class SshTunnel
 * @brief Forwards 127.0.0.1:localPort() to a remote host:port through SSH.
 *
 * The constructor performs the full setup (TCP connect, handshake,
 * authentication, local bind) under a single deadline and throws on failure:
 * - TimeoutError when the deadline expires
 * - ConnectionError for resolve, connect, handshake, authentication and
 *   bind failures, each with its own message
 *
 * After construction a background thread accepts local connections. Each
 * accepted connection gets a direct-tcpip channel and its own copy thread.
 * The libssh2 session is shared by all channels and guarded by a mutex that
 * is held for the whole channel open and otherwise only around a single
 * non-blocking read or write, never while waiting on poll().
 *
 * Closing or destroying the tunnel stops the accept thread, ends every
 * forwarded connection and joins all threads.
 */
class SshTunnel {
public:
    SshTunnel(const SshConfig& ssh, std::string remoteHost, uint16_t remotePort,
              std::chrono::seconds timeout);
    ~SshTunnel();

    SshTunnel(const SshTunnel&) = delete;
    SshTunnel& operator=(const SshTunnel&) = delete;

    /**
     * @brief Port bound on 127.0.0.1 for forwarded connections.
     */
    uint16_t localPort() const { return m_localPort; }

    const std::string& remoteHost() const { return m_remoteHost; }
    uint16_t remotePort() const { return m_remotePort; }

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Stop forwarding and release the session. Idempotent.
     */
    void close();

    /**
     * @brief Expand a leading "~" to $HOME.
     */
    static std::string expandHome(const std::string& path);

private:
    using Clock = std::chrono::steady_clock;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void connectSocket(const SshConfig& ssh, Clock::time_point deadline);
    void startSession(Clock::time_point deadline);
    void authenticate(const SshConfig& ssh, Clock::time_point deadline);
    void bindListener();

    void acceptLoop();
    void forward(int clientFd);
    LIBSSH2_CHANNEL* openChannel();
    bool writeToChannel(LIBSSH2_CHANNEL* channel, const char* data, size_t length);
    void waitSocket(int directions, int timeoutMs);
    void closeChannel(LIBSSH2_CHANNEL* channel);
    void reapWorkers(bool all);
    void releaseResources();

    std::string lastSessionError();

    std::string m_remoteHost;
    uint16_t m_remotePort;
    std::chrono::seconds m_timeout;

    int m_socket = -1;
    int m_listenFd = -1;
    int m_shutdownPipe[2] = {-1, -1};
    uint16_t m_localPort = 0;

    LIBSSH2_SESSION* m_session = nullptr;
    std::mutex m_sessionMutex;

    std::atomic<bool> m_running{false};
    std::thread m_acceptThread;
    std::mutex m_workersMutex;
    std::vector<Worker> m_workers;
    std::once_flag m_closeOnce;
};

}  // namespace dbbridge
