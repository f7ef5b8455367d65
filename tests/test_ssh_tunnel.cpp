#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "SshTunnel.hpp"
#include "DriverFactory.hpp"
#include "ErrorHandler.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstdlib>
#include <optional>
#include <random>
#include <sys/time.h>
#include <thread>
#include <vector>

using namespace dbbridge;
using ::testing::HasSubstr;

class SshTunnelTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* home = std::getenv("HOME");
        savedHome_ = home ? std::optional<std::string>(home) : std::nullopt;
        setenv("HOME", "/home/tester", 1);
    }

    void TearDown() override {
        if (savedHome_) {
            setenv("HOME", savedHome_->c_str(), 1);
        } else {
            unsetenv("HOME");
        }
    }

    SshConfig unreachable() const {
        SshConfig ssh;
        ssh.enabled = true;
        ssh.host = "127.0.0.1";
        ssh.port = 1;
        ssh.user = "tester";
        ssh.password = "secret";
        return ssh;
    }

    std::optional<std::string> savedHome_;
};

TEST_F(SshTunnelTest, ExpandHome) {
    EXPECT_EQ(SshTunnel::expandHome("~/.ssh/id_rsa"), "/home/tester/.ssh/id_rsa");
    EXPECT_EQ(SshTunnel::expandHome("/etc/key"), "/etc/key");
    EXPECT_EQ(SshTunnel::expandHome(""), "");
}

TEST_F(SshTunnelTest, UnreachableServer) {
    try {
        SshTunnel tunnel(unreachable(), "db.internal", 5432, std::chrono::seconds(2));
        FAIL() << "Expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Failed to connect to SSH server"));
    }
}

TEST_F(SshTunnelTest, NonSshPeerFailsHandshake) {
    // A listener that accepts and immediately closes never speaks SSH
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(fd, 1), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);

    std::thread acceptor([fd]() {
        int client = ::accept(fd, nullptr, nullptr);
        if (client >= 0) ::close(client);
    });

    SshConfig ssh = unreachable();
    ssh.port = ntohs(addr.sin_port);
    EXPECT_THROW(SshTunnel(ssh, "db.internal", 5432, std::chrono::seconds(3)), DatabaseError);

    acceptor.join();
    ::close(fd);
}

TEST_F(SshTunnelTest, FactoryWrapsTunnelFailure) {
    DriverSettings settings;
    settings.timeouts.tunnel = std::chrono::seconds(2);
    DefaultDriverFactory factory(settings);

    ConnectionConfig config;
    config.db_type = DatabaseType::Postgres;
    config.host = "db.internal";
    config.ssh = unreachable();

    try {
        factory.create(config);
        FAIL() << "Expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("SSH tunnel failed"));
    }
}

TEST_F(SshTunnelTest, FactoryIgnoresTunnelForSQLite) {
    DefaultDriverFactory factory;

    ConnectionConfig config;
    config.db_type = DatabaseType::SQLite;
    config.file_path = ":memory:";
    config.ssh = unreachable();

    ManagedDriver driver = factory.create(config);

    EXPECT_EQ(driver->type(), DatabaseType::SQLite);
}

// Live SSH server tests
// DBBRIDGE_TEST_SSH_HOST, DBBRIDGE_TEST_SSH_USER, DBBRIDGE_TEST_SSH_PASSWORD or
// DBBRIDGE_TEST_SSH_KEY, optional DBBRIDGE_TEST_SSH_PORT. The echo test forwards
// to a listener on this machine's loopback, so the SSH server must run here.
class SshTunnelLiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* host = std::getenv("DBBRIDGE_TEST_SSH_HOST");
        const char* user = std::getenv("DBBRIDGE_TEST_SSH_USER");
        if (!host || !user) {
            GTEST_SKIP() << "DBBRIDGE_TEST_SSH_HOST / DBBRIDGE_TEST_SSH_USER not set";
        }

        ssh_.enabled = true;
        ssh_.host = host;
        ssh_.user = user;
        if (const char* port = std::getenv("DBBRIDGE_TEST_SSH_PORT")) {
            ssh_.port = static_cast<uint16_t>(std::stoi(port));
        }
        if (const char* password = std::getenv("DBBRIDGE_TEST_SSH_PASSWORD")) {
            ssh_.password = password;
        }
        if (const char* key = std::getenv("DBBRIDGE_TEST_SSH_KEY")) {
            ssh_.key_path = key;
        }
    }

    static int connectLocal(uint16_t port) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) return -1;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(port);
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            ::close(fd);
            return -1;
        }
        return fd;
    }

    SshConfig ssh_;
};

TEST_F(SshTunnelLiveTest, ForwardsToRemoteSshPort) {
    // Forward to the SSH server's own port and expect its banner
    SshTunnel tunnel(ssh_, "127.0.0.1", ssh_.port, std::chrono::seconds(10));
    ASSERT_TRUE(tunnel.isRunning());
    ASSERT_NE(tunnel.localPort(), 0);

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(tunnel.localPort());
    ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

    char buffer[64] = {};
    ssize_t n = ::recv(fd, buffer, sizeof(buffer) - 1, 0);
    ::close(fd);

    ASSERT_GT(n, 0);
    EXPECT_THAT(std::string(buffer, static_cast<size_t>(n)), ::testing::StartsWith("SSH-"));

    tunnel.close();
    EXPECT_FALSE(tunnel.isRunning());
}

TEST_F(SshTunnelLiveTest, RandomBytesRoundTrip) {
    // Loopback echo server that answers a single connection
    int listenFd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listenFd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listenFd, 1), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(listenFd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    uint16_t echoPort = ntohs(addr.sin_port);

    // Stops the echo server on every exit path, including failed assertions
    struct EchoServer {
        int listenFd;
        std::thread thread;
        ~EchoServer() {
            ::shutdown(listenFd, SHUT_RDWR);
            if (thread.joinable()) thread.join();
            ::close(listenFd);
        }
    } echo{listenFd, std::thread([listenFd]() {
        int client = ::accept(listenFd, nullptr, nullptr);
        if (client < 0) return;
        char buffer[4096];
        ssize_t n;
        while ((n = ::recv(client, buffer, sizeof(buffer), 0)) > 0) {
            ssize_t sent = 0;
            while (sent < n) {
                ssize_t w = ::send(client, buffer + sent, static_cast<size_t>(n - sent), MSG_NOSIGNAL);
                if (w <= 0) break;
                sent += w;
            }
        }
        ::close(client);
    })};

    std::vector<char> payload(64 * 1024);
    std::mt19937 rng(20261018);
    std::uniform_int_distribution<int> byte(0, 255);
    for (auto& c : payload) {
        c = static_cast<char>(byte(rng));
    }

    std::vector<char> received;
    {
        SshTunnel tunnel(ssh_, "127.0.0.1", echoPort, std::chrono::seconds(10));

        int fd = connectLocal(tunnel.localPort());
        ASSERT_GE(fd, 0);
        timeval timeout{10, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        std::thread writer([fd, &payload]() {
            size_t sent = 0;
            while (sent < payload.size()) {
                ssize_t w = ::send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
                if (w <= 0) break;
                sent += static_cast<size_t>(w);
            }
        });

        char buffer[4096];
        while (received.size() < payload.size()) {
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            received.insert(received.end(), buffer, buffer + n);
        }

        ::shutdown(fd, SHUT_RDWR);
        writer.join();
        ::close(fd);
        tunnel.close();
    }

    ASSERT_EQ(received.size(), payload.size());
    EXPECT_TRUE(received == payload);
}
