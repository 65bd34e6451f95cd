#include <gtest/gtest.h>

#include "json_codec.hpp"
#include "relay_client.hpp"
#include "socket_io.hpp"
#include "test_helpers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>

using modelbridge::CommandResult;
using modelbridge::json;
using modelbridge::net::RelayClient;
using modelbridge::net::RelayOptions;
using modelbridge::net::UniqueFd;

namespace {

/// Loopback listener that accepts one connection and hands it to a script.
class ScriptedListener {
public:
    explicit ScriptedListener(std::function<void(int client_fd)> script)
        : listen_fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
        int opt = 1;
        ::setsockopt(listen_fd_.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            ::listen(listen_fd_.get(), 1) == 0) {
            socklen_t len = sizeof(addr);
            ::getsockname(listen_fd_.get(), reinterpret_cast<sockaddr*>(&addr), &len);
            port_ = ntohs(addr.sin_port);
        }

        thread_ = std::thread([this, script] {
            UniqueFd client(::accept(listen_fd_.get(), nullptr, nullptr));
            if (client.valid()) {
                script(client.get());
            }
        });
    }

    ~ScriptedListener() {
        ::shutdown(listen_fd_.get(), SHUT_RDWR);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }

private:
    UniqueFd listen_fd_;
    int port_ = 0;
    std::thread thread_;
};

RelayOptions options_for(int port, int read_timeout_ms = 2000) {
    RelayOptions options;
    options.port = port;
    options.connect_timeout = std::chrono::milliseconds(1000);
    options.read_timeout = std::chrono::milliseconds(read_timeout_ms);
    return options;
}

} // namespace

TEST(RelayClient, EmptyToolNameFailsWithoutConnecting) {
    RelayClient client(options_for(unused_local_port()));

    CommandResult result = client.invoke("", json::object());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Tool name cannot be null or empty");
}

TEST(RelayClient, RefusedConnectionFailsFast) {
    int port = unused_local_port();
    RelayClient client(options_for(port));

    auto started = std::chrono::steady_clock::now();
    CommandResult result = client.invoke("scene_tools.get_scene_info", json::object());
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("127.0.0.1:" + std::to_string(port)), std::string::npos);
    EXPECT_NE(result.error.value_or("").find("failed"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST(RelayClient, SendsStrippedTypeAndDecodesReply) {
    std::string received;
    ScriptedListener listener([&received](int fd) {
        modelbridge::net::read_frame(fd, received, std::chrono::milliseconds(2000));
        modelbridge::net::write_frame(fd, R"({"success":true,"result":{"deletedCount":4}})");
    });
    RelayClient client(options_for(listener.port()));

    CommandResult result = client.invoke("scene_tools.clear_scene", {{"currentLayerOnly", true}});

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.result["deletedCount"], 4);

    json request = json::parse(received);
    EXPECT_EQ(request["Type"], "clear_scene");
    EXPECT_EQ(request["Params"]["currentLayerOnly"], true);
}

TEST(RelayClient, SilentHostTimesOut) {
    std::atomic<bool> release{false};
    ScriptedListener listener([&release](int fd) {
        std::string ignored;
        modelbridge::net::read_frame(fd, ignored, std::chrono::milliseconds(2000));
        wait_until([&release] { return release.load(); });
    });
    RelayClient client(options_for(listener.port(), 300));

    CommandResult result = client.invoke("scene_tools.get_scene_info", json::object());
    release = true;

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("timed out"), std::string::npos);
}

TEST(RelayClient, HostClosingWithoutReplyIsReported) {
    ScriptedListener listener([](int fd) {
        std::string ignored;
        modelbridge::net::read_frame(fd, ignored, std::chrono::milliseconds(2000));
    });
    RelayClient client(options_for(listener.port()));

    CommandResult result = client.invoke("scene_tools.get_scene_info", json::object());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Host closed the connection before responding");
}

TEST(RelayClient, GarbageReplyIsInvalidResponse) {
    ScriptedListener listener([](int fd) {
        std::string ignored;
        modelbridge::net::read_frame(fd, ignored, std::chrono::milliseconds(2000));
        modelbridge::net::write_frame(fd, "not json at all");
    });
    RelayClient client(options_for(listener.port()));

    CommandResult result = client.invoke("scene_tools.get_scene_info", json::object());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or("").rfind("Invalid response from host", 0), 0u);
}

TEST(RelayClient, UnansweredHandshakeTimesOut) {
    UniqueFd listener(::socket(AF_INET, SOCK_STREAM, 0));
    ASSERT_TRUE(listener.valid());
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(listener.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listener.get(), 0), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(listener.get(), reinterpret_cast<sockaddr*>(&addr), &len), 0);
    int port = ntohs(addr.sin_port);

    // nobody accepts: once the accept queue is full the kernel drops further SYNs
    std::vector<UniqueFd> fillers;
    bool saturated = false;
    for (int i = 0; i < 16 && !saturated; ++i) {
        UniqueFd filler(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0));
        ASSERT_TRUE(filler.valid());
        ::connect(filler.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        pollfd pfd{};
        pfd.fd = filler.get();
        pfd.events = POLLOUT;
        saturated = ::poll(&pfd, 1, 200) == 0;
        fillers.push_back(std::move(filler));
    }
    if (!saturated) {
        GTEST_SKIP() << "kernel completed every handshake; cannot provoke a connect timeout";
    }

    RelayOptions options = options_for(port);
    options.connect_timeout = std::chrono::milliseconds(300);
    RelayClient client(options);

    CommandResult result = client.invoke("scene_tools.get_scene_info", json::object());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""),
              "Connection to host at 127.0.0.1:" + std::to_string(port) + " timed out after 0.3 seconds");
}
