#include <gtest/gtest.h>

#include "action/dispatcher.hpp"
#include "command_server.hpp"
#include "json_codec.hpp"
#include "relay_client.hpp"
#include "scene/scene_host.hpp"
#include "socket_io.hpp"
#include "test_helpers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

using modelbridge::CommandResult;
using modelbridge::json;
using modelbridge::net::CommandServer;
using modelbridge::net::RelayClient;
using modelbridge::net::RelayOptions;

namespace {

/// Scene host, dispatcher and server on an ephemeral loopback port.
struct RunningServer {
    explicit RunningServer(bool open_document = true)
        : host(open_document),
          dispatcher(host),
          server("127.0.0.1", 0, [this](const std::string& request, std::string& response) {
              response = dispatcher.handle_request(request);
          }) {}

    bool start() {
        if (!server.start()) {
            return false;
        }
        dispatcher.set_server_running(true);
        return true;
    }

    RelayClient client() const {
        RelayOptions options;
        options.port = server.port();
        options.connect_timeout = std::chrono::milliseconds(2000);
        options.read_timeout = std::chrono::milliseconds(5000);
        return RelayClient(options);
    }

    modelbridge::scene::SceneHost host;
    modelbridge::actions::CommandDispatcher dispatcher;
    CommandServer server;
};

modelbridge::net::UniqueFd connect_raw(int port) {
    modelbridge::net::UniqueFd fd(::socket(AF_INET, SOCK_STREAM, 0));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        fd.reset();
    }
    return fd;
}

} // namespace

TEST(CommandServer, CreateSphereRoundTripReturnsId) {
    RunningServer running;
    ASSERT_TRUE(running.start());

    CommandResult result = running.client().invoke("geometry_tools.create_sphere",
                                                   {{"centerX", 0}, {"centerY", 0}, {"centerZ", 0}, {"radius", 5}});

    ASSERT_TRUE(result.success) << result.error.value_or("");
    ASSERT_TRUE(result.result.contains("id"));
    EXPECT_TRUE(result.result["id"].is_string());
    EXPECT_FALSE(result.result["id"].get<std::string>().empty());
}

TEST(CommandServer, GetSceneInfoOnEmptyDocument) {
    RunningServer running;
    ASSERT_TRUE(running.start());

    CommandResult result = running.client().invoke("scene_tools.get_scene_info", json::object());

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.result["objectCount"], 0);
}

TEST(CommandServer, NoDocumentIsReportedAsData) {
    RunningServer running(false);
    ASSERT_TRUE(running.start());

    CommandResult result = running.client().invoke("geometry_tools.create_sphere",
                                                   {{"centerX", 0}, {"centerY", 0}, {"centerZ", 0}, {"radius", 5}});

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("No active document"), std::string::npos);

    CommandResult health = running.client().invoke("health_check", json::object());
    ASSERT_TRUE(health.success);
    EXPECT_EQ(health.result["activeDocument"], false);
    EXPECT_EQ(health.result["socketServerRunning"], true);
}

TEST(CommandServer, ConcurrentClientsGetTheirOwnResponses) {
    RunningServer running;
    ASSERT_TRUE(running.start());
    RelayClient client = running.client();

    constexpr int kClients = 8;
    std::vector<CommandResult> results(kClients);
    std::vector<std::thread> threads;
    for (int i = 0; i < kClients; ++i) {
        threads.emplace_back([&client, &results, i] {
            results[i] = client.invoke("scene_tools.create_layer", {{"name", "Layer" + std::to_string(i)}});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < kClients; ++i) {
        ASSERT_TRUE(results[i].success) << results[i].error.value_or("");
        EXPECT_EQ(results[i].result["name"], "Layer" + std::to_string(i));
    }

    CommandResult info = client.invoke("scene_tools.get_scene_info", json::object());
    ASSERT_TRUE(info.success);
    EXPECT_EQ(info.result["layers"].size(), static_cast<size_t>(kClients + 1));
}

TEST(CommandServer, SilentDisconnectDoesNotDispatch) {
    RunningServer running;
    ASSERT_TRUE(running.start());

    {
        auto fd = connect_raw(running.server.port());
        ASSERT_TRUE(fd.valid());
    }

    CommandResult info = running.client().invoke("scene_tools.get_scene_info", json::object());
    ASSERT_TRUE(info.success);
    EXPECT_EQ(info.result["objectCount"], 0);
}

TEST(CommandServer, MalformedCommandGetsErrorReply) {
    RunningServer running;
    ASSERT_TRUE(running.start());

    auto fd = connect_raw(running.server.port());
    ASSERT_TRUE(fd.valid());
    ASSERT_EQ(modelbridge::net::write_frame(fd.get(), "{\"Params\":{}}"), modelbridge::net::IoStatus::Ok);

    std::string reply;
    ASSERT_EQ(modelbridge::net::read_frame(fd.get(), reply, std::chrono::milliseconds(5000)),
              modelbridge::net::IoStatus::Ok);

    CommandResult result = modelbridge::codec::decode_result(reply);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.value_or("").find("Type"), std::string::npos);
}

TEST(CommandServer, UnknownCommandGetsErrorReply) {
    RunningServer running;
    ASSERT_TRUE(running.start());

    CommandResult result = running.client().invoke("teleport", json::object());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Unknown command type: teleport");
}

TEST(CommandServer, BindFailureIsReported) {
    RunningServer first;
    ASSERT_TRUE(first.start());

    CommandServer second("127.0.0.1", first.server.port(), [](const std::string&, std::string& response) {
        response = "{}";
    });

    EXPECT_FALSE(second.start());
    EXPECT_FALSE(second.is_running());
}

TEST(CommandServer, StopIsIdempotentAndReleasesPort) {
    auto running = std::make_unique<RunningServer>();
    ASSERT_TRUE(running->start());
    int port = running->server.port();

    running->server.stop();
    running->server.stop();
    EXPECT_FALSE(running->server.is_running());

    CommandServer again("127.0.0.1", port, [](const std::string&, std::string& response) { response = "{}"; });
    EXPECT_TRUE(again.start());
}
