#include "action/dispatcher.hpp"
#include "bridge_config.hpp"
#include "command_server.hpp"
#include "logger.hpp"
#include "scene/scene_host.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop.store(true);
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    modelbridge::HostConfig config;
    try {
        config = modelbridge::parse_host_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0]
                  << " [--port N] [--bind ADDR] [--config PATH] [--no-document] [--pdeathsig] [-v]" << std::endl;
        return 2;
    }

    if (config.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (config.enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(config.config_path);

    LOG4CPLUS_INFO(core_logger(), "modelbridge_host starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Listen: " << config.bind_address << ":" << config.port);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (config.enable_pdeathsig ? "enabled" : "disabled"));

    modelbridge::scene::SceneHost host(config.open_document);
    LOG4CPLUS_INFO(core_logger(), "Active document: " << (host.has_active_document() ? "exists" : "none"));

    modelbridge::actions::CommandDispatcher dispatcher(host);

    modelbridge::net::CommandServer server(
        config.bind_address, config.port,
        [&dispatcher](const std::string& request_bytes, std::string& response_bytes) {
            response_bytes = dispatcher.handle_request(request_bytes);
        });

    if (!server.start()) {
        LOG4CPLUS_FATAL(core_logger(), "Failed to start socket server on port " << config.port);
        return 1;
    }
    dispatcher.set_server_running(true);

    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    while (!g_stop.load()) {
        ::sleep(1);
    }

    LOG4CPLUS_INFO(core_logger(), "Shutting down");
    dispatcher.set_server_running(false);
    server.stop();
    host.shutdown();
    LOG4CPLUS_INFO(core_logger(), "Shutdown complete");
    return 0;
}
