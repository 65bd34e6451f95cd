#include "bridge_config.hpp"
#include "logger.hpp"
#include "relay_client.hpp"
#include "stdio_endpoint.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include <signal.h>
#include <unistd.h>

namespace {

modelbridge::rpc::StdioEndpoint* g_endpoint = nullptr;

void on_signal(int) {
    if (g_endpoint) {
        g_endpoint->stop();
    }
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    modelbridge::StdioConfig config;
    try {
        config = modelbridge::parse_stdio_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0]
                  << " [--host H] [--port N] [--connect-timeout S] [--read-timeout S] [--grace S] [--config PATH]"
                  << std::endl;
        return 2;
    }

    if (config.show_version) {
        std::cerr << "Version: " << VERSION_STRING << std::endl;
        std::cerr << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cerr << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

    init_logging(config.config_path);

    LOG4CPLUS_INFO(rpc_logger(), "modelbridge_stdio starting, version " << VERSION_STRING);
    LOG4CPLUS_INFO(rpc_logger(), "Command server: " << config.relay.host << ":" << config.relay.port);

    modelbridge::net::RelayClient relay(config.relay);

    modelbridge::rpc::StdioEndpoint endpoint(
        [relay](const std::string& tool_name, const modelbridge::json& params) {
            return relay.invoke(tool_name, params);
        },
        std::cout);

    g_endpoint = &endpoint;
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    ::signal(SIGPIPE, SIG_IGN);

    endpoint.run(STDIN_FILENO);

    g_endpoint = nullptr;

    if (!endpoint.wait_for_pending(config.shutdown_grace)) {
        // relay tasks still blocked on the host would outlive logging and std::cout
        LOG4CPLUS_WARN(rpc_logger(), "Exiting with " << endpoint.pending_calls() << " tool call(s) still in flight");
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(0);
    }

    LOG4CPLUS_INFO(rpc_logger(), "Clean shutdown complete");
    return 0;
}
