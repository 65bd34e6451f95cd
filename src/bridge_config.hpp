#pragma once

#include "relay_client.hpp"

#include <chrono>
#include <string>

namespace modelbridge {

/// Settings of the command server executable.
struct HostConfig {
    std::string bind_address = "127.0.0.1";
    int port = kDefaultPort;
    std::string config_path = "log4cplus.ini";
    bool open_document = true;
    bool enable_pdeathsig = false;
    bool show_version = false;
};

/// Settings of the stdio bridge executable.
struct StdioConfig {
    net::RelayOptions relay;
    std::string config_path = "log4cplus.ini";
    std::chrono::milliseconds shutdown_grace{5000};
    bool show_version = false;
};

/// Settings of the diagnostics executable.
struct DiagnoseConfig {
    net::RelayOptions relay;
    std::string config_path = "log4cplus.ini";
    bool show_version = false;
};

/*
 * The parsers accept both "--flag value" and "--flag=value" forms.
 * Bad values and unknown flags throw std::invalid_argument.
 */
HostConfig parse_host_args(int argc, char** argv);
StdioConfig parse_stdio_args(int argc, char** argv);
DiagnoseConfig parse_diagnose_args(int argc, char** argv);

} // namespace modelbridge
