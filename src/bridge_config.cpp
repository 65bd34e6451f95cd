#include "bridge_config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace modelbridge {

namespace {

// Matches "--name value" and "--name=value"; advances i past a separate value.
bool match_option(int argc, char** argv, int& i, const char* name, std::string& value) {
    size_t name_len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0) {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("Missing value for ") + name);
        }
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, name_len) == 0 && argv[i][name_len] == '=') {
        value = argv[i] + name_len + 1;
        return true;
    }
    return false;
}

long parse_long(const std::string& text, const char* what, long min_value, long max_value) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE || value < min_value || value > max_value) {
        throw std::invalid_argument(std::string("Invalid value for ") + what + ": '" + text + "'");
    }
    return value;
}

int parse_port(const std::string& text) {
    return static_cast<int>(parse_long(text, "--port", 0, 65535));
}

std::chrono::milliseconds parse_seconds(const std::string& text, const char* what) {
    return std::chrono::seconds(parse_long(text, what, 0, INT_MAX / 1000));
}

bool is_version_flag(const char* arg) {
    return std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0;
}

} // namespace

HostConfig parse_host_args(int argc, char** argv) {
    HostConfig config;
    std::string value;

    for (int i = 1; i < argc; ++i) {
        if (is_version_flag(argv[i])) {
            config.show_version = true;
            continue;
        }

        if (std::strcmp(argv[i], "--pdeathsig") == 0) {
            config.enable_pdeathsig = true;
            continue;
        }

        if (std::strcmp(argv[i], "--no-document") == 0) {
            config.open_document = false;
            continue;
        }

        if (match_option(argc, argv, i, "--config", value)) {
            config.config_path = value;
            continue;
        }

        if (match_option(argc, argv, i, "--port", value)) {
            config.port = parse_port(value);
            continue;
        }

        if (match_option(argc, argv, i, "--bind", value)) {
            config.bind_address = value;
            continue;
        }

        throw std::invalid_argument(std::string("Unknown argument: ") + argv[i]);
    }

    return config;
}

StdioConfig parse_stdio_args(int argc, char** argv) {
    StdioConfig config;
    std::string value;

    for (int i = 1; i < argc; ++i) {
        if (is_version_flag(argv[i])) {
            config.show_version = true;
            continue;
        }

        if (match_option(argc, argv, i, "--config", value)) {
            config.config_path = value;
            continue;
        }

        if (match_option(argc, argv, i, "--host", value)) {
            config.relay.host = value;
            continue;
        }

        if (match_option(argc, argv, i, "--port", value)) {
            config.relay.port = parse_port(value);
            continue;
        }

        if (match_option(argc, argv, i, "--connect-timeout", value)) {
            config.relay.connect_timeout = parse_seconds(value, "--connect-timeout");
            continue;
        }

        if (match_option(argc, argv, i, "--read-timeout", value)) {
            config.relay.read_timeout = parse_seconds(value, "--read-timeout");
            continue;
        }

        if (match_option(argc, argv, i, "--grace", value)) {
            config.shutdown_grace = parse_seconds(value, "--grace");
            continue;
        }

        throw std::invalid_argument(std::string("Unknown argument: ") + argv[i]);
    }

    return config;
}

DiagnoseConfig parse_diagnose_args(int argc, char** argv) {
    DiagnoseConfig config;
    std::string value;

    for (int i = 1; i < argc; ++i) {
        if (is_version_flag(argv[i])) {
            config.show_version = true;
            continue;
        }

        if (match_option(argc, argv, i, "--config", value)) {
            config.config_path = value;
            continue;
        }

        if (match_option(argc, argv, i, "--host", value)) {
            config.relay.host = value;
            continue;
        }

        if (match_option(argc, argv, i, "--port", value)) {
            config.relay.port = parse_port(value);
            continue;
        }

        throw std::invalid_argument(std::string("Unknown argument: ") + argv[i]);
    }

    return config;
}

} // namespace modelbridge
