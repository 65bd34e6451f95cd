#include "relay_client.hpp"

#include "json_codec.hpp"
#include "logger.hpp"
#include "socket_io.hpp"
#include "tool_catalog.hpp"

#include <log4cplus/loggingmacros.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>

namespace modelbridge::net {

namespace {

enum class ConnectStatus {
    Connected,
    TimedOut,
    Failed,
};

std::string seconds_text(std::chrono::milliseconds timeout) {
    std::ostringstream oss;
    if (timeout.count() % 1000 == 0) {
        oss << timeout.count() / 1000;
    } else {
        oss << static_cast<double>(timeout.count()) / 1000.0;
    }
    oss << " seconds";
    return oss.str();
}

// Non-blocking connect bounded by `timeout`. On failure `error` holds the reason.
ConnectStatus connect_with_timeout(int fd, const sockaddr* addr, socklen_t addr_len,
                                   std::chrono::milliseconds timeout, int& error) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        error = errno;
        return ConnectStatus::Failed;
    }

    if (::connect(fd, addr, addr_len) < 0) {
        if (errno != EINPROGRESS) {
            error = errno;
            return ConnectStatus::Failed;
        }

        auto deadline = Clock::now() + timeout;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                return ConnectStatus::TimedOut;
            }

            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                error = errno;
                return ConnectStatus::Failed;
            }
            if (rc == 0) {
                return ConnectStatus::TimedOut;
            }
            break;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            error = errno;
            return ConnectStatus::Failed;
        }
        if (so_error != 0) {
            error = so_error;
            return ConnectStatus::Failed;
        }
    }

    // back to blocking mode; reads are bounded by poll in read_frame
    if (::fcntl(fd, F_SETFL, flags) < 0) {
        error = errno;
        return ConnectStatus::Failed;
    }
    return ConnectStatus::Connected;
}

} // namespace

RelayClient::RelayClient(RelayOptions options)
    : options_(std::move(options)) {}

CommandResult RelayClient::invoke(const std::string& tool_name, const json& params) const {
    if (tool_name.empty()) {
        LOG4CPLUS_WARN(relay_logger(), "Tool name is null or empty");
        return CommandResult::failure("Tool name cannot be null or empty");
    }

    CommandEnvelope envelope;
    envelope.type = strip_namespace(tool_name);
    envelope.params = params.is_object() ? params : json::object();
    return send(envelope);
}

CommandResult RelayClient::send(const CommandEnvelope& envelope) const {
    const std::string endpoint = options_.host + ":" + std::to_string(options_.port);
    LOG4CPLUS_INFO(relay_logger(), "Connecting to command server on " << endpoint);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* resolved = nullptr;
    const std::string port_text = std::to_string(options_.port);
    int gai = ::getaddrinfo(options_.host.c_str(), port_text.c_str(), &hints, &resolved);
    if (gai != 0 || resolved == nullptr) {
        std::string reason = ::gai_strerror(gai);
        LOG4CPLUS_ERROR(relay_logger(), "Cannot resolve " << options_.host << ": " << reason);
        return CommandResult::failure("Connection to host at " + endpoint + " failed: " + reason);
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(resolved, &::freeaddrinfo);

    UniqueFd sock(::socket(resolved->ai_family, resolved->ai_socktype | SOCK_CLOEXEC, resolved->ai_protocol));
    if (!sock.valid()) {
        std::string reason = std::strerror(errno);
        LOG4CPLUS_ERROR(relay_logger(), "socket: " << reason);
        return CommandResult::failure("Connection to host at " + endpoint + " failed: " + reason);
    }

    int error = 0;
    switch (connect_with_timeout(sock.get(), resolved->ai_addr, resolved->ai_addrlen, options_.connect_timeout, error)) {
        case ConnectStatus::TimedOut:
            LOG4CPLUS_ERROR(relay_logger(), "Connection to command server timed out");
            return CommandResult::failure("Connection to host at " + endpoint + " timed out after " +
                                          seconds_text(options_.connect_timeout));
        case ConnectStatus::Failed:
            LOG4CPLUS_ERROR(relay_logger(), "Connection to command server failed: " << std::strerror(error));
            return CommandResult::failure("Connection to host at " + endpoint + " failed: " + std::strerror(error));
        case ConnectStatus::Connected:
            break;
    }

    const std::string request = codec::encode_envelope(envelope);
    LOG4CPLUS_DEBUG(relay_logger(), "Sending command: " << request);

    IoStatus status = write_frame(sock.get(), request);
    if (status != IoStatus::Ok) {
        error = errno;
        LOG4CPLUS_ERROR(relay_logger(), "Failed to send command: " << io_status_name(status));
        if (status == IoStatus::TooLarge) {
            return CommandResult::failure("Command exceeds the maximum frame size");
        }
        return CommandResult::failure(std::string("Sending command to host failed: ") + std::strerror(error));
    }

    std::string response;
    status = read_frame(sock.get(), response, options_.read_timeout);
    error = errno;
    switch (status) {
        case IoStatus::Ok:
            break;
        case IoStatus::Timeout:
            LOG4CPLUS_ERROR(relay_logger(), "Reading response from command server timed out");
            return CommandResult::failure("Reading response from host timed out after " +
                                          seconds_text(options_.read_timeout));
        case IoStatus::Closed:
            LOG4CPLUS_ERROR(relay_logger(), "Command server closed the connection without a response");
            return CommandResult::failure("Host closed the connection before responding");
        case IoStatus::TooLarge:
            return CommandResult::failure("Invalid response from host: frame exceeds the maximum size");
        case IoStatus::Error:
            LOG4CPLUS_ERROR(relay_logger(), "Reading response failed: " << std::strerror(error));
            return CommandResult::failure(std::string("Reading response from host failed: ") + std::strerror(error));
    }

    LOG4CPLUS_DEBUG(relay_logger(), "Received response: " << codec::truncate_for_log(response, 500));

    try {
        return codec::decode_result(response);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(relay_logger(), "Invalid response from command server: " << e.what());
        return CommandResult::failure(std::string("Invalid response from host: ") + e.what());
    }
}

} // namespace modelbridge::net
