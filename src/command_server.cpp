#include "command_server.hpp"

#include "logger.hpp"
#include "socket_io.hpp"

#include <log4cplus/loggingmacros.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace modelbridge::net {

CommandServer::CommandServer(std::string bind_address, int port, RequestHandler handler)
    : bind_address_(std::move(bind_address)),
      port_(port),
      handler_(std::move(handler)) {}

CommandServer::~CommandServer() {
    stop();
}

bool CommandServer::setup_socket() {
    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        LOG4CPLUS_ERROR(server_logger(), "socket: " << std::strerror(errno));
        return false;
    }

    int reuse = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (::inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
        LOG4CPLUS_ERROR(server_logger(), "Invalid bind address: " << bind_address_);
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG4CPLUS_ERROR(server_logger(), "bind " << bind_address_ << ":" << port_ << ": " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, SOMAXCONN) < 0) {
        LOG4CPLUS_ERROR(server_logger(), "listen: " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    return true;
}

bool CommandServer::start() {
    if (running_) {
        return true;
    }

    if (!setup_socket()) {
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread(&CommandServer::accept_loop, this);

    LOG4CPLUS_INFO(server_logger(), "Socket server started on " << bind_address_ << ":" << port_);
    return true;
}

void CommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // The accept loop polls with a timeout and notices running_ == false
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    // Unblock connection tasks, then wait for them
    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (int fd : client_fds_) {
        ::shutdown(fd, SHUT_RDWR);
    }
    clients_cv_.wait(lock, [this] { return active_clients_ == 0; });

    LOG4CPLUS_INFO(server_logger(), "Socket server stopped");
}

void CommandServer::accept_loop() {
    while (running_) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno != EINTR) {
                LOG4CPLUS_ERROR(server_logger(), "poll: " << std::strerror(errno));
            }
            continue;
        }
        if (rc == 0 || !running_) {
            continue;
        }

        int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                LOG4CPLUS_ERROR(server_logger(), "accept: " << std::strerror(errno));
            }
            continue;
        }

        LOG4CPLUS_DEBUG(server_logger(), "Client connected, fd=" << client_fd);
        spawn_client_task(client_fd);
    }
}

void CommandServer::spawn_client_task(int client_fd) {
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        client_fds_.insert(client_fd);
        ++active_clients_;
    }

    try {
        std::thread([this, client_fd] {
            handle_client(client_fd);
            finish_client(client_fd);
        }).detach();
    } catch (const std::system_error& e) {
        LOG4CPLUS_ERROR(server_logger(), "Could not start connection task: " << e.what());
        finish_client(client_fd);
    }
}

void CommandServer::finish_client(int client_fd) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    client_fds_.erase(client_fd);
    ::close(client_fd);
    --active_clients_;
    clients_cv_.notify_all();
}

void CommandServer::handle_client(int client_fd) {
    std::string request;
    IoStatus status = read_frame(client_fd, request, receive_timeout_);
    if (status == IoStatus::Closed) {
        LOG4CPLUS_DEBUG(server_logger(), "Client disconnected without sending a command");
        return;
    }
    if (status == IoStatus::TooLarge) {
        LOG4CPLUS_WARN(server_logger(), "Rejecting oversized command");
        write_frame(client_fd, R"({"success":false,"error":"Command exceeds the maximum frame size"})");
        return;
    }
    if (status != IoStatus::Ok) {
        LOG4CPLUS_WARN(server_logger(), "Failed to read command: " << io_status_name(status));
        return;
    }

    LOG4CPLUS_DEBUG(server_logger(), "Received command: " << request);

    std::string response;
    try {
        handler_(request, response);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(server_logger(), "Request handler error: " << e.what());
        response = std::string(R"({"success":false,"error":"Internal server error"})");
    }

    LOG4CPLUS_DEBUG(server_logger(), "Sending response: " << response);

    status = write_frame(client_fd, response);
    if (status != IoStatus::Ok) {
        LOG4CPLUS_WARN(server_logger(), "Failed to send response: " << io_status_name(status));
    }
}

} // namespace modelbridge::net
