#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace modelbridge::net {

class CommandServer {
public:
    /// Synchronous request handler type
    using RequestHandler = std::function<void(const std::string& request_bytes, std::string& response_bytes)>;

    /**
     * Construct a CommandServer with a request handler.
     *
     * @param bind_address IPv4 address to listen on (loopback by default)
     * @param port TCP port, 0 picks an ephemeral port
     * @param handler Request handler, called concurrently from connection tasks
     */
    CommandServer(std::string bind_address, int port, RequestHandler handler);
    ~CommandServer();

    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    /// Bind, listen and start the accept thread. Returns false when the port cannot be bound.
    bool start();

    /// Stop accepting, close active connections and wait for their tasks.
    void stop();

    bool is_running() const { return running_.load(); }

    /// Actual listening port (useful when constructed with port 0).
    int port() const { return port_; }

    const std::string& bind_address() const { return bind_address_; }

    /// Time a connection may take to deliver its request.
    void set_receive_timeout(std::chrono::milliseconds timeout) { receive_timeout_ = timeout; }

private:
    std::string bind_address_;
    int port_;
    RequestHandler handler_;
    std::chrono::milliseconds receive_timeout_{30000};
    int server_fd_ = -1;
    std::atomic<bool> running_{false};

    // Accept thread
    std::thread accept_thread_;

    // Connection tasks
    std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    std::unordered_set<int> client_fds_;
    size_t active_clients_ = 0;

    bool setup_socket();
    void accept_loop();
    void spawn_client_task(int client_fd);
    void handle_client(int client_fd);
    void finish_client(int client_fd);
};

} // namespace modelbridge::net
