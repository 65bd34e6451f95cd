#pragma once

#include "protocol.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace modelbridge::rpc {

/**
 * JSON-RPC style endpoint speaking newline-delimited JSON with the assistant.
 *
 * Only response lines are ever written to the output stream; diagnostics go
 * through log4cplus. tools/call requests are relayed on their own task so the
 * read loop keeps accepting lines while a call is in flight.
 */
class StdioEndpoint {
public:
    using ToolInvoker = std::function<CommandResult(const std::string& tool_name, const json& params)>;

    struct Options {
        std::string server_name = "modelbridge";
        std::string server_version = VERSION_STRING;
        std::string protocol_version = "2024-11-05";
        std::chrono::milliseconds idle_timeout{10000};
        std::chrono::milliseconds eof_backoff{1000};
        size_t max_line_length = 1024 * 1024;
    };

    StdioEndpoint(ToolInvoker invoker, std::ostream& out, Options options);
    StdioEndpoint(ToolInvoker invoker, std::ostream& out);

    /// Does not wait for tool calls; drain them with wait_for_pending() while @p out is still alive.
    ~StdioEndpoint();

    StdioEndpoint(const StdioEndpoint&) = delete;
    StdioEndpoint& operator=(const StdioEndpoint&) = delete;

    /**
     * Reads requests from @p input_fd until shutdown/exit is received or
     * stop() is called. End of input is not fatal: the loop keeps waiting for
     * the peer to come back.
     */
    void run(int input_fd);

    /// Processes one request line. Never throws; failures are answered with -32603.
    void handle_line(const std::string& line);

    /// Ends run() at its next wakeup. Only touches an atomic flag, so it is safe from a signal handler.
    void stop() { stop_requested_.store(true); }

    bool shutdown_requested() const { return shutdown_requested_.load(); }

    /// Waits up to @p grace for in-flight tool calls. Returns true when none are left.
    bool wait_for_pending(std::chrono::milliseconds grace);

    size_t pending_calls() const;

    /// Result object of initialize.
    json initialize_result() const;

private:
    struct SharedState;

    void process_line(const std::string& line);
    void handle_request(const StdioRequest& request);
    void handle_tool_call(const StdioRequest& request);
    void respond(const std::optional<int64_t>& id, json result);
    void respond_error(const std::optional<int64_t>& id, int code, const std::string& message);
    void sleep_interruptible(std::chrono::milliseconds duration);

    std::shared_ptr<SharedState> state_;
    Options options_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace modelbridge::rpc
