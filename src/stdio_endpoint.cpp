#include "stdio_endpoint.hpp"

#include "json_codec.hpp"
#include "logger.hpp"
#include "tool_catalog.hpp"

#include <log4cplus/loggingmacros.h>

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

namespace modelbridge::rpc {

/// State shared with relay tasks, which may outlive a single request.
struct StdioEndpoint::SharedState {
    SharedState(ToolInvoker invoker_fn, std::ostream& out_stream)
        : invoker(std::move(invoker_fn)), out(out_stream) {}

    ToolInvoker invoker;

    std::mutex write_mutex;
    std::ostream& out;

    mutable std::mutex pending_mutex;
    std::condition_variable pending_cv;
    size_t pending = 0;

    void write_line(const json& message) {
        std::string line = codec::to_text(message);
        std::lock_guard<std::mutex> lock(write_mutex);
        out << line << '\n';
        out.flush();
        if (!out) {
            LOG4CPLUS_ERROR(rpc_logger(), "Failed to write response to output channel");
            out.clear();
        }
    }

    void begin_call() {
        std::lock_guard<std::mutex> lock(pending_mutex);
        ++pending;
    }

    void end_call() {
        std::lock_guard<std::mutex> lock(pending_mutex);
        --pending;
        pending_cv.notify_all();
    }
};

namespace {

json make_response(const std::optional<int64_t>& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id.value_or(0)},
        {"result", std::move(result)},
    };
}

json wrap_tool_result(const CommandResult& result) {
    // the command result travels as JSON text inside result.result
    return {{"result", codec::encode_result(result)}};
}

std::string trim(const std::string& text) {
    const char* blanks = " \t\r\n";
    auto begin = text.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(blanks);
    return text.substr(begin, end - begin + 1);
}

} // namespace

StdioEndpoint::StdioEndpoint(ToolInvoker invoker, std::ostream& out, Options options)
    : state_(std::make_shared<SharedState>(std::move(invoker), out)),
      options_(std::move(options)) {}

StdioEndpoint::StdioEndpoint(ToolInvoker invoker, std::ostream& out)
    : StdioEndpoint(std::move(invoker), out, Options{}) {}

StdioEndpoint::~StdioEndpoint() {
    size_t pending = pending_calls();
    if (pending > 0) {
        LOG4CPLUS_WARN(rpc_logger(), pending << " tool call(s) still running at teardown");
    }
}

json StdioEndpoint::initialize_result() const {
    return {
        {"protocolVersion", options_.protocol_version},
        {"serverInfo", {{"name", options_.server_name}, {"version", options_.server_version}}},
        {"capabilities", {{"tools", json::object()}}},
        {"tools", catalog_to_json()},
    };
}

size_t StdioEndpoint::pending_calls() const {
    std::lock_guard<std::mutex> lock(state_->pending_mutex);
    return state_->pending;
}

bool StdioEndpoint::wait_for_pending(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(state_->pending_mutex);
    return state_->pending_cv.wait_for(lock, grace, [this] { return state_->pending == 0; });
}

void StdioEndpoint::respond(const std::optional<int64_t>& id, json result) {
    if (!id) {
        return;
    }
    state_->write_line(make_response(id, std::move(result)));
}

void StdioEndpoint::respond_error(const std::optional<int64_t>& id, int code, const std::string& message) {
    state_->write_line({
        {"jsonrpc", "2.0"},
        {"id", id.value_or(0)},
        {"error", {{"code", code}, {"message", message}}},
    });
}

void StdioEndpoint::sleep_interruptible(std::chrono::milliseconds duration) {
    const auto slice = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop_requested_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(slice);
    }
}

void StdioEndpoint::run(int input_fd) {
    LOG4CPLUS_INFO(rpc_logger(), "Server ready to process messages from stdin");

    std::string buffer;
    bool eof_reported = false;
    bool discarding = false;

    while (!stop_requested_ && !shutdown_requested_) {
        auto newline = buffer.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            handle_line(line);
            continue;
        }

        pollfd pfd{};
        pfd.fd = input_fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(options_.idle_timeout.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(rpc_logger(), "Error waiting for input: " << std::strerror(errno));
            sleep_interruptible(options_.eof_backoff);
            continue;
        }
        if (rc == 0) {
            LOG4CPLUS_DEBUG(rpc_logger(), "No input received in "
                                              << options_.idle_timeout.count() / 1000 << " seconds, waiting...");
            continue;
        }

        char chunk[4096];
        ssize_t n = ::read(input_fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG4CPLUS_ERROR(rpc_logger(), "Error reading from stdin: " << std::strerror(errno));
            sleep_interruptible(options_.eof_backoff);
            continue;
        }

        if (n == 0) {
            discarding = false;
            if (!buffer.empty()) {
                std::string line;
                line.swap(buffer);
                handle_line(line);
                continue;
            }
            if (!eof_reported) {
                LOG4CPLUS_INFO(rpc_logger(), "Input stream EOF - client disconnected, waiting for reconnection");
                eof_reported = true;
            }
            sleep_interruptible(options_.eof_backoff);
            continue;
        }

        eof_reported = false;
        buffer.append(chunk, static_cast<size_t>(n));

        if (discarding) {
            // drop the rest of an oversized line
            auto end = buffer.find('\n');
            if (end == std::string::npos) {
                buffer.clear();
                continue;
            }
            buffer.erase(0, end + 1);
            discarding = false;
        }

        if (buffer.size() > options_.max_line_length && buffer.find('\n') == std::string::npos) {
            LOG4CPLUS_ERROR(rpc_logger(), "Input line exceeds " << options_.max_line_length << " bytes, discarding it");
            respond_error(std::nullopt, rpc_error::kInternalError,
                          "Internal error: message exceeds " + std::to_string(options_.max_line_length) + " bytes");
            buffer.clear();
            discarding = true;
        }
    }

    LOG4CPLUS_INFO(rpc_logger(), "Message processing loop exited");
}

void StdioEndpoint::handle_line(const std::string& raw_line) {
    try {
        process_line(raw_line);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(rpc_logger(), "Error handling message: " << e.what());
        try {
            respond_error(std::nullopt, rpc_error::kInternalError, std::string("Internal error: ") + e.what());
        } catch (const std::exception& write_error) {
            LOG4CPLUS_ERROR(rpc_logger(), "Cannot report error: " << write_error.what());
        }
    }
}

void StdioEndpoint::process_line(const std::string& raw_line) {
    std::string line = trim(raw_line);
    if (line.empty()) {
        return;
    }

    LOG4CPLUS_INFO(rpc_logger(), "Received message: " << codec::truncate_for_log(line));

    json message;
    try {
        message = json::parse(line);
    } catch (const json::exception& e) {
        LOG4CPLUS_ERROR(rpc_logger(), "Error parsing message: " << e.what());
        respond_error(std::nullopt, rpc_error::kInternalError, std::string("Internal error: ") + e.what());
        return;
    }

    if (!message.is_object()) {
        respond_error(std::nullopt, rpc_error::kInternalError, "Internal error: message must be a JSON object");
        return;
    }

    StdioRequest request;
    if (const json* id = codec::find_key(message, "id")) {
        if (id->is_number_integer()) {
            request.id = id->get<int64_t>();
        } else if (!id->is_null()) {
            respond_error(std::nullopt, rpc_error::kInternalError, "Internal error: 'id' must be an integer");
            return;
        }
    }

    const json* method = codec::find_key(message, "method");
    if (!method || !method->is_string()) {
        LOG4CPLUS_ERROR(rpc_logger(), "Message has no method");
        respond_error(request.id, rpc_error::kInternalError, "Internal error: missing 'method'");
        return;
    }
    request.method = method->get<std::string>();

    if (const json* params = codec::find_key(message, "params")) {
        request.params = *params;
    }

    try {
        handle_request(request);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(rpc_logger(), "Error processing message: " << e.what());
        respond_error(request.id, rpc_error::kInternalError, std::string("Internal error: ") + e.what());
    }
}

void StdioEndpoint::handle_request(const StdioRequest& request) {
    const std::string& method = request.method;

    if (method == "initialize") {
        LOG4CPLUS_INFO(rpc_logger(), "Processing initialize request");
        respond(request.id, initialize_result());
        return;
    }

    if (method == "tools/call") {
        handle_tool_call(request);
        return;
    }

    if (method == "shutdown") {
        LOG4CPLUS_INFO(rpc_logger(), "Received shutdown request");
        shutdown_requested_ = true;
        respond(request.id, {{"success", true}});
        return;
    }

    if (method == "exit") {
        LOG4CPLUS_INFO(rpc_logger(), "Received exit notification");
        shutdown_requested_ = true;
        respond(request.id, {{"success", true}});
        return;
    }

    if (method == "ping") {
        respond(request.id, json::object());
        return;
    }

    if (!request.id) {
        LOG4CPLUS_DEBUG(rpc_logger(), "Notification: " << method);
        return;
    }

    LOG4CPLUS_WARN(rpc_logger(), "Unknown method: " << method);
    respond_error(request.id, rpc_error::kMethodNotFound, "Method not found: " + method);
}

void StdioEndpoint::handle_tool_call(const StdioRequest& request) {
    const json* name_obj = codec::find_key(request.params, "name");
    if (!name_obj || !name_obj->is_string() || name_obj->get<std::string>().empty()) {
        LOG4CPLUS_WARN(rpc_logger(), "tools/call without a tool name");
        respond_error(request.id, rpc_error::kInvalidParams, "Invalid params: 'name' is required");
        return;
    }
    const std::string tool_name = name_obj->get<std::string>();

    json parameters = json::object();
    const json* args = codec::find_key(request.params, "parameters");
    if (!args) {
        args = codec::find_key(request.params, "arguments");
    }
    if (args && args->is_object()) {
        parameters = *args;
    }

    if (!find_tool(tool_name) && !find_tool_by_operation(tool_name)) {
        LOG4CPLUS_WARN(rpc_logger(), "Unknown tool: " << tool_name);
        respond(request.id, wrap_tool_result(CommandResult::failure("Unknown tool: " + tool_name)));
        return;
    }

    LOG4CPLUS_INFO(rpc_logger(), "Executing tool: " << tool_name);

    auto state = state_;
    auto id = request.id;
    auto task = [state, id, tool_name, parameters]() {
        CommandResult result;
        try {
            result = state->invoker(tool_name, parameters);
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(rpc_logger(), "Error executing tool " << tool_name << ": " << e.what());
            result = CommandResult::failure(std::string("Error executing tool: ") + e.what());
        } catch (...) {
            LOG4CPLUS_ERROR(rpc_logger(), "Unknown fault executing tool " << tool_name);
            result = CommandResult::failure("Error executing tool: unknown fault");
        }

        try {
            json wrapped = wrap_tool_result(result);
            LOG4CPLUS_INFO(rpc_logger(), "Tool execution result: "
                                             << codec::truncate_for_log(wrapped["result"].get<std::string>(), 200));
            if (id) {
                state->write_line(make_response(id, std::move(wrapped)));
            }
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(rpc_logger(), "Cannot deliver result of " << tool_name << ": " << e.what());
        }
        state->end_call();
    };

    state->begin_call();
    try {
        std::thread(task).detach();
    } catch (const std::system_error& e) {
        LOG4CPLUS_WARN(rpc_logger(), "Running tool call inline: " << e.what());
        task();
    }
}

} // namespace modelbridge::rpc
