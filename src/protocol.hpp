#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace modelbridge {

using json = nlohmann::json;

/// Default loopback port of the command server.
constexpr int kDefaultPort = 9876;

namespace rpc_error {
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
} // namespace rpc_error

enum class ParamType {
    Number,
    Integer,
    String,
    Boolean,
};

const char* param_type_name(ParamType type);

struct ParamSpec {
    std::string name;
    std::string description;
    bool required = false;
    ParamType type = ParamType::Number;
};

struct ToolDescriptor {
    std::string name;        // namespace.tool
    std::string description;
    std::vector<ParamSpec> parameters;
};

/// Request sent over the TCP hop: { "Type": ..., "Params": {...} }
struct CommandEnvelope {
    std::string type;
    json params = json::object();
};

struct CommandResult {
    bool success = false;
    json result;                       // null when absent
    std::optional<std::string> error;

    static CommandResult ok(json value = json()) {
        CommandResult r;
        r.success = true;
        r.result = std::move(value);
        return r;
    }

    static CommandResult failure(std::string message) {
        CommandResult r;
        r.success = false;
        r.error = std::move(message);
        return r;
    }
};

/// One line received on the stdio channel.
struct StdioRequest {
    std::string method;
    std::optional<int64_t> id;
    json params = json::object();
};

} // namespace modelbridge
