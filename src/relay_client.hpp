#pragma once

#include "protocol.hpp"

#include <chrono>
#include <string>

namespace modelbridge::net {

struct RelayOptions {
    std::string host = "127.0.0.1";
    int port = kDefaultPort;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};
};

/**
 * Short-lived client of the command server. Every invoke() opens its own
 * connection, sends one envelope, waits for one reply and closes the
 * connection again. Failures are returned as CommandResult, never thrown.
 */
class RelayClient {
public:
    explicit RelayClient(RelayOptions options = {});

    /// @param tool_name namespaced ("geometry_tools.create_box") or bare operation name
    CommandResult invoke(const std::string& tool_name, const json& params) const;

    /// Sends an already built envelope.
    CommandResult send(const CommandEnvelope& envelope) const;

    const RelayOptions& options() const { return options_; }

private:
    RelayOptions options_;
};

} // namespace modelbridge::net
