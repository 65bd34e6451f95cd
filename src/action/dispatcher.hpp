#pragma once

#include "action_registry.hpp"

#include "../host_capability.hpp"
#include "../protocol.hpp"

#include <atomic>
#include <string>

namespace modelbridge::actions {

/// Error text returned when an operation needs a document and none is open.
extern const char* const kNoActiveDocument;

/**
 * Maps a command envelope onto an operation handler and runs it against the
 * host. Never throws: every failure comes back as a CommandResult.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(HostCapability& host);

    CommandResult dispatch(const CommandEnvelope& envelope);

    /// Encoded-request entry point used by the socket server.
    std::string handle_request(const std::string& request_bytes);

    /// Reported by health_check.
    void set_server_running(bool running) { server_running_ = running; }

private:
    CommandResult run_guarded(ActionHandler& handler, const std::string& action, const json& params);
    CommandResult run_on_document_context(ActionHandler& handler, const std::string& action, const json& params);

    HostCapability& host_;
    ActionRegistry registry_;
    std::atomic<bool> server_running_{false};
};

} // namespace modelbridge::actions
