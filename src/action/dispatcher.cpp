#include "dispatcher.hpp"

#include "param_validation.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <future>
#include <memory>

namespace modelbridge::actions {

const char* const kNoActiveDocument = "No active document. Please open a document before executing commands.";

CommandDispatcher::CommandDispatcher(HostCapability& host)
    : host_(host) {
    register_host_actions(registry_);
    register_system_actions(registry_);
}

CommandResult CommandDispatcher::dispatch(const CommandEnvelope& envelope) {
    ActionHandler* handler = registry_.find(envelope.type);
    if (!handler) {
        LOG4CPLUS_WARN(server_logger(), "Unknown command type: " << envelope.type);
        return CommandResult::failure("Unknown command type: " + envelope.type);
    }
    const std::string action = ActionRegistry::normalize(handler->name());

    const json& params = envelope.params;
    if (const ToolDescriptor* schema = handler->schema()) {
        std::string error = validate_params(*schema, params);
        if (!error.empty()) {
            LOG4CPLUS_WARN(server_logger(), action << ": " << error);
            return CommandResult::failure(error);
        }
    }

    if (!handler->requires_document()) {
        return run_guarded(*handler, action, params);
    }
    return run_on_document_context(*handler, action, params);
}

std::string CommandDispatcher::handle_request(const std::string& request_bytes) {
    CommandEnvelope envelope;
    try {
        envelope = codec::decode_envelope(request_bytes);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Decode error: " << exc.what());
        return codec::encode_result(CommandResult::failure(std::string("Error processing command: ") + exc.what()));
    }

    LOG4CPLUS_INFO(server_logger(), "Received command: " << envelope.type);
    return codec::encode_result(dispatch(envelope));
}

CommandResult CommandDispatcher::run_guarded(ActionHandler& handler, const std::string& action, const json& params) {
    ActionContext ctx{action, host_, params, server_running_.load()};
    try {
        return handler.handle(ctx);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(server_logger(), "Error processing " << action << ": " << e.what());
        return CommandResult::failure(std::string("Error processing command: ") + e.what());
    } catch (...) {
        LOG4CPLUS_ERROR(server_logger(), "Unknown fault while processing " << action);
        return CommandResult::failure("Error processing command: unknown fault");
    }
}

CommandResult CommandDispatcher::run_on_document_context(ActionHandler& handler, const std::string& action,
                                                          const json& params) {
    // the precondition is checked inside the same unit of work so a document
    // change cannot slip between the check and the operation
    auto task = std::make_shared<std::packaged_task<CommandResult()>>([this, &handler, &action, &params]() {
        if (!host_.has_active_document()) {
            LOG4CPLUS_ERROR(server_logger(), action << ": no active document available");
            return CommandResult::failure(kNoActiveDocument);
        }
        return run_guarded(handler, action, params);
    });
    std::future<CommandResult> done = task->get_future();

    try {
        host_.run_on_document_context([task]() { (*task)(); });
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(server_logger(), "Could not schedule " << action << ": " << e.what());
        return CommandResult::failure(std::string("Host is not accepting commands: ") + e.what());
    }

    try {
        return done.get();
    } catch (const std::exception& e) {
        // the host dropped the work item without running it
        LOG4CPLUS_ERROR(server_logger(), action << " was abandoned by the host: " << e.what());
        return CommandResult::failure(std::string("Host abandoned the command: ") + e.what());
    }
}

} // namespace modelbridge::actions
