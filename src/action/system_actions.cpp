#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>

namespace modelbridge::actions {

class HealthCheckAction final : public ActionHandler {
public:
    const char* name() const override { return "health_check"; }
    bool requires_document() const override { return false; }

    CommandResult handle(ActionContext& ctx) override {
        LOG4CPLUS_INFO(server_logger(), "Performing health check...");

        json status = {
            {"pluginLoaded", true},
            {"activeDocument", ctx.host.has_active_document()},
            {"socketServerRunning", ctx.server_running},
            {"version", VERSION_STRING},
        };

        LOG4CPLUS_INFO(server_logger(), "Health check results: " << status.dump());
        return CommandResult::ok(status);
    }
};

class PingAction final : public ActionHandler {
public:
    const char* name() const override { return "ping"; }
    bool requires_document() const override { return false; }

    CommandResult handle(ActionContext&) override {
        return CommandResult::ok("pong");
    }
};

void register_system_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<HealthCheckAction>());
    registry.add(std::make_unique<PingAction>());
}

} // namespace modelbridge::actions
