#include "action_base.hpp"
#include "action_registry.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"
#include "../tool_catalog.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>
#include <string>

namespace modelbridge::actions {

namespace {

/// Forwards a catalog tool to the host's execute().
class HostOperationAction final : public ActionHandler {
public:
    HostOperationAction(std::string operation, const ToolDescriptor& tool)
        : operation_(std::move(operation)), tool_(tool) {}

    const char* name() const override { return operation_.c_str(); }
    const ToolDescriptor* schema() const override { return &tool_; }

    CommandResult handle(ActionContext& ctx) override {
        LOG4CPLUS_DEBUG(server_logger(), "Executing " << operation_ << " with parameters: " << codec::to_text(ctx.params));
        CommandResult result = ctx.host.execute(operation_, ctx.params);
        if (!result.success) {
            LOG4CPLUS_WARN(server_logger(), operation_ << " failed: " << result.error.value_or("Unknown error"));
        }
        return result;
    }

private:
    std::string operation_;
    const ToolDescriptor& tool_;
};

} // namespace

void register_host_actions(ActionRegistry& registry) {
    for (const auto& tool : tool_catalog()) {
        registry.add(std::make_unique<HostOperationAction>(strip_namespace(tool.name), tool));
    }
}

} // namespace modelbridge::actions
