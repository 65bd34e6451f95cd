#pragma once

#include "action_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace modelbridge::actions {

/**
 * Handlers keyed by lower-cased command name. Lookups ignore case, so
 * "Create_Sphere" and "create_sphere" reach the same handler.
 */
class ActionRegistry {
public:
    /// Throws std::invalid_argument for a null handler or a name that is already taken.
    void add(std::unique_ptr<ActionHandler> handler);

    ActionHandler* find(const std::string& action) const;
    size_t size() const { return handlers_.size(); }

    static std::string normalize(const std::string& action);

private:
    std::unordered_map<std::string, std::unique_ptr<ActionHandler>> handlers_;
};

void register_host_actions(ActionRegistry& registry);
void register_system_actions(ActionRegistry& registry);

} // namespace modelbridge::actions
