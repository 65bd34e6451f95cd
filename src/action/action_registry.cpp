#include "action_registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace modelbridge::actions {

std::string ActionRegistry::normalize(const std::string& action) {
    std::string key = action;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

void ActionRegistry::add(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("cannot register a null action handler");
    }

    std::string key = normalize(handler->name());
    if (handlers_.count(key) != 0) {
        throw std::invalid_argument("action '" + key + "' is already registered");
    }
    handlers_.emplace(std::move(key), std::move(handler));
}

ActionHandler* ActionRegistry::find(const std::string& action) const {
    auto it = handlers_.find(normalize(action));
    return it == handlers_.end() ? nullptr : it->second.get();
}

} // namespace modelbridge::actions
