#pragma once

#include "../protocol.hpp"

#include <string>

namespace modelbridge::actions {

/**
 * Checks @p params against the declared parameters of @p tool.
 *
 * @return empty string when valid, otherwise the error message
 */
std::string validate_params(const ToolDescriptor& tool, const json& params);

} // namespace modelbridge::actions
