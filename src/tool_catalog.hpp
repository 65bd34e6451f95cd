#pragma once

#include "protocol.hpp"

#include <string>
#include <vector>

namespace modelbridge {

/// All tools exposed to the assistant, in catalog order.
const std::vector<ToolDescriptor>& tool_catalog();

/// Looks up a tool by its namespaced name ("scene_tools.clear_scene").
const ToolDescriptor* find_tool(const std::string& name);

/// Looks up a tool by its bare operation name ("clear_scene").
const ToolDescriptor* find_tool_by_operation(const std::string& operation);

/// "geometry_tools.create_box" -> "create_box". Names without a namespace are returned as is.
std::string strip_namespace(const std::string& tool_name);

json tool_to_json(const ToolDescriptor& tool);
json catalog_to_json();

} // namespace modelbridge
