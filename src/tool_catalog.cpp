#include "tool_catalog.hpp"

namespace modelbridge {

namespace {

ParamSpec number(const char* name, const char* description) {
    return ParamSpec{name, description, true, ParamType::Number};
}

ParamSpec optional_color(const char* what) {
    return ParamSpec{"color",
                     std::string("Optional color for the ") + what + " (e.g., 'red', 'blue', etc.)",
                     false,
                     ParamType::String};
}

std::vector<ToolDescriptor> build_catalog() {
    std::vector<ToolDescriptor> tools;

    tools.push_back({"geometry_tools.create_sphere",
                     "Creates a sphere with the specified center and radius",
                     {
                         number("centerX", "X coordinate of the sphere center"),
                         number("centerY", "Y coordinate of the sphere center"),
                         number("centerZ", "Z coordinate of the sphere center"),
                         number("radius", "Radius of the sphere"),
                         optional_color("sphere"),
                     }});

    tools.push_back({"geometry_tools.create_box",
                     "Creates a box with the specified dimensions",
                     {
                         number("cornerX", "X coordinate of the box corner"),
                         number("cornerY", "Y coordinate of the box corner"),
                         number("cornerZ", "Z coordinate of the box corner"),
                         number("width", "Width of the box (X dimension)"),
                         number("depth", "Depth of the box (Y dimension)"),
                         number("height", "Height of the box (Z dimension)"),
                         optional_color("box"),
                     }});

    tools.push_back({"geometry_tools.create_cylinder",
                     "Creates a cylinder with the specified base point, height, and radius",
                     {
                         number("baseX", "X coordinate of the cylinder base point"),
                         number("baseY", "Y coordinate of the cylinder base point"),
                         number("baseZ", "Z coordinate of the cylinder base point"),
                         number("height", "Height of the cylinder"),
                         number("radius", "Radius of the cylinder"),
                         optional_color("cylinder"),
                     }});

    tools.push_back({"scene_tools.get_scene_info", "Gets information about objects in the current scene", {}});

    tools.push_back({"scene_tools.clear_scene",
                     "Clears all objects from the current scene",
                     {
                         ParamSpec{"currentLayerOnly",
                                   "If true, only delete objects on the current layer",
                                   false,
                                   ParamType::Boolean},
                     }});

    tools.push_back({"scene_tools.create_layer",
                     "Creates a new layer in the document",
                     {
                         ParamSpec{"name", "Name of the new layer", true, ParamType::String},
                         optional_color("layer"),
                     }});

    return tools;
}

} // namespace

const char* param_type_name(ParamType type) {
    switch (type) {
        case ParamType::Number:
            return "number";
        case ParamType::Integer:
            return "integer";
        case ParamType::String:
            return "string";
        case ParamType::Boolean:
            return "boolean";
    }
    return "unknown";
}

const std::vector<ToolDescriptor>& tool_catalog() {
    static const std::vector<ToolDescriptor> catalog = build_catalog();
    return catalog;
}

const ToolDescriptor* find_tool(const std::string& name) {
    for (const auto& tool : tool_catalog()) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

const ToolDescriptor* find_tool_by_operation(const std::string& operation) {
    for (const auto& tool : tool_catalog()) {
        if (strip_namespace(tool.name) == operation) {
            return &tool;
        }
    }
    return nullptr;
}

std::string strip_namespace(const std::string& tool_name) {
    auto pos = tool_name.rfind('.');
    if (pos == std::string::npos) {
        return tool_name;
    }
    return tool_name.substr(pos + 1);
}

json tool_to_json(const ToolDescriptor& tool) {
    json parameters = json::array();
    for (const auto& param : tool.parameters) {
        parameters.push_back({
            {"name", param.name},
            {"description", param.description},
            {"required", param.required},
            {"schema", {{"type", param_type_name(param.type)}}},
        });
    }

    return {
        {"name", tool.name},
        {"description", tool.description},
        {"parameters", parameters},
    };
}

json catalog_to_json() {
    json tools = json::array();
    for (const auto& tool : tool_catalog()) {
        tools.push_back(tool_to_json(tool));
    }
    return tools;
}

} // namespace modelbridge
