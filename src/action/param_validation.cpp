#include "param_validation.hpp"

namespace modelbridge::actions {

namespace {

bool matches_type(const json& value, ParamType type) {
    switch (type) {
        case ParamType::Number:
            return value.is_number();
        case ParamType::Integer:
            return value.is_number_integer();
        case ParamType::String:
            return value.is_string();
        case ParamType::Boolean:
            return value.is_boolean();
    }
    return false;
}

} // namespace

std::string validate_params(const ToolDescriptor& tool, const json& params) {
    if (!params.is_object()) {
        return "Parameters must be a JSON object";
    }

    for (const auto& spec : tool.parameters) {
        auto it = params.find(spec.name);
        if (it == params.end() || it->is_null()) {
            if (spec.required) {
                return "Missing required parameter: " + spec.name;
            }
            continue;
        }
        if (!matches_type(*it, spec.type)) {
            return "Invalid type for parameter " + spec.name + ": expected " + param_type_name(spec.type);
        }
    }
    return "";
}

} // namespace modelbridge::actions
