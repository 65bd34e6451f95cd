#include "json_codec.hpp"

#include <stdexcept>

namespace modelbridge::codec {

namespace {

const json* find_either(const json& obj, const char* upper, const char* lower) {
    if (auto found = find_key(obj, upper)) {
        return found;
    }
    return find_key(obj, lower);
}

} // namespace

std::string to_text(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

CommandEnvelope decode_envelope(const std::string& bytes) {
    json root = json::parse(bytes);
    if (!root.is_object()) {
        throw std::runtime_error("command must be a JSON object");
    }

    CommandEnvelope envelope;
    const json* type_obj = find_either(root, "Type", "type");
    if (!type_obj || !type_obj->is_string()) {
        throw std::runtime_error("command is missing a string 'Type'");
    }
    envelope.type = type_obj->get<std::string>();

    if (const json* params_obj = find_either(root, "Params", "params")) {
        if (params_obj->is_null()) {
            envelope.params = json::object();
        } else if (params_obj->is_object()) {
            envelope.params = *params_obj;
        } else {
            throw std::runtime_error("'Params' must be a JSON object");
        }
    }

    return envelope;
}

std::string encode_envelope(const CommandEnvelope& envelope) {
    json root = {
        {"Type", envelope.type},
        {"Params", envelope.params.is_null() ? json::object() : envelope.params},
    };
    return to_text(root);
}

json result_to_json(const CommandResult& result) {
    json root = {{"success", result.success}};
    if (!result.result.is_null()) {
        root["result"] = result.result;
    }
    if (result.error) {
        root["error"] = *result.error;
    }
    return root;
}

std::string encode_result(const CommandResult& result) {
    return to_text(result_to_json(result));
}

CommandResult decode_result(const std::string& bytes) {
    json root = json::parse(bytes);
    if (!root.is_object()) {
        throw std::runtime_error("response must be a JSON object");
    }

    CommandResult result;
    const json* error_obj = find_key(root, "error");
    if (const json* success_obj = find_key(root, "success")) {
        result.success = as_bool(*success_obj);
    } else {
        // { "error": ... } replies carry no success flag
        result.success = (error_obj == nullptr);
    }

    if (const json* value = find_key(root, "result")) {
        result.result = *value;
    }
    if (error_obj) {
        result.error = error_obj->is_string() ? error_obj->get<std::string>() : to_text(*error_obj);
        result.success = false;
    } else if (!result.success) {
        result.error = "Unknown error";
    }
    return result;
}

const json* find_key(const json& map_obj, const std::string& key) {
    if (!map_obj.is_object()) {
        return nullptr;
    }
    auto it = map_obj.find(key);
    if (it == map_obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const json& obj, const std::string& fallback) {
    if (obj.is_string()) {
        return obj.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const json& obj, int64_t fallback) {
    if (obj.is_number_integer()) {
        return obj.get<int64_t>();
    }
    return fallback;
}

bool as_bool(const json& obj, bool fallback) {
    if (obj.is_boolean()) {
        return obj.get<bool>();
    }
    return fallback;
}

double as_double(const json& obj, double fallback) {
    if (obj.is_number()) {
        return obj.get<double>();
    }
    return fallback;
}

std::string truncate_for_log(const std::string& text, size_t max_len) {
    if (text.size() <= max_len) {
        return text;
    }
    return text.substr(0, max_len) + "...";
}

} // namespace modelbridge::codec
