#include "scene_host.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <stdexcept>

namespace modelbridge::scene {

namespace {

double number_param(const json& params, const char* key) {
    const json* value = codec::find_key(params, key);
    if (!value || !value->is_number()) {
        throw std::invalid_argument(std::string("Missing or invalid required parameter: ") + key);
    }
    return value->get<double>();
}

std::string optional_string(const json& params, const char* key) {
    const json* value = codec::find_key(params, key);
    return value ? codec::as_string(*value) : std::string();
}

} // namespace

SceneHost::SceneHost(bool open_initial_document) {
    if (open_initial_document) {
        document_ = std::make_unique<SceneDocument>();
    }
}

SceneHost::~SceneHost() {
    shutdown();
}

bool SceneHost::has_active_document() const {
    std::lock_guard<std::mutex> lock(document_mutex_);
    return document_ != nullptr;
}

void SceneHost::open_document() {
    std::lock_guard<std::mutex> lock(document_mutex_);
    document_ = std::make_unique<SceneDocument>();
    LOG4CPLUS_INFO(host_logger(), "New document opened");
}

void SceneHost::close_document() {
    std::lock_guard<std::mutex> lock(document_mutex_);
    document_.reset();
    LOG4CPLUS_INFO(host_logger(), "Active document closed");
}

void SceneHost::run_on_document_context(Work work) {
    executor_.post(std::move(work));
}

void SceneHost::shutdown() {
    executor_.stop();
}

CommandResult SceneHost::execute(const std::string& operation, const json& params) {
    std::lock_guard<std::mutex> lock(document_mutex_);
    if (!document_) {
        return CommandResult::failure("No active document");
    }

    try {
        return execute_on(*document_, operation, params);
    } catch (const std::exception& e) {
        LOG4CPLUS_WARN(host_logger(), operation << " failed: " << e.what());
        return CommandResult::failure(e.what());
    }
}

CommandResult SceneHost::execute_on(SceneDocument& doc, const std::string& operation, const json& params) {
    if (operation == "create_sphere") {
        return CommandResult::ok(doc.create_sphere(number_param(params, "centerX"),
                                                   number_param(params, "centerY"),
                                                   number_param(params, "centerZ"),
                                                   number_param(params, "radius"),
                                                   optional_string(params, "color")));
    }

    if (operation == "create_box") {
        return CommandResult::ok(doc.create_box(number_param(params, "cornerX"),
                                                number_param(params, "cornerY"),
                                                number_param(params, "cornerZ"),
                                                number_param(params, "width"),
                                                number_param(params, "depth"),
                                                number_param(params, "height"),
                                                optional_string(params, "color")));
    }

    if (operation == "create_cylinder") {
        return CommandResult::ok(doc.create_cylinder(number_param(params, "baseX"),
                                                     number_param(params, "baseY"),
                                                     number_param(params, "baseZ"),
                                                     number_param(params, "height"),
                                                     number_param(params, "radius"),
                                                     optional_string(params, "color")));
    }

    if (operation == "get_scene_info") {
        return CommandResult::ok(doc.scene_info());
    }

    if (operation == "clear_scene") {
        bool current_layer_only = false;
        if (const json* flag = codec::find_key(params, "currentLayerOnly")) {
            current_layer_only = codec::as_bool(*flag, false);
        }
        return CommandResult::ok(doc.clear(current_layer_only));
    }

    if (operation == "create_layer") {
        const json* name = codec::find_key(params, "name");
        if (!name || !name->is_string()) {
            throw std::invalid_argument("Missing or invalid required parameter: name");
        }
        return CommandResult::ok(doc.create_layer(name->get<std::string>(), optional_string(params, "color")));
    }

    return CommandResult::failure("Unsupported operation: " + operation);
}

} // namespace modelbridge::scene
