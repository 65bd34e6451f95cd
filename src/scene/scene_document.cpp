#include "scene_document.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <unordered_map>

namespace modelbridge::scene {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const std::unordered_map<std::string, Color>& named_colors() {
    static const std::unordered_map<std::string, Color> colors = {
        {"black", {0, 0, 0}},
        {"white", {255, 255, 255}},
        {"red", {255, 0, 0}},
        {"green", {0, 128, 0}},
        {"lime", {0, 255, 0}},
        {"blue", {0, 0, 255}},
        {"yellow", {255, 255, 0}},
        {"cyan", {0, 255, 255}},
        {"magenta", {255, 0, 255}},
        {"orange", {255, 165, 0}},
        {"purple", {128, 0, 128}},
        {"pink", {255, 192, 203}},
        {"brown", {165, 42, 42}},
        {"gray", {128, 128, 128}},
        {"grey", {128, 128, 128}},
        {"silver", {192, 192, 192}},
        {"gold", {255, 215, 0}},
        {"navy", {0, 0, 128}},
        {"teal", {0, 128, 128}},
        {"olive", {128, 128, 0}},
        {"maroon", {128, 0, 0}},
        {"steelblue", {70, 130, 180}},
    };
    return colors;
}

void require_positive(double value, const char* what) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(std::string(what) + " must be greater than zero");
    }
}

std::string color_to_hex(const Color& color) {
    char buffer[8] = {0};
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", color.r, color.g, color.b);
    return buffer;
}

} // namespace

std::optional<Color> color_from_name(const std::string& name) {
    const auto& colors = named_colors();
    auto it = colors.find(to_lower(name));
    if (it == colors.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* object_type_name(ObjectType type) {
    switch (type) {
        case ObjectType::Sphere:
            return "Sphere";
        case ObjectType::Box:
            return "Box";
        case ObjectType::Cylinder:
            return "Cylinder";
    }
    return "Unknown";
}

SceneDocument::SceneDocument()
    : id_rng_(std::random_device{}()) {
    layers_.push_back(Layer{"Default", std::nullopt, true, false});
}

void SceneDocument::set_current_layer(int index) {
    if (index < 0 || index >= static_cast<int>(layers_.size())) {
        throw std::out_of_range("layer index " + std::to_string(index) + " does not exist");
    }
    current_layer_ = index;
}

std::string SceneDocument::new_object_id() {
    // random (version 4) GUID in the usual 8-4-4-4-12 form
    uint64_t hi = id_rng_();
    uint64_t lo = id_rng_();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[40] = {0};
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buffer;
}

json SceneDocument::add_object(SceneObject object, const std::string& color) {
    if (!color.empty()) {
        object.color = color_from_name(color);
        if (!object.color) {
            LOG4CPLUS_WARN(host_logger(), "Ignoring unknown color '" << color << "'");
        }
    }

    object.id = new_object_id();
    object.layer_index = current_layer_;
    objects_.push_back(object);

    LOG4CPLUS_DEBUG(host_logger(), "Created " << object_type_name(object.type) << " " << object.id);

    json result = {
        {"id", object.id},
        {"type", object_type_name(object.type)},
        {"layer", layers_[object.layer_index].name},
    };
    if (object.color) {
        result["color"] = color_to_hex(*object.color);
    }
    return result;
}

json SceneDocument::create_sphere(double center_x, double center_y, double center_z, double radius,
                                  const std::string& color) {
    require_positive(radius, "radius");

    SceneObject object;
    object.type = ObjectType::Sphere;
    object.origin = {center_x, center_y, center_z};
    object.size = {radius, radius, radius};
    return add_object(object, color);
}

json SceneDocument::create_box(double corner_x, double corner_y, double corner_z,
                               double width, double depth, double height, const std::string& color) {
    require_positive(width, "width");
    require_positive(depth, "depth");
    require_positive(height, "height");

    SceneObject object;
    object.type = ObjectType::Box;
    object.origin = {corner_x, corner_y, corner_z};
    object.size = {width, depth, height};
    return add_object(object, color);
}

json SceneDocument::create_cylinder(double base_x, double base_y, double base_z,
                                    double height, double radius, const std::string& color) {
    require_positive(height, "height");
    require_positive(radius, "radius");

    SceneObject object;
    object.type = ObjectType::Cylinder;
    object.origin = {base_x, base_y, base_z};
    object.size = {radius, radius, height};
    return add_object(object, color);
}

json SceneDocument::scene_info() const {
    std::map<std::string, int> counts_by_type;
    for (const auto& object : objects_) {
        ++counts_by_type[object_type_name(object.type)];
    }

    json layers = json::array();
    for (const auto& layer : layers_) {
        layers.push_back({
            {"name", layer.name},
            {"visible", layer.visible},
            {"locked", layer.locked},
        });
    }

    return {
        {"objectCount", objects_.size()},
        {"objectsByType", counts_by_type},
        {"layers", layers},
        {"currentLayer", layers_[current_layer_].name},
    };
}

json SceneDocument::clear(bool current_layer_only) {
    size_t before = objects_.size();
    if (current_layer_only) {
        int layer = current_layer_;
        objects_.erase(std::remove_if(objects_.begin(), objects_.end(),
                                      [layer](const SceneObject& object) { return object.layer_index == layer; }),
                       objects_.end());
    } else {
        objects_.clear();
    }

    size_t deleted = before - objects_.size();
    LOG4CPLUS_INFO(host_logger(), "Cleared scene: " << deleted << " objects deleted");
    return {{"deletedCount", deleted}};
}

json SceneDocument::create_layer(const std::string& name, const std::string& color) {
    if (name.empty()) {
        throw std::invalid_argument("Layer name cannot be empty");
    }

    for (const auto& layer : layers_) {
        if (layer.name == name) {
            throw std::runtime_error("Layer with name '" + name + "' already exists");
        }
    }

    Layer layer;
    layer.name = name;
    if (!color.empty()) {
        layer.color = color_from_name(color);
        if (!layer.color) {
            LOG4CPLUS_WARN(host_logger(), "Ignoring unknown layer color '" << color << "'");
        }
    }
    layers_.push_back(layer);

    int index = static_cast<int>(layers_.size()) - 1;
    LOG4CPLUS_INFO(host_logger(), "Created layer '" << name << "' with index " << index);
    return {{"name", name}, {"index", index}};
}

} // namespace modelbridge::scene
