#pragma once

#include "../protocol.hpp"

#include <array>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace modelbridge::scene {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

/// Resolves a named color ("red", "SteelBlue", ...). Matching ignores case.
std::optional<Color> color_from_name(const std::string& name);

enum class ObjectType {
    Sphere,
    Box,
    Cylinder,
};

const char* object_type_name(ObjectType type);

struct SceneObject {
    std::string id;
    ObjectType type = ObjectType::Sphere;
    int layer_index = 0;
    std::optional<Color> color;
    std::array<double, 3> origin{};
    std::array<double, 3> size{};   // sphere: radius; box: width/depth/height; cylinder: radius/height
};

struct Layer {
    std::string name;
    std::optional<Color> color;
    bool visible = true;
    bool locked = false;
};

/**
 * In-memory model document. Not thread-safe: callers run every operation on
 * the document context.
 */
class SceneDocument {
public:
    SceneDocument();

    json create_sphere(double center_x, double center_y, double center_z, double radius, const std::string& color);
    json create_box(double corner_x, double corner_y, double corner_z,
                    double width, double depth, double height, const std::string& color);
    json create_cylinder(double base_x, double base_y, double base_z,
                         double height, double radius, const std::string& color);

    json scene_info() const;
    json clear(bool current_layer_only);
    json create_layer(const std::string& name, const std::string& color);

    const std::vector<SceneObject>& objects() const { return objects_; }
    const std::vector<Layer>& layers() const { return layers_; }
    int current_layer() const { return current_layer_; }
    void set_current_layer(int index);

private:
    std::string new_object_id();
    json add_object(SceneObject object, const std::string& color);

    std::vector<SceneObject> objects_;
    std::vector<Layer> layers_;
    int current_layer_ = 0;
    std::mt19937_64 id_rng_;
};

} // namespace modelbridge::scene
