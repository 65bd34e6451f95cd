#include <gtest/gtest.h>

#include "action/dispatcher.hpp"
#include "scene/scene_document.hpp"
#include "scene/scene_host.hpp"

#include <regex>
#include <string>

using modelbridge::CommandEnvelope;
using modelbridge::CommandResult;
using modelbridge::json;
using modelbridge::scene::SceneDocument;
using modelbridge::scene::SceneHost;

namespace {

CommandResult run(modelbridge::actions::CommandDispatcher& dispatcher, const std::string& type,
                  json params = json::object()) {
    CommandEnvelope envelope;
    envelope.type = type;
    envelope.params = std::move(params);
    return dispatcher.dispatch(envelope);
}

bool looks_like_guid(const std::string& id) {
    static const std::regex pattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    return std::regex_match(id, pattern);
}

} // namespace

TEST(SceneDocument, StartsWithDefaultLayerAndNoObjects) {
    SceneDocument doc;

    json info = doc.scene_info();

    EXPECT_EQ(info["objectCount"], 0);
    EXPECT_TRUE(info["objectsByType"].empty());
    ASSERT_EQ(info["layers"].size(), 1u);
    EXPECT_EQ(info["layers"][0]["name"], "Default");
    EXPECT_EQ(info["currentLayer"], "Default");
}

TEST(SceneDocument, CreatedObjectsGetDistinctGuids) {
    SceneDocument doc;

    json sphere = doc.create_sphere(0, 0, 0, 5, "");
    json box = doc.create_box(1, 2, 3, 4, 5, 6, "blue");
    json cylinder = doc.create_cylinder(0, 0, 0, 10, 2, "");

    EXPECT_TRUE(looks_like_guid(sphere["id"].get<std::string>()));
    EXPECT_TRUE(looks_like_guid(box["id"].get<std::string>()));
    EXPECT_NE(sphere["id"], box["id"]);
    EXPECT_NE(box["id"], cylinder["id"]);
    EXPECT_EQ(box["color"], "#0000ff");

    json info = doc.scene_info();
    EXPECT_EQ(info["objectCount"], 3);
    EXPECT_EQ(info["objectsByType"]["Sphere"], 1);
    EXPECT_EQ(info["objectsByType"]["Box"], 1);
    EXPECT_EQ(info["objectsByType"]["Cylinder"], 1);
}

TEST(SceneDocument, UnknownColorIsIgnored) {
    SceneDocument doc;

    json sphere = doc.create_sphere(0, 0, 0, 1, "not-a-color");

    EXPECT_FALSE(sphere.contains("color"));
    ASSERT_EQ(doc.objects().size(), 1u);
    EXPECT_FALSE(doc.objects().front().color.has_value());
}

TEST(SceneDocument, NonPositiveSizesAreRejected) {
    SceneDocument doc;

    EXPECT_THROW(doc.create_sphere(0, 0, 0, 0, ""), std::invalid_argument);
    EXPECT_THROW(doc.create_box(0, 0, 0, 1, -1, 1, ""), std::invalid_argument);
    EXPECT_THROW(doc.create_cylinder(0, 0, 0, 1, 0, ""), std::invalid_argument);
    EXPECT_TRUE(doc.objects().empty());
}

TEST(SceneDocument, CreateLayerRejectsDuplicates) {
    SceneDocument doc;

    json layer = doc.create_layer("Walls", "red");
    EXPECT_EQ(layer["name"], "Walls");
    EXPECT_EQ(layer["index"], 1);

    try {
        doc.create_layer("Walls", "");
        FAIL() << "duplicate layer accepted";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Layer with name 'Walls' already exists");
    }
    EXPECT_EQ(doc.layers().size(), 2u);
}

TEST(SceneDocument, ClearCurrentLayerOnlyKeepsOtherLayers) {
    SceneDocument doc;
    doc.create_sphere(0, 0, 0, 1, "");
    doc.create_layer("Second", "");
    doc.set_current_layer(1);
    doc.create_box(0, 0, 0, 1, 1, 1, "");
    doc.create_box(5, 5, 5, 1, 1, 1, "");

    json cleared = doc.clear(true);

    EXPECT_EQ(cleared["deletedCount"], 2);
    ASSERT_EQ(doc.objects().size(), 1u);
    EXPECT_EQ(doc.objects().front().layer_index, 0);

    cleared = doc.clear(false);
    EXPECT_EQ(cleared["deletedCount"], 1);
    EXPECT_TRUE(doc.objects().empty());
}

TEST(SceneHost, DispatchRoundTripThroughDocumentContext) {
    SceneHost host;
    modelbridge::actions::CommandDispatcher dispatcher(host);

    CommandResult created = run(dispatcher, "create_sphere",
                                {{"centerX", 0}, {"centerY", 0}, {"centerZ", 0}, {"radius", 5}, {"color", "red"}});
    ASSERT_TRUE(created.success) << created.error.value_or("");
    EXPECT_TRUE(looks_like_guid(created.result["id"].get<std::string>()));

    CommandResult info = run(dispatcher, "get_scene_info");
    ASSERT_TRUE(info.success);
    EXPECT_EQ(info.result["objectCount"], 1);

    CommandResult cleared = run(dispatcher, "clear_scene", {{"currentLayerOnly", false}});
    ASSERT_TRUE(cleared.success);
    EXPECT_EQ(cleared.result["deletedCount"], 1);
}

TEST(SceneHost, HostErrorsComeBackAsFailures) {
    SceneHost host;
    modelbridge::actions::CommandDispatcher dispatcher(host);

    ASSERT_TRUE(run(dispatcher, "create_layer", {{"name", "Walls"}}).success);
    CommandResult duplicate = run(dispatcher, "create_layer", {{"name", "Walls"}});
    EXPECT_FALSE(duplicate.success);
    EXPECT_EQ(duplicate.error.value_or(""), "Layer with name 'Walls' already exists");

    CommandResult bad_radius = run(dispatcher, "create_sphere",
                                   {{"centerX", 0}, {"centerY", 0}, {"centerZ", 0}, {"radius", -1}});
    EXPECT_FALSE(bad_radius.success);
    EXPECT_EQ(bad_radius.error.value_or(""), "radius must be greater than zero");
}

TEST(SceneHost, ClosedDocumentFailsPrecondition) {
    SceneHost host;
    modelbridge::actions::CommandDispatcher dispatcher(host);
    host.close_document();

    CommandResult result = run(dispatcher, "get_scene_info");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), modelbridge::actions::kNoActiveDocument);

    host.open_document();
    result = run(dispatcher, "get_scene_info");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.result["objectCount"], 0);
}

TEST(SceneHost, StartsWithoutDocumentWhenAsked) {
    SceneHost host(false);

    EXPECT_FALSE(host.has_active_document());
    EXPECT_FALSE(host.execute("get_scene_info", json::object()).success);
}
