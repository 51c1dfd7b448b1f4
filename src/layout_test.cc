#include "layout.h"

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "cell_instance.h"
#include "component.h"
#include "layer_collection.h"
#include "padstack_instance.h"
#include "physical_properties_database.h"
#include "primitive.h"
#include "geometry/point.h"
#include "geometry/polygon.h"
#include "geometry/rectangle.h"

namespace layup {
namespace {

using geometry::Point;
using geometry::Polygon;
using geometry::Rectangle;
using testing::ElementsAre;

Primitive Trace(const std::string &layer, const std::string &net,
                const Rectangle &box) {
  return Primitive(layer, net, Polygon::FromRectangle(box));
}

PadstackInstance Pin(const std::string &component, const std::string &net,
                     const Point &position) {
  PadstackInstance pin;
  pin.set_name(component + "-1");
  pin.set_component(component);
  pin.set_is_pin(true);
  pin.set_net(net);
  pin.set_position(position);
  pin.set_pad_size(100, 100);
  pin.set_start_layer("TOP");
  pin.set_stop_layer("BOT");
  return pin;
}

class LayoutTest : public testing::Test {
 protected:
  LayoutTest() : layout_(physical_db_) {}

  PhysicalPropertiesDatabase physical_db_;
  Layout layout_;
};

TEST_F(LayoutTest, PrimitivesAndPadstacksShareAnIdSpace) {
  Primitive *first = layout_.AddPrimitive(
      Trace("TOP", "A", Rectangle({0, 0}, {10, 10})));
  PadstackInstance *second = layout_.AddPadstackInstance(
      Pin("U1", "A", {5, 5}));
  EXPECT_NE(first->id(), second->id());

  // A free requested id is kept; a taken one is replaced.
  Primitive requested = Trace("TOP", "A", Rectangle({0, 0}, {1, 1}));
  requested.set_id(100);
  EXPECT_EQ(100, layout_.AddPrimitive(requested)->id());
  requested.set_id(second->id());
  int64_t reassigned = layout_.AddPrimitive(requested)->id();
  EXPECT_NE(second->id(), reassigned);
  EXPECT_GT(reassigned, 100);
}

TEST_F(LayoutTest, AddingObjectsAddsTheirNets) {
  layout_.AddPrimitive(Trace("TOP", "A", Rectangle({0, 0}, {10, 10})));
  layout_.AddPadstackInstance(Pin("U1", "B", {0, 0}));
  EXPECT_THAT(layout_.nets(), ElementsAre("A", "B"));

  EXPECT_FALSE(layout_.AddNet(""));
  EXPECT_FALSE(layout_.AddNet("A"));
  EXPECT_TRUE(layout_.DeleteNet("A"));
  EXPECT_FALSE(layout_.HasNet("A"));
  // Deleting a net leaves its objects alone.
  EXPECT_EQ(1u, layout_.primitives().size());
}

TEST_F(LayoutTest, ComponentsAndTheirPins) {
  ASSERT_NE(nullptr, layout_.AddComponent(
      Component("U1", ComponentType::kIC)));
  EXPECT_EQ(nullptr, layout_.AddComponent(
      Component("U1", ComponentType::kResistor)));

  layout_.AddPadstackInstance(Pin("U1", "A", {0, 0}));
  layout_.AddPadstackInstance(Pin("U1", "B", {200, 0}));
  PadstackInstance via = Pin("U1", "A", {400, 0});
  via.set_is_pin(false);
  layout_.AddPadstackInstance(via);

  EXPECT_EQ(2u, layout_.PinsOf("U1").size());
  EXPECT_TRUE(layout_.PinsOf("R1").empty());
  EXPECT_TRUE(layout_.DeleteComponent("U1"));
  EXPECT_EQ(nullptr, layout_.FindComponent("U1"));
}

TEST_F(LayoutTest, BoundingBoxCoversPrimitivesAndPads) {
  EXPECT_EQ(Rectangle({0, 0}, {0, 0}), layout_.GetBoundingBox());

  layout_.AddPrimitive(Trace("TOP", "A", Rectangle({0, 0}, {1000, 200})));
  layout_.AddPadstackInstance(Pin("U1", "A", {2000, -500}));
  EXPECT_EQ(Rectangle({0, -550}, {2050, 200}), layout_.GetBoundingBox());
}

TEST_F(LayoutTest, RenameLayerReferences) {
  layout_.AddPrimitive(Trace("TOP", "A", Rectangle({0, 0}, {10, 10})));
  layout_.AddPrimitive(Trace("BOT", "A", Rectangle({0, 0}, {10, 10})));
  layout_.AddPadstackInstance(Pin("U1", "A", {0, 0}));
  Component component("U1", ComponentType::kIC);
  component.set_placement_layer("TOP");
  layout_.AddComponent(component);
  CellInstance instance("child", nullptr);
  instance.set_placement_layer("TOP");
  layout_.AddCellInstance(instance);

  EXPECT_EQ(4u, layout_.RenameLayerReferences("TOP", "L1"));
  EXPECT_EQ(1u, layout_.PrimitivesOnLayer("L1").size());
  EXPECT_EQ(1u, layout_.PrimitivesOnLayer("BOT").size());
  EXPECT_EQ("L1", layout_.FindComponent("U1")->placement_layer());
  EXPECT_EQ("L1", layout_.cell_instances().front()->placement_layer());
  EXPECT_EQ(0u, layout_.RenameLayerReferences("TOP", "L1"));
}

TEST_F(LayoutTest, LayerCollectionSnapshots) {
  uint64_t generation = layout_.layer_collection_generation();
  std::shared_ptr<const LayerCollection> before =
      layout_.GetLayerCollection();

  LayerCollection collection;
  StackupLayer layer("TOP", LayerType::kSignal);
  layer.set_thickness(35e-6);
  ASSERT_TRUE(collection.AddLayerTop(layer).ok());
  layout_.SetLayerCollection(
      std::make_shared<const LayerCollection>(collection));

  EXPECT_EQ(generation + 1, layout_.layer_collection_generation());
  // Readers holding the old snapshot still see it.
  EXPECT_TRUE(before->empty());
  EXPECT_TRUE(layout_.GetLayerCollection()->HasLayer("TOP"));
}

TEST_F(LayoutTest, CloneIsDeep) {
  Primitive *trace = layout_.AddPrimitive(
      Trace("TOP", "A", Rectangle({0, 0}, {10, 10})));
  layout_.AddComponent(Component("U1", ComponentType::kIC));

  std::unique_ptr<Layout> copy = layout_.Clone();
  EXPECT_TRUE(copy->DeletePrimitive(trace->id()));
  EXPECT_TRUE(copy->DeleteComponent("U1"));
  EXPECT_TRUE(copy->DeleteNet("A"));

  EXPECT_NE(nullptr, layout_.FindPrimitive(trace->id()));
  EXPECT_NE(nullptr, layout_.FindComponent("U1"));
  EXPECT_TRUE(layout_.HasNet("A"));
  EXPECT_EQ(layout_.GetLayerCollection(), copy->GetLayerCollection());

  // New ids in the copy don't collide with the original's.
  Primitive *added = copy->AddPrimitive(
      Trace("TOP", "A", Rectangle({0, 0}, {1, 1})));
  EXPECT_NE(trace->id(), added->id());
}

}  // namespace
}  // namespace layup
