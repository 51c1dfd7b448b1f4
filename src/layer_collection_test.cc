#include "layer_collection.h"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "stackup_layer.h"

namespace layup {
namespace {

using testing::ElementsAre;

StackupLayer MakeLayer(const std::string &name,
                       LayerType type,
                       double thickness,
                       double lower_elevation = 0.0) {
  StackupLayer layer(name, type);
  layer.set_thickness(thickness);
  layer.set_lower_elevation(lower_elevation);
  return layer;
}

std::vector<std::string> Names(const std::vector<StackupLayer> &layers) {
  std::vector<std::string> names;
  for (const StackupLayer &layer : layers) {
    names.push_back(layer.name());
  }
  return names;
}

TEST(LayerCollectionTest, LaminateStacksFromBottom) {
  LayerCollection collection;
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("BOT", LayerType::kSignal, 35e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("D1", LayerType::kDielectric, 100e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("TOP", LayerType::kSignal, 35e-6)).ok());

  EXPECT_THAT(Names(collection.stackup_layers()),
              ElementsAre("TOP", "D1", "BOT"));
  EXPECT_DOUBLE_EQ(0.0, collection.FindLayer("BOT")->lower_elevation());
  EXPECT_DOUBLE_EQ(35e-6, collection.FindLayer("D1")->lower_elevation());
  EXPECT_DOUBLE_EQ(135e-6, collection.FindLayer("TOP")->lower_elevation());
  EXPECT_TRUE(collection.CheckElevationOrder().ok());
}

TEST(LayerCollectionTest, InsertAboveAndBelow) {
  LayerCollection collection;
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("BOT", LayerType::kSignal, 35e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("TOP", LayerType::kSignal, 35e-6)).ok());
  ASSERT_TRUE(collection.AddLayerBelow(
      MakeLayer("D2", LayerType::kDielectric, 100e-6), "TOP").ok());
  ASSERT_TRUE(collection.AddLayerAbove(
      MakeLayer("D1", LayerType::kDielectric, 50e-6), "BOT").ok());

  EXPECT_THAT(Names(collection.stackup_layers()),
              ElementsAre("TOP", "D2", "D1", "BOT"));
  EXPECT_TRUE(collection.CheckElevationOrder().ok());
  EXPECT_DOUBLE_EQ(185e-6, collection.FindLayer("TOP")->lower_elevation());
}

TEST(LayerCollectionTest, RejectsDuplicatesAndMissingBase) {
  LayerCollection collection;
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("TOP", LayerType::kSignal, 35e-6)).ok());
  EXPECT_EQ(absl::StatusCode::kAlreadyExists,
            collection.AddLayerBottom(
                MakeLayer("TOP", LayerType::kSignal, 35e-6)).code());
  EXPECT_EQ(absl::StatusCode::kNotFound,
            collection.AddLayerAbove(
                MakeLayer("NEW", LayerType::kSignal, 35e-6), "NOPE").code());
  EXPECT_EQ(1, collection.size());
}

TEST(LayerCollectionTest, NonStackupLayersFollowStackupLayers) {
  LayerCollection collection;
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("SILK", LayerType::kSilkscreen, 0.0)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("TOP", LayerType::kSignal, 35e-6)).ok());
  EXPECT_THAT(Names(collection.Layers()), ElementsAre("TOP", "SILK"));
  EXPECT_EQ(1, collection.stackup_layers().size());
  EXPECT_EQ(1, collection.non_stackup_layers().size());
}

TEST(LayerCollectionTest, OverlappingSortsByElevation) {
  LayerCollection collection(StackupMode::kOverlapping);
  ASSERT_TRUE(collection.AddStackupLayerAtElevation(
      MakeLayer("A", LayerType::kSignal, 10e-6, 0.0)).ok());
  ASSERT_TRUE(collection.AddStackupLayerAtElevation(
      MakeLayer("C", LayerType::kSignal, 10e-6, 50e-6)).ok());
  ASSERT_TRUE(collection.AddStackupLayerAtElevation(
      MakeLayer("B", LayerType::kDielectric, 100e-6, 5e-6)).ok());

  EXPECT_THAT(Names(collection.stackup_layers()), ElementsAre("C", "B", "A"));
  // Overlapping layers keep their own elevations.
  EXPECT_DOUBLE_EQ(5e-6, collection.FindLayer("B")->lower_elevation());
  EXPECT_TRUE(collection.CheckElevationOrder().ok());
}

TEST(LayerCollectionTest, SwitchingToLaminateRestacks) {
  LayerCollection collection(StackupMode::kOverlapping);
  ASSERT_TRUE(collection.AddStackupLayerAtElevation(
      MakeLayer("A", LayerType::kSignal, 10e-6, 1e-3)).ok());
  ASSERT_TRUE(collection.AddStackupLayerAtElevation(
      MakeLayer("B", LayerType::kSignal, 10e-6, 2e-3)).ok());
  collection.SetMode(StackupMode::kLaminate);
  EXPECT_DOUBLE_EQ(0.0, collection.FindLayer("A")->lower_elevation());
  EXPECT_DOUBLE_EQ(10e-6, collection.FindLayer("B")->lower_elevation());
}

TEST(LayerCollectionTest, ViaLayerSpansItsReferences) {
  LayerCollection collection;
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("BOT", LayerType::kSignal, 35e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("D1", LayerType::kDielectric, 100e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("TOP", LayerType::kSignal, 35e-6)).ok());

  StackupLayer via("VIA", LayerType::kUndefined);
  via.set_via_references(ViaReferences {.upper = "TOP", .lower = "BOT"});
  ASSERT_TRUE(via.IsStackupLayer());
  ASSERT_TRUE(collection.AddLayerTop(via).ok());

  const StackupLayer *placed = collection.FindLayer("VIA");
  ASSERT_NE(nullptr, placed);
  EXPECT_DOUBLE_EQ(35e-6, placed->lower_elevation());
  EXPECT_DOUBLE_EQ(100e-6, placed->thickness());
  EXPECT_THAT(Names(collection.stackup_layers()),
              ElementsAre("TOP", "D1", "VIA", "BOT"));
  EXPECT_TRUE(collection.CheckElevationOrder().ok());
}

TEST(LayerCollectionTest, ReplaceAndMove) {
  LayerCollection collection;
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("BOT", LayerType::kSignal, 35e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("D1", LayerType::kDielectric, 100e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("TOP", LayerType::kSignal, 35e-6)).ok());

  StackupLayer thicker = *collection.FindLayer("D1");
  thicker.set_thickness(200e-6);
  ASSERT_TRUE(collection.ReplaceLayer("D1", thicker).ok());
  EXPECT_DOUBLE_EQ(235e-6, collection.FindLayer("TOP")->lower_elevation());

  StackupLayer renamed = *collection.FindLayer("D1");
  renamed.set_name("TOP");
  EXPECT_EQ(absl::StatusCode::kAlreadyExists,
            collection.ReplaceLayer("D1", renamed).code());

  ASSERT_TRUE(collection.MoveLayerAbove("BOT", "TOP").ok());
  EXPECT_THAT(Names(collection.stackup_layers()),
              ElementsAre("BOT", "TOP", "D1"));
  EXPECT_DOUBLE_EQ(0.0, collection.FindLayer("D1")->lower_elevation());
}

TEST(LayerCollectionTest, RemoveLayer) {
  LayerCollection collection;
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("BOT", LayerType::kSignal, 35e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("TOP", LayerType::kSignal, 35e-6)).ok());
  EXPECT_TRUE(collection.RemoveLayer("BOT"));
  EXPECT_FALSE(collection.RemoveLayer("BOT"));
  EXPECT_DOUBLE_EQ(0.0, collection.FindLayer("TOP")->lower_elevation());
}

TEST(LayerCollectionTest, TopBottomStackupLayersByType) {
  LayerCollection collection;
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("D0", LayerType::kDielectric, 10e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("BOT", LayerType::kSignal, 35e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("TOP", LayerType::kSignal, 35e-6)).ok());
  ASSERT_TRUE(collection.AddLayerTop(
      MakeLayer("D2", LayerType::kDielectric, 10e-6)).ok());

  auto all = collection.TopBottomStackupLayers();
  ASSERT_TRUE(all);
  EXPECT_EQ("D2", all->first->name());
  EXPECT_EQ("D0", all->second->name());

  auto signals = collection.TopBottomStackupLayers(LayerType::kSignal);
  ASSERT_TRUE(signals);
  EXPECT_EQ("TOP", signals->first->name());
  EXPECT_EQ("BOT", signals->second->name());

  EXPECT_FALSE(collection.TopBottomStackupLayers(LayerType::kConducting));
}

}  // namespace
}  // namespace layup
