#include "stackup.h"

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "geometry/point.h"
#include "geometry/polygon.h"
#include "geometry/rectangle.h"
#include "layout.h"
#include "physical_properties_database.h"
#include "primitive.h"

namespace layup {
namespace {

using testing::ElementsAre;
using testing::Pair;
using testing::DoubleNear;
using testing::UnorderedElementsAre;

std::vector<std::string> Names(const std::vector<StackupLayer> &layers) {
  std::vector<std::string> names;
  for (const StackupLayer &layer : layers) {
    names.push_back(layer.name());
  }
  return names;
}

class StackupTest : public testing::Test {
 protected:
  StackupTest()
      : layout_(physical_db_),
        stackup_(&physical_db_, &layout_) {}

  Stackup::LayerParameters Signal(double thickness) {
    Stackup::LayerParameters parameters;
    parameters.type = LayerType::kSignal;
    parameters.thickness = thickness;
    return parameters;
  }

  Stackup::LayerParameters Dielectric(double thickness) {
    Stackup::LayerParameters parameters;
    parameters.type = LayerType::kDielectric;
    parameters.thickness = thickness;
    return parameters;
  }

  void BuildThreeLayers() {
    ASSERT_TRUE(stackup_.AddLayer("BOT", Signal(50e-6)).ok());
    ASSERT_TRUE(stackup_.AddLayer("D1", Dielectric(100e-6)).ok());
    ASSERT_TRUE(stackup_.AddLayer("TOP", Signal(50e-6)).ok());
  }

  PhysicalPropertiesDatabase physical_db_;
  Layout layout_;
  Stackup stackup_;
};

TEST_F(StackupTest, SymmetricTwoLayerStackup) {
  Stackup::SymmetricStackupParameters parameters;
  parameters.layer_count = 2;
  parameters.soldermask = false;
  ASSERT_TRUE(stackup_.CreateSymmetricStackup(parameters).ok());

  EXPECT_THAT(Names(stackup_.StackupLayers()),
              ElementsAre("TOP", "D1", "BOT"));
  EXPECT_NEAR(200e-6, stackup_.GetLayoutThickness(), 1e-12);
  EXPECT_EQ("copper", stackup_.FindLayer("TOP")->material());
  EXPECT_EQ("fr4_epoxy", stackup_.FindLayer("D1")->material());
}

TEST_F(StackupTest, SymmetricFourLayerStackupWithSolderMask) {
  Stackup::SymmetricStackupParameters parameters;
  parameters.layer_count = 4;
  ASSERT_TRUE(stackup_.CreateSymmetricStackup(parameters).ok());

  EXPECT_THAT(Names(stackup_.StackupLayers()),
              ElementsAre("SMT", "TOP", "D1", "L2", "D2", "L3", "D3", "BOT",
                          "SMB"));
  EXPECT_THAT(Names(stackup_.SignalLayers()),
              ElementsAre("TOP", "L2", "L3", "BOT"));
  EXPECT_EQ("solder_mask", stackup_.FindLayer("TOP")->fill_material());
  EXPECT_EQ("solder_mask", stackup_.FindLayer("SMB")->material());

  // 2 x 20um mask, 2 x 50um outer, 2 x 17um inner, 3 x 100um dielectric.
  EXPECT_NEAR(474e-6, stackup_.GetLayoutThickness(), 1e-12);
  EXPECT_TRUE(stackup_.CheckElevationOrder().ok());
}

TEST_F(StackupTest, SymmetricStackupNeedsEvenLayerCount) {
  Stackup::SymmetricStackupParameters parameters;
  parameters.layer_count = 3;
  EXPECT_EQ(absl::StatusCode::kInvalidArgument,
            stackup_.CreateSymmetricStackup(parameters).code());
  EXPECT_TRUE(stackup_.Layers().empty());
}

TEST_F(StackupTest, FailedSymmetricStackupInstallsNothing) {
  ASSERT_TRUE(stackup_.AddLayer("L3").ok());
  uint64_t generation = layout_.layer_collection_generation();

  // Fails on L3, after the outer layers and the upper half are built.
  Stackup::SymmetricStackupParameters parameters;
  parameters.layer_count = 4;
  EXPECT_EQ(absl::StatusCode::kAlreadyExists,
            stackup_.CreateSymmetricStackup(parameters).code());
  EXPECT_THAT(Names(stackup_.Layers()), ElementsAre("L3"));
  EXPECT_EQ(generation, layout_.layer_collection_generation());
}

TEST_F(StackupTest, AddLayerDefaults) {
  absl::StatusOr<StackupLayer> layer = stackup_.AddLayer("TOP");
  ASSERT_TRUE(layer.ok());
  EXPECT_EQ(LayerType::kSignal, layer->type());
  EXPECT_EQ("copper", layer->material());
  EXPECT_EQ("fr4_epoxy", layer->fill_material());
  EXPECT_DOUBLE_EQ(35e-6, layer->thickness());
}

TEST_F(StackupTest, AddLayerRejectsDuplicateName) {
  ASSERT_TRUE(stackup_.AddLayer("TOP").ok());
  EXPECT_EQ(absl::StatusCode::kAlreadyExists,
            stackup_.AddLayer("TOP").status().code());
  EXPECT_EQ(1, stackup_.Layers().size());
}

TEST_F(StackupTest, AddLayerMissingBase) {
  ASSERT_TRUE(stackup_.AddLayer("TOP").ok());

  Stackup::LayerParameters parameters = Dielectric(10e-6);
  parameters.method = InsertionMethod::kInsertBelow;
  EXPECT_EQ(absl::StatusCode::kInvalidArgument,
            stackup_.AddLayer("D1", parameters).status().code());

  parameters.base_layer = "NOPE";
  EXPECT_EQ(absl::StatusCode::kNotFound,
            stackup_.AddLayer("D1", parameters).status().code());
  EXPECT_FALSE(stackup_.FindLayer("D1"));
}

TEST_F(StackupTest, AddAtElevationNeedsOverlappingMode) {
  Stackup::LayerParameters parameters = Signal(35e-6);
  parameters.method = InsertionMethod::kAddAtElevation;
  parameters.elevation = 1e-3;
  EXPECT_EQ(absl::StatusCode::kFailedPrecondition,
            stackup_.AddLayer("TOP", parameters).status().code());

  ASSERT_TRUE(stackup_.SetMode(StackupMode::kOverlapping).ok());
  absl::StatusOr<StackupLayer> layer = stackup_.AddLayer("TOP", parameters);
  ASSERT_TRUE(layer.ok());
  EXPECT_DOUBLE_EQ(1e-3, layer->lower_elevation());
}

TEST_F(StackupTest, OverlappingLayersAreOrderedByElevation) {
  ASSERT_TRUE(stackup_.SetMode(StackupMode::kOverlapping).ok());
  Stackup::LayerParameters parameters = Signal(35e-6);
  parameters.method = InsertionMethod::kAddAtElevation;

  parameters.elevation = 0.0;
  ASSERT_TRUE(stackup_.AddLayer("A", parameters).ok());
  parameters.elevation = 200e-6;
  ASSERT_TRUE(stackup_.AddLayer("B", parameters).ok());
  parameters.elevation = 100e-6;
  ASSERT_TRUE(stackup_.AddLayer("C", parameters).ok());

  EXPECT_THAT(Names(stackup_.StackupLayers()), ElementsAre("B", "C", "A"));
  EXPECT_TRUE(stackup_.CheckElevationOrder().ok());
}

TEST_F(StackupTest, UnknownMaterialIsKept) {
  Stackup::LayerParameters parameters = Dielectric(100e-6);
  parameters.material = "Megtron6";
  absl::StatusOr<StackupLayer> layer = stackup_.AddLayer("D1", parameters);
  ASSERT_TRUE(layer.ok());
  EXPECT_EQ("Megtron6", layer->material());
}

TEST_F(StackupTest, MaterialIsMatchedIgnoringCase) {
  Stackup::LayerParameters parameters = Dielectric(100e-6);
  parameters.material = "FR4_Epoxy";
  absl::StatusOr<StackupLayer> layer = stackup_.AddLayer("D1", parameters);
  ASSERT_TRUE(layer.ok());
  EXPECT_EQ("fr4_epoxy", layer->material());
}

TEST_F(StackupTest, NonStackupLayersFollowStackupLayers) {
  BuildThreeLayers();
  Stackup::LayerParameters silk;
  silk.type = LayerType::kSilkscreen;
  ASSERT_TRUE(stackup_.AddLayer("SST", silk).ok());

  EXPECT_THAT(Names(stackup_.Layers()),
              ElementsAre("TOP", "D1", "BOT", "SST"));
  EXPECT_THAT(Names(stackup_.NonStackupLayers()), ElementsAre("SST"));
  EXPECT_THAT(Names(stackup_.StackupLayers()),
              ElementsAre("TOP", "D1", "BOT"));
}

TEST_F(StackupTest, RemoveLayer) {
  BuildThreeLayers();
  EXPECT_TRUE(stackup_.RemoveLayer("D1"));
  EXPECT_FALSE(stackup_.RemoveLayer("D1"));
  EXPECT_THAT(Names(stackup_.Layers()), ElementsAre("TOP", "BOT"));
  EXPECT_DOUBLE_EQ(50e-6, stackup_.FindLayer("TOP")->lower_elevation());
}

TEST_F(StackupTest, Limits) {
  BuildThreeLayers();
  Stackup::LayerParameters mask = Dielectric(20e-6);
  mask.material = "solder_mask";
  ASSERT_TRUE(stackup_.AddLayer("SMT", mask).ok());

  absl::StatusOr<StackupLimits> all = stackup_.GetStackupLimits(false);
  ASSERT_TRUE(all.ok());
  EXPECT_EQ("SMT", all->top_layer);
  EXPECT_DOUBLE_EQ(200e-6, all->top_elevation);
  EXPECT_EQ("BOT", all->bottom_layer);
  EXPECT_DOUBLE_EQ(0.0, all->bottom_elevation);

  absl::StatusOr<StackupLimits> metals = stackup_.GetStackupLimits(true);
  ASSERT_TRUE(metals.ok());
  EXPECT_EQ("TOP", metals->top_layer);
  EXPECT_DOUBLE_EQ(150e-6, metals->top_elevation);

  double top_thickness = stackup_.FindLayer(all->top_layer)->thickness();
  EXPECT_NEAR(stackup_.GetLayoutThickness(),
              all->top_elevation + top_thickness - all->bottom_elevation,
              1e-15);
}

TEST_F(StackupTest, LimitsOfEmptyStackup) {
  EXPECT_EQ(absl::StatusCode::kNotFound,
            stackup_.GetStackupLimits(false).status().code());
  EXPECT_DOUBLE_EQ(0.0, stackup_.GetLayoutThickness());
}

TEST_F(StackupTest, UpdateLayerRecomputesElevations) {
  BuildThreeLayers();
  StackupLayer dielectric = *stackup_.FindLayer("D1");
  dielectric.set_thickness(200e-6);
  ASSERT_TRUE(stackup_.UpdateLayer(dielectric).ok());
  EXPECT_DOUBLE_EQ(250e-6, stackup_.FindLayer("TOP")->lower_elevation());
  EXPECT_NEAR(300e-6, stackup_.GetLayoutThickness(), 1e-12);
}

TEST_F(StackupTest, UpdateMissingLayer) {
  BuildThreeLayers();
  StackupLayer layer("NOPE", LayerType::kSignal);
  EXPECT_EQ(absl::StatusCode::kNotFound, stackup_.UpdateLayer(layer).code());
}

TEST_F(StackupTest, RenameLayerUpdatesLayout) {
  BuildThreeLayers();
  Primitive trace("TOP", "NET1", geometry::Polygon::FromRectangle(
      geometry::Rectangle({0, 0}, {1000, 100})));
  const Primitive *added = layout_.AddPrimitive(trace);

  ASSERT_TRUE(stackup_.RenameLayer("TOP", "L1").ok());
  EXPECT_FALSE(stackup_.FindLayer("TOP"));
  EXPECT_TRUE(stackup_.FindLayer("L1"));
  EXPECT_EQ("L1", layout_.FindPrimitive(added->id())->layer());

  EXPECT_EQ(absl::StatusCode::kAlreadyExists,
            stackup_.RenameLayer("L1", "BOT").code());
  EXPECT_EQ(absl::StatusCode::kNotFound,
            stackup_.RenameLayer("TOP", "X").code());
}

TEST_F(StackupTest, MoveLayerAbove) {
  BuildThreeLayers();
  ASSERT_TRUE(stackup_.MoveLayerAbove("BOT", "TOP").ok());
  EXPECT_THAT(Names(stackup_.StackupLayers()),
              ElementsAre("BOT", "TOP", "D1"));
  EXPECT_TRUE(stackup_.CheckElevationOrder().ok());
}

TEST_F(StackupTest, SetLayoutStackupIsAllOrNothing) {
  BuildThreeLayers();
  uint64_t generation = layout_.layer_collection_generation();
  StackupLayer layer("NEW", LayerType::kSignal);
  EXPECT_EQ(absl::StatusCode::kNotFound,
            stackup_.SetLayoutStackup(
                layer, StackupOperation::kInsertAbove, "NOPE").code());
  EXPECT_EQ(generation, layout_.layer_collection_generation());

  ASSERT_TRUE(stackup_.SetLayoutStackup(
      layer, StackupOperation::kInsertAbove, "D1").ok());
  EXPECT_EQ(generation + 1, layout_.layer_collection_generation());
  EXPECT_THAT(Names(stackup_.StackupLayers()),
              ElementsAre("TOP", "NEW", "D1", "BOT"));
}

TEST_F(StackupTest, SetLayoutStackupChangeName) {
  BuildThreeLayers();
  StackupLayer renamed = *stackup_.FindLayer("D1");
  renamed.set_name("CORE");
  ASSERT_TRUE(stackup_.SetLayoutStackup(
      renamed, StackupOperation::kChangeName, "D1").ok());
  EXPECT_THAT(Names(stackup_.StackupLayers()),
              ElementsAre("TOP", "CORE", "BOT"));
}

TEST_F(StackupTest, ReadersKeepTheirSnapshot) {
  BuildThreeLayers();
  std::shared_ptr<const LayerCollection> before = stackup_.collection();
  ASSERT_TRUE(stackup_.RemoveLayer("TOP"));
  EXPECT_EQ(3, before->stackup_layers().size());
  EXPECT_EQ(2, stackup_.collection()->stackup_layers().size());
}

TEST_F(StackupTest, RefreshLayerCollectionIsIdempotent) {
  BuildThreeLayers();
  Stackup::LayerParameters outline;
  outline.type = LayerType::kOutline;
  ASSERT_TRUE(stackup_.AddLayer("Outline", outline).ok());

  ASSERT_TRUE(stackup_.RefreshLayerCollection().ok());
  std::vector<std::string> once = Names(stackup_.Layers());
  double thickness = stackup_.GetLayoutThickness();
  ASSERT_TRUE(stackup_.RefreshLayerCollection().ok());

  EXPECT_THAT(once, ElementsAre("TOP", "D1", "BOT", "Outline"));
  EXPECT_EQ(once, Names(stackup_.Layers()));
  EXPECT_DOUBLE_EQ(thickness, stackup_.GetLayoutThickness());
}

TEST_F(StackupTest, RefreshOverlappingCollection) {
  ASSERT_TRUE(stackup_.SetMode(StackupMode::kOverlapping).ok());
  Stackup::LayerParameters parameters = Signal(35e-6);
  parameters.method = InsertionMethod::kAddAtElevation;
  parameters.elevation = 0.0;
  ASSERT_TRUE(stackup_.AddLayer("A", parameters).ok());
  parameters.elevation = 1e-3;
  ASSERT_TRUE(stackup_.AddLayer("B", parameters).ok());

  ASSERT_TRUE(stackup_.RefreshLayerCollection().ok());
  EXPECT_EQ(StackupMode::kOverlapping, stackup_.mode());
  EXPECT_THAT(Names(stackup_.StackupLayers()), ElementsAre("B", "A"));
  EXPECT_DOUBLE_EQ(1e-3, stackup_.FindLayer("B")->lower_elevation());
}

TEST_F(StackupTest, ResidualCopperArea) {
  BuildThreeLayers();
  // A full plane on BOT and a quarter of the board on TOP.
  layout_.AddPrimitive(Primitive("BOT", "GND", geometry::Polygon::FromRectangle(
      geometry::Rectangle({0, 0}, {1000, 1000}))));
  layout_.AddPrimitive(Primitive(
      "TOP", "NET1", geometry::Polygon::FromRectangle(
          geometry::Rectangle({0, 0}, {500, 500}))));

  EXPECT_THAT(stackup_.ResidualCopperAreaPerLayer(),
              UnorderedElementsAre(Pair("TOP", DoubleNear(25.0, 1e-9)),
                                   Pair("BOT", DoubleNear(100.0, 1e-9))));
}

TEST(InsertionMethodTest, Parse) {
  EXPECT_EQ(InsertionMethod::kInsertBelow,
            *ParseInsertionMethod("insert_below"));
  EXPECT_EQ(InsertionMethod::kAddOnTop, *ParseInsertionMethod("Add_On_Top"));
  EXPECT_FALSE(ParseInsertionMethod("sideways").ok());
}

}  // namespace
}  // namespace layup
