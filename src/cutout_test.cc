#include "cutout.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "cell.h"
#include "component.h"
#include "design_database.h"
#include "layout.h"
#include "padstack_instance.h"
#include "primitive.h"
#include "geometry/point.h"
#include "geometry/polygon.h"
#include "geometry/rectangle.h"
#include "geometry/region.h"

namespace layup {
namespace {

using geometry::Point;
using geometry::Polygon;
using geometry::Rectangle;
using geometry::Region;
using testing::ElementsAre;

// Millimetres to database units.
constexpr int64_t kMm = 1000000;

Polygon Box(int64_t x0, int64_t y0, int64_t x1, int64_t y1) {
  return Polygon::FromRectangle(Rectangle(Point(x0, y0), Point(x1, y1)));
}

double NetArea(const Layout &layout, const std::string &net) {
  double area = 0.0;
  for (const auto &entry : layout.primitives()) {
    if (entry.second->net() == net) {
      area += entry.second->outline().Area();
    }
  }
  return area;
}

std::vector<const Primitive*> PrimitivesOn(const Layout &layout,
                                           const std::string &net) {
  std::vector<const Primitive*> found;
  for (const auto &entry : layout.primitives()) {
    if (entry.second->net() == net) {
      found.push_back(entry.second.get());
    }
  }
  return found;
}

// A 10mm x 0.2mm NET1 trace on TOP over a GND plane on BOT, an unrelated NET2
// trace, some GND vias and a few components.
class CutoutTest : public testing::Test {
 protected:
  void SetUp() override {
    board_ = design_db_.AddCell("board");
    ASSERT_NE(nullptr, board_);
    Layout *layout = board_->layout();

    layout->AddPrimitive(
        Primitive("TOP", "NET1", Box(0, 0, 10 * kMm, kMm / 5)));
    layout->AddPrimitive(
        Primitive("TOP", "NET2", Box(0, 5 * kMm, 10 * kMm, 6 * kMm)));

    Primitive plane(
        "BOT", "GND", Box(-20 * kMm, -20 * kMm, 30 * kMm, 20 * kMm));
    // Inside the trace's footprint.
    plane.AddVoid(Box(2 * kMm, kMm / 20, 3 * kMm, 3 * kMm / 20));
    // Across the footprint's upper edge.
    plane.AddVoid(Box(6 * kMm, kMm / 10, 7 * kMm, kMm / 2));
    // Far away.
    plane.AddVoid(Box(20 * kMm, 5 * kMm, 21 * kMm, 6 * kMm));
    layout->AddPrimitive(plane);

    AddPad("U1-1", "NET1", Point(kMm / 10, kMm / 10), kMm / 10, "U1");
    AddPad("R2-1", "NET2", Point(kMm, 5 * kMm + kMm / 2), kMm / 10, "R2");
    AddPad("C3-1", "GND", Point(5 * kMm, kMm / 10), kMm / 10, "C3");
    AddPad("C3-2", "GND", Point(15 * kMm, kMm / 10), kMm / 10, "C3");
    // Centre just off the end of the trace; pad reaches back over it.
    AddPad("", "GND", Point(10 * kMm + kMm / 20, kMm / 10), kMm / 5, "");

    layout->AddComponent(Component("U1", ComponentType::kIC));
    layout->AddComponent(Component("R2", ComponentType::kResistor));
    layout->AddComponent(Component("C3", ComponentType::kCapacitor));

    options_.signal_nets = {"NET1"};
    options_.reference_nets = {"GND"};
    options_.extent_type = ExtentType::kConvexHull;
    options_.expansion_size = 0.0;
    options_.number_of_threads = 4;
  }

  void AddPad(const std::string &name, const std::string &net,
              const Point &position, uint64_t size,
              const std::string &component) {
    PadstackInstance pad;
    pad.set_name(name);
    pad.set_net(net);
    pad.set_position(position);
    pad.set_pad_size(size, size);
    pad.set_start_layer("TOP");
    pad.set_stop_layer("BOT");
    pad.set_component(component);
    pad.set_is_pin(!component.empty());
    board_->layout()->AddPadstackInstance(pad);
  }

  std::set<std::string> PadNames(const Layout &layout) {
    std::set<std::string> names;
    for (const auto &entry : layout.padstack_instances()) {
      names.insert(entry.second->name());
    }
    return names;
  }

  DesignDatabase design_db_;
  Cell *board_;
  CutoutOptions options_;
};

TEST(ExtentTypeTest, Parse) {
  EXPECT_EQ(ExtentType::kConforming, *ParseExtentType("Conforming"));
  EXPECT_EQ(ExtentType::kConvexHull, *ParseExtentType("convexhull"));
  EXPECT_EQ(ExtentType::kBoundingBox, *ParseExtentType("Bounding"));
  EXPECT_EQ(ExtentType::kBoundingBox, *ParseExtentType("BoundingBox"));
  EXPECT_FALSE(ParseExtentType("Blob").ok());
  EXPECT_STREQ("ConvexHull", ExtentTypeName(ExtentType::kConvexHull));
}

TEST_F(CutoutTest, KeepsOnlySignalAndReferenceNets) {
  CutoutEngine engine(&design_db_);
  absl::StatusOr<Cell*> cut = engine.Cutout(board_, options_);
  ASSERT_TRUE(cut.ok()) << cut.status();
  EXPECT_EQ(board_, *cut);

  const Layout &layout = *board_->layout();
  EXPECT_THAT(layout.nets(), ElementsAre("GND", "NET1"));
  EXPECT_TRUE(PrimitivesOn(layout, "NET2").empty());
  // The plane is cut down to the trace's footprint, less the notch.
  EXPECT_NEAR(1.9e12, NetArea(layout, "GND"), 1e6);
  EXPECT_NEAR(2e12, NetArea(layout, "NET1"), 1e6);
}

TEST_F(CutoutTest, SurvivorsLieInsideTheExtent) {
  CutoutEngine engine(&design_db_);
  absl::StatusOr<Region> extent =
      engine.ComputeExtent(*board_->layout(), options_);
  ASSERT_TRUE(extent.ok());
  ASSERT_FALSE(extent->Empty());

  ASSERT_TRUE(engine.Cutout(board_, options_).ok());
  const Layout &layout = *board_->layout();
  for (const Primitive *primitive : PrimitivesOn(layout, "GND")) {
    EXPECT_TRUE(extent->Intersects(Region::FromPolygon(primitive->outline())))
        << *primitive;
  }
  for (const auto &entry : layout.padstack_instances()) {
    if (entry.second->net() != "GND")
      continue;
    EXPECT_TRUE(extent->Contains(entry.second->position())) << *entry.second;
  }
  EXPECT_THAT(PadNames(layout), ElementsAre("C3-1", "U1-1"));
}

TEST_F(CutoutTest, ClippedPrimitivesKeepVoidsInside) {
  CutoutEngine engine(&design_db_);
  ASSERT_TRUE(engine.Cutout(board_, options_).ok());

  std::vector<const Primitive*> ground =
      PrimitivesOn(*board_->layout(), "GND");
  ASSERT_EQ(1, ground.size());
  EXPECT_EQ("BOT", ground.front()->layer());
  ASSERT_EQ(1, ground.front()->voids().size());
  EXPECT_EQ(Rectangle(Point(2 * kMm, kMm / 20), Point(3 * kMm, 3 * kMm / 20)),
            ground.front()->voids().front().GetBoundingBox());
}

TEST_F(CutoutTest, DropsVoidsWhenAsked) {
  options_.keep_voids = false;
  CutoutEngine engine(&design_db_);
  ASSERT_TRUE(engine.Cutout(board_, options_).ok());

  std::vector<const Primitive*> ground =
      PrimitivesOn(*board_->layout(), "GND");
  ASSERT_EQ(1, ground.size());
  EXPECT_TRUE(ground.front()->voids().empty());
  EXPECT_NEAR(2e12, ground.front()->outline().Area(), 1e6);
}

TEST_F(CutoutTest, PartialInstances) {
  options_.include_partial_instances = true;
  CutoutEngine engine(&design_db_);
  ASSERT_TRUE(engine.Cutout(board_, options_).ok());
  EXPECT_THAT(PadNames(*board_->layout()), ElementsAre("", "C3-1", "U1-1"));
}

TEST_F(CutoutTest, RemovesComponentsWithoutPins) {
  CutoutEngine engine(&design_db_);
  ASSERT_TRUE(engine.Cutout(board_, options_).ok());
  const Layout &layout = *board_->layout();
  EXPECT_EQ(nullptr, layout.FindComponent("R2"));
  EXPECT_NE(nullptr, layout.FindComponent("U1"));
  // One pin left, but not asked to remove those.
  EXPECT_NE(nullptr, layout.FindComponent("C3"));
}

TEST_F(CutoutTest, RemovesSinglePinComponents) {
  options_.remove_single_pin_components = true;
  CutoutEngine engine(&design_db_);
  ASSERT_TRUE(engine.Cutout(board_, options_).ok());
  const Layout &layout = *board_->layout();
  EXPECT_EQ(nullptr, layout.FindComponent("C3"));
  // Single-pin ICs stay.
  EXPECT_NE(nullptr, layout.FindComponent("U1"));
}

TEST_F(CutoutTest, EmptyExtentFailsAfterNetCleanUp) {
  options_.signal_nets = {"NOPE"};
  CutoutEngine engine(&design_db_);
  absl::StatusOr<Cell*> cut = engine.Cutout(board_, options_);
  EXPECT_EQ(absl::StatusCode::kFailedPrecondition, cut.status().code());

  const Layout &layout = *board_->layout();
  EXPECT_THAT(layout.nets(), ElementsAre("GND"));
  EXPECT_TRUE(PrimitivesOn(layout, "NET1").empty());
  // The plane has not been clipped.
  EXPECT_EQ(1, PrimitivesOn(layout, "GND").size());
  EXPECT_EQ(3, PrimitivesOn(layout, "GND").front()->voids().size());
}

TEST_F(CutoutTest, FailedCutoutDropsItsOutputCell) {
  options_.signal_nets = {"NOPE"};
  options_.output_path = testing::TempDir() + "/never_written.pb";
  size_t cells = design_db_.cells().size();
  size_t source_primitives = board_->layout()->primitives().size();

  CutoutEngine engine(&design_db_);
  EXPECT_EQ(absl::StatusCode::kFailedPrecondition,
            engine.Cutout(board_, options_).status().code());
  EXPECT_EQ(cells, design_db_.cells().size());
  EXPECT_EQ(nullptr, design_db_.FindCell("board_cutout"));
  EXPECT_EQ(source_primitives, board_->layout()->primitives().size());

  // The name is free for the next attempt.
  options_.signal_nets = {"NET1"};
  absl::StatusOr<Cell*> cut = engine.Cutout(board_, options_);
  ASSERT_TRUE(cut.ok()) << cut.status();
  EXPECT_EQ("board_cutout", (*cut)->name());
}

TEST_F(CutoutTest, RejectsNegativeExpansion) {
  options_.expansion_size = -0.001;
  size_t primitives = board_->layout()->primitives().size();
  CutoutEngine engine(&design_db_);
  EXPECT_EQ(absl::StatusCode::kInvalidArgument,
            engine.Cutout(board_, options_).status().code());
  EXPECT_EQ(absl::StatusCode::kInvalidArgument,
            engine.ComputeExtent(*board_->layout(), options_).status()
                .code());
  EXPECT_EQ(primitives, board_->layout()->primitives().size());
  EXPECT_THAT(board_->layout()->nets(), ElementsAre("GND", "NET1", "NET2"));
}

TEST_F(CutoutTest, NeedsSomethingToCutAround) {
  options_.signal_nets.clear();
  CutoutEngine engine(&design_db_);
  EXPECT_EQ(absl::StatusCode::kInvalidArgument,
            engine.Cutout(board_, options_).status().code());
}

TEST_F(CutoutTest, BoundingBoxExtent) {
  options_.extent_type = ExtentType::kBoundingBox;
  options_.expansion_size = 0.001;
  CutoutEngine engine(&design_db_);
  absl::StatusOr<Region> extent =
      engine.ComputeExtent(*board_->layout(), options_);
  ASSERT_TRUE(extent.ok());
  EXPECT_EQ(Rectangle(Point(-kMm, -kMm), Point(11 * kMm, kMm + kMm / 5)),
            extent->GetBoundingBox());
}

TEST_F(CutoutTest, ConformingExtentCoversTheSignals) {
  options_.extent_type = ExtentType::kConforming;
  options_.expansion_size = 0.0005;
  CutoutEngine engine(&design_db_);
  absl::StatusOr<Region> extent =
      engine.ComputeExtent(*board_->layout(), options_);
  ASSERT_TRUE(extent.ok());
  EXPECT_EQ(geometry::IntersectionType::kContains,
            extent->Classify(
                Region::FromPolygon(Box(0, 0, 10 * kMm, kMm / 5))));
  EXPECT_FALSE(extent->Contains(Point(0, 5 * kMm)));
}

TEST_F(CutoutTest, CustomExtentClipsSignalsToo) {
  options_.custom_extent = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
  options_.custom_extent_units = "mm";
  CutoutEngine engine(&design_db_);
  ASSERT_TRUE(engine.Cutout(board_, options_).ok());

  const Layout &layout = *board_->layout();
  EXPECT_NEAR(1e6 * 2e5, NetArea(layout, "NET1"), 1e6);
  EXPECT_NEAR(1e6 * 1e6, NetArea(layout, "GND"), 1e6);
  EXPECT_THAT(PadNames(layout), ElementsAre("U1-1"));
}

TEST_F(CutoutTest, SeparateOutputsMatch) {
  size_t source_primitives = board_->layout()->primitives().size();
  CutoutEngine engine(&design_db_);

  options_.output_path = testing::TempDir() + "/first.pb";
  absl::StatusOr<Cell*> first = engine.Cutout(board_, options_);
  ASSERT_TRUE(first.ok()) << first.status();

  options_.output_path = testing::TempDir() + "/second.pb";
  options_.number_of_threads = 1;
  absl::StatusOr<Cell*> second = engine.Cutout(board_, options_);
  ASSERT_TRUE(second.ok()) << second.status();

  EXPECT_NE(*first, *second);
  EXPECT_EQ("board_cutout", (*first)->name());
  EXPECT_EQ("board_cutout_1", (*second)->name());
  EXPECT_EQ((*first)->layout()->nets(), (*second)->layout()->nets());
  EXPECT_EQ((*first)->layout()->primitives().size(),
            (*second)->layout()->primitives().size());
  EXPECT_EQ(source_primitives, board_->layout()->primitives().size());

  DesignDatabase reloaded;
  absl::StatusOr<Cell*> read = reloaded.ReadCell(options_.output_path);
  ASSERT_TRUE(read.ok()) << read.status();
  EXPECT_EQ((*second)->layout()->primitives().size(),
            (*read)->layout()->primitives().size());
}

}  // namespace
}  // namespace layup
