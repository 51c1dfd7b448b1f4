#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "placement.h"
#include "polygon.h"
#include "radian.h"
#include "rectangle.h"

namespace layup {
namespace geometry {
namespace {

TEST(PlacementTest, IdentityDoesNothing) {
  Placement identity;
  EXPECT_EQ(Point(12, -7), identity.Apply(Point(12, -7)));
}

TEST(PlacementTest, MirrorThenRotateThenTranslate) {
  Placement placement(Radian::kPi / 2, Point(100, 0), true);
  // Mirror: (10, 0) -> (-10, 0). Rotate 90: (0, -10). Translate: (100, -10).
  EXPECT_EQ(Point(100, -10), placement.Apply(Point(10, 0)));
}

TEST(PlacementTest, RectangleBoundsAfterRotation) {
  Placement placement(Radian::kPi, Point(0, 0), false);
  EXPECT_EQ(Rectangle({-20, -10}, {0, 0}),
            placement.Apply(Rectangle({0, 0}, {20, 10})));
}

TEST(PlacementTest, PolygonKeepsVertexCount) {
  Placement placement(0.0, Point(5, 5), false);
  Polygon triangle({{0, 0}, {10, 0}, {0, 10}});
  Polygon moved = placement.Apply(triangle);
  EXPECT_THAT(moved.vertices(),
              testing::ElementsAre(Point(5, 5), Point(15, 5), Point(5, 15)));
}

}  // namespace
}  // namespace geometry
}  // namespace layup
