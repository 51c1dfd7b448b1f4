#include <gtest/gtest.h>
#include <glog/logging.h>

#include "radian.h"
#include "rectangle.h"

namespace layup {
namespace geometry {
namespace {

TEST(RectangleTest, Width) {
  Rectangle rect_a(Point(0, 0), 500, 500);
  EXPECT_EQ(500, rect_a.Width());

  Rectangle rect_b(Point(-50, -60), Point(70, 90));
  EXPECT_EQ(120, rect_b.Width());
}

TEST(RectangleTest, Height) {
  Rectangle rect_a(Point(0, 0), 500, 650);
  EXPECT_EQ(650, rect_a.Height());

  Rectangle rect_b(Point(-50, -60), Point(70, 90));
  EXPECT_EQ(150, rect_b.Height());
}

TEST(RectangleTest, Centre) {
  Rectangle rect_a(Point(0, 0), 500, 650);
  EXPECT_EQ(Point(250, 325), rect_a.centre());
}

TEST(RectangleTest, WithPadding) {
  Rectangle test({1, 1}, {3, 3});
  EXPECT_EQ(Rectangle({-1, -1}, {5, 5}), test.WithPadding(2));
  // Shrinking past nothing collapses onto the centre.
  EXPECT_EQ(Rectangle({2, 2}, {2, 2}), test.WithPadding(-5));
}

TEST(RectangleTest, ExpandBounds) {
  Rectangle box({0, 0}, {1, 1});
  Rectangle::ExpandBounds(Rectangle({-5, 2}, {3, 8}), &box);
  EXPECT_EQ(Rectangle({-5, 0}, {3, 8}), box);
}

TEST(RectangleTest, RotateByHalfTurn) {
  Rectangle test({1, 1}, {2, 3});
  test.Rotate(Radian::kPi);
  EXPECT_EQ(Rectangle({-2, -3}, {-1, -1}), test);
}

TEST(RectangleTest, Mirror) {
  Rectangle test({1, 2}, {3, 4});
  test.MirrorY();
  EXPECT_EQ(Rectangle({-3, 2}, {-1, 4}), test);
  test.MirrorX();
  EXPECT_EQ(Rectangle({-3, -4}, {-1, -2}), test);
}

}  // namespace
}  // namespace geometry
}  // namespace layup
