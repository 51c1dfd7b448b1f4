#ifndef GEOMETRY_RECTANGLE_H_
#define GEOMETRY_RECTANGLE_H_

#include <ostream>
#include <string>
#include <vector>

#include "manipulable.h"
#include "point.h"

namespace layup {
namespace geometry {

// A rectilinear rectangle. Used for bounding boxes and pad extents.
class Rectangle : public Manipulable {
 public:
  // Grow bounding_box so that it also covers subsume.
  static void ExpandBounds(const Rectangle &subsume, Rectangle *bounding_box);

  static Rectangle CentredAt(
      const Point &centre, uint64_t width, uint64_t height);

  Rectangle() = default;
  Rectangle(const Point &lower_left, uint64_t width, uint64_t height)
      : lower_left_(lower_left),
        upper_right_(lower_left + Point(width, height)) {}

  Rectangle(const Point &lower_left, const Point &upper_right)
      : lower_left_(lower_left),
        upper_right_(upper_right) {}

  uint64_t Width() const { return upper_right_.x() - lower_left_.x(); }
  uint64_t Height() const { return upper_right_.y() - lower_left_.y(); }

  // Area in square database units, as a double because boards are big.
  double Area() const {
    return static_cast<double>(Width()) * static_cast<double>(Height());
  }

  void MirrorY() override;
  void MirrorX() override;
  void Translate(const Point &offset) override;
  // Rectangles stay rectilinear: this replaces the rectangle with the bounding
  // box of its rotated corners.
  void Rotate(double theta_radians) override;

  Rectangle WithPadding(int64_t padding) const;

  // The four corners, anti-clockwise from the lower left.
  std::vector<Point> Corners() const {
    return {lower_left_, LowerRight(), upper_right_, UpperLeft()};
  }

  Point centre() const {
    return Point((lower_left_.x() + upper_right_.x()) / 2,
                 (lower_left_.y() + upper_right_.y()) / 2);
  }

  const Point &lower_left() const { return lower_left_; }
  void set_lower_left(const Point &lower_left) { lower_left_ = lower_left; }

  const Point &upper_right() const { return upper_right_; }
  void set_upper_right(const Point &upper_right) { upper_right_ = upper_right; }

  const Point UpperLeft() const {
    return Point(lower_left_.x(), upper_right_.y());
  }
  const Point LowerRight() const {
    return Point(upper_right_.x(), lower_left_.y());
  }

  const std::string Describe() const;

 protected:
  Point lower_left_;
  Point upper_right_;
};

bool operator==(const Rectangle &lhs, const Rectangle &rhs);

}  // namespace geometry

std::ostream &operator<<(
    std::ostream &os,
    const geometry::Rectangle &rectangle);

}  // namespace layup

#endif  // GEOMETRY_RECTANGLE_H_
