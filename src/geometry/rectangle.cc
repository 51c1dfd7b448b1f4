#include "rectangle.h"

#include <algorithm>
#include <sstream>
#include <vector>

#include "point.h"

namespace layup {
namespace geometry {

void Rectangle::ExpandBounds(const Rectangle &subsume,
                             Rectangle *bounding_box) {
  bounding_box->lower_left_.set_x(std::min(
      subsume.lower_left().x(), bounding_box->lower_left_.x()));
  bounding_box->lower_left_.set_y(std::min(
      subsume.lower_left().y(), bounding_box->lower_left_.y()));
  bounding_box->upper_right_.set_x(std::max(
      subsume.upper_right().x(), bounding_box->upper_right_.x()));
  bounding_box->upper_right_.set_y(std::max(
      subsume.upper_right().y(), bounding_box->upper_right_.y()));
}

Rectangle Rectangle::CentredAt(
    const Point &centre, uint64_t width, uint64_t height) {
  Point lower_left = centre - Point{
      static_cast<int64_t>(width) / 2,
      static_cast<int64_t>(height) / 2};
  return Rectangle(lower_left, width, height);
}

void Rectangle::MirrorY() {
  Point new_upper_right(-lower_left_.x(), upper_right_.y());
  Point new_lower_left(-upper_right_.x(), lower_left_.y());
  lower_left_ = new_lower_left;
  upper_right_ = new_upper_right;
}

void Rectangle::MirrorX() {
  Point new_upper_right(upper_right_.x(), -lower_left_.y());
  Point new_lower_left(lower_left_.x(), -upper_right_.y());
  lower_left_ = new_lower_left;
  upper_right_ = new_upper_right;
}

void Rectangle::Translate(const Point &offset) {
  lower_left_ = lower_left_ + offset;
  upper_right_ = upper_right_ + offset;
}

void Rectangle::Rotate(double theta_radians) {
  std::vector<Point> corners = Corners();
  for (Point &corner : corners) {
    corner.Rotate(theta_radians);
  }
  auto [min_x, max_x] = std::minmax_element(
      corners.begin(), corners.end(), Point::CompareX);
  auto [min_y, max_y] = std::minmax_element(
      corners.begin(), corners.end(), Point::CompareY);
  lower_left_ = Point(min_x->x(), min_y->y());
  upper_right_ = Point(max_x->x(), max_y->y());
}

Rectangle Rectangle::WithPadding(int64_t padding) const {
  Point lower_left = lower_left_ - Point {padding, padding};
  Point upper_right = upper_right_ + Point {padding, padding};
  if (lower_left.x() > upper_right.x()) {
    lower_left.set_x((lower_left.x() + upper_right.x())/2);
    upper_right.set_x(lower_left.x());
  }
  if (lower_left.y() > upper_right.y()) {
    lower_left.set_y((lower_left.y() + upper_right.y())/2);
    upper_right.set_y(lower_left.y());
  }
  return {lower_left, upper_right};
}

const std::string Rectangle::Describe() const {
  std::stringstream ss;
  ss << "[Rectangle " << lower_left_ << " " << upper_right_ << "]";
  return ss.str();
}

bool operator==(const Rectangle &lhs, const Rectangle &rhs) {
  return lhs.lower_left() == rhs.lower_left()
      && lhs.upper_right() == rhs.upper_right();
}

}  // namespace geometry

std::ostream &operator<<(
    std::ostream &os, const geometry::Rectangle &rectangle) {
  os << rectangle.Describe();
  return os;
}

}  // namespace layup
