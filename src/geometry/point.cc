#include <cmath>
#include <ostream>
#include <sstream>
#include <string>

#include "point.h"

namespace layup {
namespace geometry {

bool Point::CompareX(const Point &lhs, const Point &rhs) {
  return lhs.x() < rhs.x();
}

bool Point::CompareY(const Point &lhs, const Point &rhs) {
  return lhs.y() < rhs.y();
}

Point &Point::operator+=(const Point &other) {
  x_ = x_ + other.x_;
  y_ = y_ + other.y_;
  return *this;
}

Point &Point::operator-=(const Point &other) {
  x_ = x_ - other.x_;
  y_ = y_ - other.y_;
  return *this;
}

void Point::MirrorY() {
  x_ = -x_;
}

void Point::MirrorX() {
  y_ = -y_;
}

void Point::Translate(const Point &offset) {
  x_ += offset.x_;
  y_ += offset.y_;
}

void Point::Rotate(double theta_radians) {
  //  x' = x cos(theta) - y sin(theta)
  //  y' = x sin(theta) + y cos(theta)
  double x = x_;
  double y = y_;
  x_ = std::llround(x * std::cos(theta_radians) - y * std::sin(theta_radians));
  y_ = std::llround(x * std::sin(theta_radians) + y * std::cos(theta_radians));
}

std::string Point::Describe() const {
  std::stringstream ss;
  ss << "(" << x_ << ", " << y_ << ")";
  return ss.str();
}

Point operator+(const Point &lhs, const Point &rhs) {
  return Point(lhs.x() + rhs.x(), lhs.y() + rhs.y());
}

Point operator-(const Point &lhs, const Point &rhs) {
  return Point(lhs.x() - rhs.x(), lhs.y() - rhs.y());
}

Point operator-(const Point &other) {
  return Point(-other.x(), -other.y());
}

bool operator<(const Point &lhs, const Point &rhs) {
  if (lhs.x() != rhs.x()) {
    return lhs.x() < rhs.x();
  }
  return lhs.y() < rhs.y();
}

bool operator==(const Point &lhs, const Point &rhs) {
  return lhs.x() == rhs.x() && lhs.y() == rhs.y();
}

bool operator!=(const Point &lhs, const Point &rhs) {
  return !(lhs == rhs);
}

::layup::proto::Point Point::ToProto() const {
  ::layup::proto::Point point_pb;
  point_pb.set_x(x_);
  point_pb.set_y(y_);
  return point_pb;
}

Point Point::FromProto(const ::layup::proto::Point &point_pb) {
  return Point(point_pb.x(), point_pb.y());
}

}  // namespace geometry

std::ostream &operator<<(std::ostream &os, const geometry::Point &point) {
  os << point.Describe();
  return os;
}

}  // namespace layup
