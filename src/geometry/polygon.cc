#include "polygon.h"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <sstream>
#include <utility>

#include <glog/logging.h>

#include "point.h"
#include "rectangle.h"

namespace layup {
namespace geometry {

double Polygon::SignedArea() const {
  if (Empty())
    return 0.0;
  double twice_area = 0.0;
  for (size_t i = 0, j = vertices_.size() - 1; i < vertices_.size(); j = i++) {
    twice_area += static_cast<double>(vertices_[j].x()) *
                      static_cast<double>(vertices_[i].y()) -
                  static_cast<double>(vertices_[i].x()) *
                      static_cast<double>(vertices_[j].y());
  }
  return twice_area / 2.0;
}

double Polygon::Area() const {
  return std::abs(SignedArea());
}

void Polygon::MirrorY() {
  for (Point &point : vertices_) {
    point.MirrorY();
  }
}

void Polygon::MirrorX() {
  for (Point &point : vertices_) {
    point.MirrorX();
  }
}

void Polygon::Translate(const Point &offset) {
  for (Point &point : vertices_) {
    point.Translate(offset);
  }
}

void Polygon::Rotate(double theta_radians) {
  for (Point &point : vertices_) {
    point.Rotate(theta_radians);
  }
}

const Rectangle Polygon::GetBoundingBox() const {
  Point lower_left;
  Point upper_right;

  if (!vertices_.empty()) {
    lower_left = vertices_.front();
    upper_right = lower_left;
    for (const auto &point : vertices_) {
      lower_left.set_x(std::min(lower_left.x(), point.x()));
      lower_left.set_y(std::min(lower_left.y(), point.y()));
      upper_right.set_x(std::max(upper_right.x(), point.x()));
      upper_right.set_y(std::max(upper_right.y(), point.y()));
    }
  }

  return Rectangle(lower_left, upper_right);
}

const std::string Polygon::Describe() const {
  std::stringstream ss;
  for (const auto &point : vertices_) {
    ss << point << " ";
  }
  return ss.str();
}

::layup::proto::Polygon Polygon::ToProto() const {
  ::layup::proto::Polygon polygon_pb;
  for (const Point &vertex : vertices_) {
    *polygon_pb.add_vertices() = vertex.ToProto();
  }
  return polygon_pb;
}

Polygon Polygon::FromProto(const ::layup::proto::Polygon &polygon_pb) {
  Polygon polygon;
  for (const auto &point_pb : polygon_pb.vertices()) {
    polygon.AddVertex(Point::FromProto(point_pb));
  }
  return polygon;
}

bool operator==(const Polygon &lhs, const Polygon &rhs) {
  return lhs.vertices() == rhs.vertices();
}

}  // namespace geometry

std::ostream &operator<<(std::ostream &os, const geometry::Polygon &polygon) {
  for (size_t i = 0; i < polygon.vertices().size(); ++i) {
    os << polygon.vertices().at(i);
    if (i != polygon.vertices().size() - 1) {
      os << ", ";
    }
  }
  return os;
}

}  // namespace layup
