#ifndef GEOMETRY_POLYGON_H_
#define GEOMETRY_POLYGON_H_

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "manipulable.h"
#include "point.h"
#include "layup.pb.h"
#include "rectangle.h"

namespace layup {
namespace geometry {

// A simple closed polygon. The closing edge from the last vertex back to the
// first is implied, so the first vertex is not repeated.
class Polygon : public Manipulable {
 public:
  Polygon() = default;

  Polygon(const std::vector<Point> &vertices) {
    for (const auto &vertex : vertices) {
      AddVertex(vertex);
    }
  }

  static Polygon FromRectangle(const Rectangle &rectangle) {
    return Polygon(rectangle.Corners());
  }

  void AddVertex(const Point &point) {
    if (!vertices_.empty() && vertices_.back() == point)
      return;
    vertices_.push_back(point);
  }

  void RemoveLastVertex() {
    vertices_.pop_back();
  }

  bool Empty() const { return vertices_.size() < 3; }

  // Shoelace formula. Positive for anti-clockwise winding.
  double SignedArea() const;
  double Area() const;

  void MirrorY() override;
  void MirrorX() override;
  void Translate(const Point &offset) override;
  void Rotate(double theta_radians) override;

  const Rectangle GetBoundingBox() const;

  ::layup::proto::Polygon ToProto() const;
  static Polygon FromProto(const ::layup::proto::Polygon &polygon_pb);

  const std::string Describe() const;

  const std::vector<Point> &vertices() const { return vertices_; }

 private:
  std::vector<Point> vertices_;
};

bool operator==(const Polygon &lhs, const Polygon &rhs);

}  // namespace geometry

std::ostream &operator<<(std::ostream &os, const geometry::Polygon &polygon);

}  // namespace layup

#endif  // GEOMETRY_POLYGON_H_
