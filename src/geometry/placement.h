#ifndef GEOMETRY_PLACEMENT_H_
#define GEOMETRY_PLACEMENT_H_

#include <ostream>
#include <string>

#include "point.h"
#include "layup.pb.h"
#include "polygon.h"
#include "rectangle.h"

namespace layup {
namespace geometry {

// A rigid planar transform applied to a placed layout: mirror in the y-axis
// (if set), then rotate anti-clockwise about the origin, then translate.
class Placement {
 public:
  Placement()
      : rotation_radians_(0.0),
        offset_(0, 0),
        mirror_(false) {}
  Placement(double rotation_radians, const Point &offset, bool mirror)
      : rotation_radians_(rotation_radians),
        offset_(offset),
        mirror_(mirror) {}

  Point Apply(const Point &point) const;
  Polygon Apply(const Polygon &polygon) const;
  // The bounding box of the transformed rectangle.
  Rectangle Apply(const Rectangle &rectangle) const;

  double rotation_radians() const { return rotation_radians_; }
  void set_rotation_radians(double rotation) { rotation_radians_ = rotation; }

  const Point &offset() const { return offset_; }
  void set_offset(const Point &offset) { offset_ = offset; }

  bool mirror() const { return mirror_; }
  void set_mirror(bool mirror) { mirror_ = mirror; }

  std::string Describe() const;

 private:
  double rotation_radians_;
  Point offset_;
  bool mirror_;
};

struct Vector3 {
  double x;
  double y;
  double z;

  ::layup::proto::Vector3 ToProto() const;
  static Vector3 FromProto(const ::layup::proto::Vector3 &vector_pb);
};

bool operator==(const Vector3 &lhs, const Vector3 &rhs);
std::ostream &operator<<(std::ostream &os, const Vector3 &vector);

// A 3D placement: rotate by `rotation_radians` about the axis through
// `origin`, with the in-plane orientation given by the direction from
// `axis_from` to `axis_to`, then translate. Lengths are in metres.
struct Transform3D {
  Vector3 origin;
  Vector3 axis_from;
  Vector3 axis_to;
  double rotation_radians;
  Vector3 translation;

  std::string Describe() const;

  ::layup::proto::Transform3D ToProto() const;
  static Transform3D FromProto(const ::layup::proto::Transform3D &transform_pb);
};

}  // namespace geometry
}  // namespace layup

#endif  // GEOMETRY_PLACEMENT_H_
