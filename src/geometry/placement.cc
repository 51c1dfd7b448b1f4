#include "placement.h"

#include <sstream>
#include <string>

#include <absl/strings/str_format.h>

#include "radian.h"

namespace layup {
namespace geometry {

Point Placement::Apply(const Point &point) const {
  Point transformed = point;
  if (mirror_) {
    transformed.MirrorY();
  }
  if (!Radian::IsEffectivelyZero(rotation_radians_)) {
    transformed.Rotate(rotation_radians_);
  }
  transformed.Translate(offset_);
  return transformed;
}

Polygon Placement::Apply(const Polygon &polygon) const {
  Polygon transformed;
  for (const Point &vertex : polygon.vertices()) {
    transformed.AddVertex(Apply(vertex));
  }
  return transformed;
}

Rectangle Placement::Apply(const Rectangle &rectangle) const {
  return Apply(Polygon::FromRectangle(rectangle)).GetBoundingBox();
}

std::string Placement::Describe() const {
  return absl::StrFormat("[Placement rotation=%f deg offset=%s mirror=%d]",
                         Radian::RadiansToDegrees(rotation_radians_),
                         offset_.Describe(),
                         mirror_);
}

bool operator==(const Vector3 &lhs, const Vector3 &rhs) {
  return lhs.x == rhs.x && lhs.y == rhs.y && lhs.z == rhs.z;
}

std::ostream &operator<<(std::ostream &os, const Vector3 &vector) {
  os << "(" << vector.x << ", " << vector.y << ", " << vector.z << ")";
  return os;
}

std::string Transform3D::Describe() const {
  std::stringstream ss;
  ss << "[Transform3D origin=" << origin
     << " axis=" << axis_from << "->" << axis_to
     << " rotation=" << rotation_radians
     << " translation=" << translation << "]";
  return ss.str();
}

::layup::proto::Vector3 Vector3::ToProto() const {
  ::layup::proto::Vector3 vector_pb;
  vector_pb.set_x(x);
  vector_pb.set_y(y);
  vector_pb.set_z(z);
  return vector_pb;
}

Vector3 Vector3::FromProto(const ::layup::proto::Vector3 &vector_pb) {
  return Vector3 {vector_pb.x(), vector_pb.y(), vector_pb.z()};
}

::layup::proto::Transform3D Transform3D::ToProto() const {
  ::layup::proto::Transform3D transform_pb;
  *transform_pb.mutable_origin() = origin.ToProto();
  *transform_pb.mutable_axis_from() = axis_from.ToProto();
  *transform_pb.mutable_axis_to() = axis_to.ToProto();
  transform_pb.set_rotation(rotation_radians);
  *transform_pb.mutable_translation() = translation.ToProto();
  return transform_pb;
}

Transform3D Transform3D::FromProto(
    const ::layup::proto::Transform3D &transform_pb) {
  return Transform3D {
      .origin = Vector3::FromProto(transform_pb.origin()),
      .axis_from = Vector3::FromProto(transform_pb.axis_from()),
      .axis_to = Vector3::FromProto(transform_pb.axis_to()),
      .rotation_radians = transform_pb.rotation(),
      .translation = Vector3::FromProto(transform_pb.translation())
  };
}

}  // namespace geometry
}  // namespace layup
