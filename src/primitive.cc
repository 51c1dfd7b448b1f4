#include "primitive.h"

#include <ostream>
#include <sstream>
#include <string>

namespace layup {

std::string Primitive::Describe() const {
  std::stringstream ss;
  ss << "[Primitive " << id_ << " " << net_ << " on " << layer_ << " "
     << outline_.vertices().size() << " vertices, "
     << voids_.size() << " voids";
  if (is_void_) {
    ss << ", void";
  }
  ss << "]";
  return ss.str();
}

::layup::proto::Primitive Primitive::ToProto() const {
  ::layup::proto::Primitive primitive_pb;
  primitive_pb.set_id(id_);
  primitive_pb.set_layer(layer_);
  primitive_pb.set_net(net_);
  *primitive_pb.mutable_outline() = outline_.ToProto();
  for (const geometry::Polygon &void_outline : voids_) {
    *primitive_pb.add_voids() = void_outline.ToProto();
  }
  primitive_pb.set_is_void(is_void_);
  return primitive_pb;
}

Primitive Primitive::FromProto(const ::layup::proto::Primitive &primitive_pb) {
  Primitive primitive(primitive_pb.layer(),
                      primitive_pb.net(),
                      geometry::Polygon::FromProto(primitive_pb.outline()));
  primitive.set_id(primitive_pb.id());
  for (const auto &void_pb : primitive_pb.voids()) {
    primitive.AddVoid(geometry::Polygon::FromProto(void_pb));
  }
  primitive.set_is_void(primitive_pb.is_void());
  return primitive;
}

std::ostream &operator<<(std::ostream &os, const Primitive &primitive) {
  os << primitive.Describe();
  return os;
}

}  // namespace layup
