#include "padstack_instance.h"

#include <ostream>
#include <sstream>
#include <string>

namespace layup {

std::string PadstackInstance::Describe() const {
  std::stringstream ss;
  ss << "[PadstackInstance " << id_ << " " << name_ << " " << net_ << " at "
     << position_ << " " << start_layer_ << "->" << stop_layer_;
  if (!component_.empty()) {
    ss << " of " << component_;
  }
  ss << "]";
  return ss.str();
}

::layup::proto::PadstackInstance PadstackInstance::ToProto() const {
  ::layup::proto::PadstackInstance instance_pb;
  instance_pb.set_id(id_);
  instance_pb.set_name(name_);
  instance_pb.set_net(net_);
  instance_pb.set_padstack_definition(padstack_definition_);
  *instance_pb.mutable_position() = position_.ToProto();
  instance_pb.set_rotation(rotation_radians_);
  instance_pb.set_start_layer(start_layer_);
  instance_pb.set_stop_layer(stop_layer_);
  instance_pb.set_pad_width(pad_width_);
  instance_pb.set_pad_height(pad_height_);
  instance_pb.set_component(component_);
  instance_pb.set_is_pin(is_pin_);
  return instance_pb;
}

PadstackInstance PadstackInstance::FromProto(
    const ::layup::proto::PadstackInstance &instance_pb) {
  PadstackInstance instance;
  instance.id_ = instance_pb.id();
  instance.name_ = instance_pb.name();
  instance.net_ = instance_pb.net();
  instance.padstack_definition_ = instance_pb.padstack_definition();
  instance.position_ = geometry::Point::FromProto(instance_pb.position());
  instance.rotation_radians_ = instance_pb.rotation();
  instance.start_layer_ = instance_pb.start_layer();
  instance.stop_layer_ = instance_pb.stop_layer();
  instance.pad_width_ = instance_pb.pad_width();
  instance.pad_height_ = instance_pb.pad_height();
  instance.component_ = instance_pb.component();
  instance.is_pin_ = instance_pb.is_pin();
  return instance;
}

std::ostream &operator<<(std::ostream &os, const PadstackInstance &instance) {
  os << instance.Describe();
  return os;
}

}  // namespace layup
