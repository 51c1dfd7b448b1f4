#include "cell_instance.h"

#include <ostream>
#include <sstream>
#include <string>

#include "cell.h"
#include "geometry/placement.h"
#include "geometry/point.h"
#include "geometry/radian.h"

namespace layup {

// Mirroring after a rotation by theta is the same as mirroring first and then
// rotating by -theta.
void CellInstance::MirrorY() {
  geometry::Point offset = placement_.offset();
  offset.MirrorY();
  placement_ = geometry::Placement(-placement_.rotation_radians(),
                                   offset,
                                   !placement_.mirror());
}

void CellInstance::MirrorX() {
  MirrorY();
  Rotate(geometry::Radian::kPi);
}

void CellInstance::Translate(const geometry::Point &offset) {
  placement_.set_offset(placement_.offset() + offset);
}

void CellInstance::Rotate(double theta_radians) {
  geometry::Point offset = placement_.offset();
  offset.Rotate(theta_radians);
  placement_.set_offset(offset);
  placement_.set_rotation_radians(
      geometry::Radian::Normalise(
          placement_.rotation_radians() + theta_radians));
}

std::string CellInstance::Describe() const {
  std::stringstream ss;
  ss << "[CellInstance " << name_ << " of ";
  if (template_cell_) {
    ss << template_cell_->name();
  } else {
    ss << "model " << model_name_;
  }
  ss << " on " << placement_layer_ << " " << placement_.Describe();
  if (transform_3d_) {
    ss << " " << transform_3d_->Describe();
  }
  ss << "]";
  return ss.str();
}

::layup::proto::CellInstance CellInstance::ToProto() const {
  ::layup::proto::CellInstance instance_pb;
  instance_pb.set_name(name_);
  if (template_cell_) {
    instance_pb.set_template_cell(template_cell_->name());
  }
  instance_pb.set_model_name(model_name_);
  instance_pb.set_rotation(placement_.rotation_radians());
  *instance_pb.mutable_offset() = placement_.offset().ToProto();
  instance_pb.set_mirror(placement_.mirror());
  if (transform_3d_) {
    *instance_pb.mutable_transform_3d() = transform_3d_->ToProto();
  }
  instance_pb.set_placement_layer(placement_layer_);
  return instance_pb;
}

CellInstance CellInstance::FromProto(
    const ::layup::proto::CellInstance &instance_pb, Cell *template_cell) {
  CellInstance instance(instance_pb.name(), template_cell);
  instance.model_name_ = instance_pb.model_name();
  instance.placement_ = geometry::Placement(
      instance_pb.rotation(),
      geometry::Point::FromProto(instance_pb.offset()),
      instance_pb.mirror());
  if (instance_pb.has_transform_3d()) {
    instance.transform_3d_ =
        geometry::Transform3D::FromProto(instance_pb.transform_3d());
  }
  instance.placement_layer_ = instance_pb.placement_layer();
  return instance;
}

std::ostream &operator<<(std::ostream &os, const CellInstance &instance) {
  os << instance.Describe();
  return os;
}

}  // namespace layup
