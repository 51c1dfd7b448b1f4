#include "component.h"

#include <ostream>
#include <sstream>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace layup {

SolderBallPlacement Component::Flipped(SolderBallPlacement placement) {
  return placement == SolderBallPlacement::kAbovePadstack ?
      SolderBallPlacement::kBelowPadstack :
      SolderBallPlacement::kAbovePadstack;
}

DieOrientation Component::Flipped(DieOrientation orientation) {
  return orientation == DieOrientation::kChipUp ?
      DieOrientation::kChipDown : DieOrientation::kChipUp;
}

absl::StatusOr<ComponentType> ParseComponentType(const std::string &name) {
  std::string lower = absl::AsciiStrToLower(name);
  if (lower == "resistor" || lower == "r")
    return ComponentType::kResistor;
  if (lower == "inductor" || lower == "l")
    return ComponentType::kInductor;
  if (lower == "capacitor" || lower == "c")
    return ComponentType::kCapacitor;
  if (lower == "ic")
    return ComponentType::kIC;
  if (lower == "io")
    return ComponentType::kIO;
  if (lower == "other")
    return ComponentType::kOther;
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown component type: \"", name, "\""));
}

const char *ComponentTypeName(ComponentType type) {
  switch (type) {
    case ComponentType::kResistor:
      return "Resistor";
    case ComponentType::kInductor:
      return "Inductor";
    case ComponentType::kCapacitor:
      return "Capacitor";
    case ComponentType::kIC:
      return "IC";
    case ComponentType::kIO:
      return "IO";
    case ComponentType::kOther:
      return "Other";
  }
  return "Other";
}

::layup::proto::Component Component::ToProto() const {
  ::layup::proto::Component component_pb;
  component_pb.set_name(name_);
  component_pb.set_type(ComponentTypeName(type_));
  component_pb.set_part_name(part_name_);
  component_pb.set_placement_layer(placement_layer_);
  if (solder_ball_) {
    ::layup::proto::SolderBall *ball_pb = component_pb.mutable_solder_ball();
    ball_pb->set_height(solder_ball_->height);
    ball_pb->set_diameter(solder_ball_->diameter);
    ball_pb->set_placement(
        solder_ball_->placement == SolderBallPlacement::kAbovePadstack ?
        "above" : "below");
  }
  component_pb.set_die_orientation(
      die_orientation_ == DieOrientation::kChipUp ? "chip_up" : "chip_down");
  ::layup::proto::PortReferenceSize *size_pb =
      component_pb.mutable_port_reference_size();
  size_pb->set_auto_size(port_reference_size_.auto_size);
  size_pb->set_width(port_reference_size_.width);
  size_pb->set_height(port_reference_size_.height);
  return component_pb;
}

absl::StatusOr<Component> Component::FromProto(
    const ::layup::proto::Component &component_pb) {
  ComponentType type = ComponentType::kOther;
  if (!component_pb.type().empty()) {
    absl::StatusOr<ComponentType> parsed =
        ParseComponentType(component_pb.type());
    if (!parsed.ok())
      return parsed.status();
    type = *parsed;
  }
  Component component(component_pb.name(), type);
  component.part_name_ = component_pb.part_name();
  component.placement_layer_ = component_pb.placement_layer();

  if (component_pb.has_solder_ball()) {
    const ::layup::proto::SolderBall &ball_pb = component_pb.solder_ball();
    std::string placement = absl::AsciiStrToLower(ball_pb.placement());
    if (placement != "above" && placement != "below" && !placement.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Component \"", component_pb.name(),
                       "\" has unknown solder ball placement \"",
                       ball_pb.placement(), "\""));
    }
    component.solder_ball_ = SolderBall {
        .height = ball_pb.height(),
        .diameter = ball_pb.diameter(),
        .placement = placement == "below" ?
            SolderBallPlacement::kBelowPadstack :
            SolderBallPlacement::kAbovePadstack
    };
  }

  std::string orientation = absl::AsciiStrToLower(
      component_pb.die_orientation());
  if (orientation == "chip_down") {
    component.die_orientation_ = DieOrientation::kChipDown;
  } else if (orientation != "chip_up" && !orientation.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Component \"", component_pb.name(),
                     "\" has unknown die orientation \"",
                     component_pb.die_orientation(), "\""));
  }

  if (component_pb.has_port_reference_size()) {
    const ::layup::proto::PortReferenceSize &size_pb =
        component_pb.port_reference_size();
    component.port_reference_size_ = PortReferenceSize {
        .auto_size = size_pb.auto_size(),
        .width = size_pb.width(),
        .height = size_pb.height()
    };
  }
  return component;
}

std::string Component::Describe() const {
  std::stringstream ss;
  ss << "[Component " << name_ << " " << ComponentTypeName(type_)
     << " on " << placement_layer_;
  if (solder_ball_) {
    ss << " solder " << solder_ball_->height * 1e6 << "um "
       << (solder_ball_->placement == SolderBallPlacement::kAbovePadstack ?
           "above" : "below");
  }
  if (type_ == ComponentType::kIC) {
    ss << (die_orientation_ == DieOrientation::kChipUp ?
           " chip-up" : " chip-down");
  }
  ss << "]";
  return ss.str();
}

std::ostream &operator<<(std::ostream &os, const Component &component) {
  os << component.Describe();
  return os;
}

}  // namespace layup
