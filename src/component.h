#ifndef COMPONENT_H_
#define COMPONENT_H_

#include <optional>
#include <ostream>
#include <string>

#include <absl/status/statusor.h>

#include "layup.pb.h"

namespace layup {

enum class ComponentType {
  kResistor,
  kInductor,
  kCapacitor,
  kIC,
  kIO,
  kOther
};

enum class SolderBallPlacement {
  kAbovePadstack,
  kBelowPadstack
};

enum class DieOrientation {
  kChipUp,
  kChipDown
};

// Metres.
struct SolderBall {
  double height;
  double diameter;
  SolderBallPlacement placement;
};

// The size of the reference conductor used for a component's ports. A zero
// size with auto-sizing off means the ports are not shorted to a PEC
// reference.
struct PortReferenceSize {
  bool auto_size;
  double width;
  double height;
};

// A placed part. Its pins are the padstack instances that name it.
class Component {
 public:
  static SolderBallPlacement Flipped(SolderBallPlacement placement);
  static DieOrientation Flipped(DieOrientation orientation);

  Component()
      : type_(ComponentType::kOther),
        die_orientation_(DieOrientation::kChipUp),
        port_reference_size_{.auto_size = true, .width = 0, .height = 0} {}

  Component(const std::string &name, ComponentType type)
      : name_(name),
        type_(type),
        die_orientation_(DieOrientation::kChipUp),
        port_reference_size_{.auto_size = true, .width = 0, .height = 0} {}

  void set_name(const std::string &name) { name_ = name; }
  const std::string &name() const { return name_; }

  void set_type(ComponentType type) { type_ = type; }
  ComponentType type() const { return type_; }

  void set_part_name(const std::string &part_name) { part_name_ = part_name; }
  const std::string &part_name() const { return part_name_; }

  // The signal layer the component is mounted on.
  void set_placement_layer(const std::string &layer) {
    placement_layer_ = layer;
  }
  const std::string &placement_layer() const { return placement_layer_; }

  void set_solder_ball(const std::optional<SolderBall> &solder_ball) {
    solder_ball_ = solder_ball;
  }
  const std::optional<SolderBall> &solder_ball() const { return solder_ball_; }
  std::optional<SolderBall> &solder_ball() { return solder_ball_; }

  void set_die_orientation(DieOrientation orientation) {
    die_orientation_ = orientation;
  }
  DieOrientation die_orientation() const { return die_orientation_; }

  void set_port_reference_size(const PortReferenceSize &size) {
    port_reference_size_ = size;
  }
  const PortReferenceSize &port_reference_size() const {
    return port_reference_size_;
  }

  double SolderBallHeight() const {
    return solder_ball_ ? solder_ball_->height : 0.0;
  }

  std::string Describe() const;

  ::layup::proto::Component ToProto() const;
  static absl::StatusOr<Component> FromProto(
      const ::layup::proto::Component &component_pb);

 private:
  std::string name_;
  ComponentType type_;
  std::string part_name_;
  std::string placement_layer_;

  std::optional<SolderBall> solder_ball_;
  DieOrientation die_orientation_;
  PortReferenceSize port_reference_size_;
};

absl::StatusOr<ComponentType> ParseComponentType(const std::string &name);
const char *ComponentTypeName(ComponentType type);

std::ostream &operator<<(std::ostream &os, const Component &component);

}  // namespace layup

#endif  // COMPONENT_H_
