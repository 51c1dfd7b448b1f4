#ifndef STACKUP_LAYER_H_
#define STACKUP_LAYER_H_

#include <optional>
#include <ostream>
#include <string>

#include <absl/status/statusor.h>

#include "layer_type.h"
#include "layup.pb.h"
#include "roughness.h"

namespace layup {

// A via layer spans the gap between two named stackup layers.
struct ViaReferences {
  std::string upper;
  std::string lower;
};

// One layer of a board's physical description. Thickness and elevation are in
// metres; elevation is measured from the bottom of the stack.
class StackupLayer {
 public:
  StackupLayer()
      : type_(LayerType::kUndefined),
        thickness_(0.0),
        lower_elevation_(0.0),
        is_negative_(false),
        top_bottom_association_(TopBottomAssociation::kNeither) {}

  StackupLayer(const std::string &name, LayerType type)
      : name_(name),
        type_(type),
        thickness_(0.0),
        lower_elevation_(0.0),
        is_negative_(false),
        top_bottom_association_(TopBottomAssociation::kNeither) {}

  // Stackup layers take part in elevation ordering; everything else (silk,
  // outlines, user layers) just rides along.
  bool IsStackupLayer() const {
    return via_references_.has_value() || IsStackupType(type_);
  }
  bool IsViaLayer() const { return via_references_.has_value(); }
  bool IsSignal() const { return type_ == LayerType::kSignal; }
  bool IsDielectric() const { return type_ == LayerType::kDielectric; }

  double UpperElevation() const { return lower_elevation_ + thickness_; }

  void set_name(const std::string &name) { name_ = name; }
  const std::string &name() const { return name_; }

  void set_type(LayerType type) { type_ = type; }
  LayerType type() const { return type_; }

  void set_material(const std::string &material) { material_ = material; }
  const std::string &material() const { return material_; }

  void set_fill_material(const std::string &fill_material) {
    fill_material_ = fill_material;
  }
  const std::string &fill_material() const { return fill_material_; }

  void set_thickness(double thickness) { thickness_ = thickness; }
  double thickness() const { return thickness_; }

  void set_lower_elevation(double lower_elevation) {
    lower_elevation_ = lower_elevation;
  }
  double lower_elevation() const { return lower_elevation_; }

  void set_is_negative(bool is_negative) { is_negative_ = is_negative; }
  bool is_negative() const { return is_negative_; }

  void set_etch_factor(const std::optional<double> &etch_factor) {
    etch_factor_ = etch_factor;
  }
  const std::optional<double> &etch_factor() const { return etch_factor_; }

  LayerRoughness &roughness() { return roughness_; }
  const LayerRoughness &roughness() const { return roughness_; }

  void set_top_bottom_association(TopBottomAssociation association) {
    top_bottom_association_ = association;
  }
  TopBottomAssociation top_bottom_association() const {
    return top_bottom_association_;
  }

  void set_via_references(const std::optional<ViaReferences> &references) {
    via_references_ = references;
  }
  const std::optional<ViaReferences> &via_references() const {
    return via_references_;
  }

  std::string Describe() const;

  // Material definitions are not included; the caller adds them if wanted.
  ::layup::proto::Layer ToProto() const;
  static absl::StatusOr<StackupLayer> FromProto(
      const ::layup::proto::Layer &layer_pb);

 private:
  std::string name_;
  LayerType type_;

  std::string material_;
  std::string fill_material_;

  double thickness_;
  double lower_elevation_;

  bool is_negative_;
  std::optional<double> etch_factor_;
  LayerRoughness roughness_;
  TopBottomAssociation top_bottom_association_;

  std::optional<ViaReferences> via_references_;
};

std::ostream &operator<<(std::ostream &os, const StackupLayer &layer);

}  // namespace layup

#endif  // STACKUP_LAYER_H_
