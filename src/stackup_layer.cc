#include "stackup_layer.h"

#include <ostream>
#include <sstream>
#include <string>
#include <variant>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>

#include "layer_type.h"
#include "roughness.h"

namespace layup {

namespace {

::layup::proto::SurfaceRoughness SurfaceRoughnessToProto(
    const SurfaceRoughness &surface) {
  ::layup::proto::SurfaceRoughness surface_pb;
  if (const HurayRoughness *huray = std::get_if<HurayRoughness>(&surface)) {
    surface_pb.mutable_huray()->set_nodule_radius(huray->nodule_radius);
    surface_pb.mutable_huray()->set_surface_ratio(huray->surface_ratio);
  } else if (const GroisseRoughness *groisse =
                 std::get_if<GroisseRoughness>(&surface)) {
    surface_pb.mutable_groisse()->set_roughness(groisse->roughness);
  }
  return surface_pb;
}

SurfaceRoughness SurfaceRoughnessFromProto(
    const ::layup::proto::SurfaceRoughness &surface_pb) {
  switch (surface_pb.model_case()) {
    case ::layup::proto::SurfaceRoughness::kHuray:
      return HurayRoughness {
          .nodule_radius = surface_pb.huray().nodule_radius(),
          .surface_ratio = surface_pb.huray().surface_ratio()
      };
    case ::layup::proto::SurfaceRoughness::kGroisse:
      return GroisseRoughness {.roughness = surface_pb.groisse().roughness()};
    default:
      return std::monostate();
  }
}

}  // namespace

std::string StackupLayer::Describe() const {
  std::stringstream ss;
  ss << absl::StrFormat("[%s %s", name_, LayerTypeName(type_));
  if (IsStackupLayer()) {
    ss << absl::StrFormat(" %s z=%.3fum t=%.3fum", material_,
                          lower_elevation_ * 1e6, thickness_ * 1e6);
    if (!fill_material_.empty()) {
      ss << " fill=" << fill_material_;
    }
  }
  if (via_references_) {
    ss << " via " << via_references_->upper << "->" << via_references_->lower;
  }
  if (top_bottom_association_ != TopBottomAssociation::kNeither) {
    ss << " " << top_bottom_association_;
  }
  ss << "]";
  return ss.str();
}

::layup::proto::Layer StackupLayer::ToProto() const {
  ::layup::proto::Layer layer_pb;
  layer_pb.set_name(name_);
  layer_pb.set_type(LayerTypeName(type_));
  layer_pb.set_material(material_);
  layer_pb.set_fill_material(fill_material_);
  layer_pb.set_thickness(thickness_);
  layer_pb.set_lower_elevation(lower_elevation_);
  layer_pb.set_is_negative(is_negative_);
  if (etch_factor_) {
    layer_pb.set_etch_factor(*etch_factor_);
  }
  ::layup::proto::Roughness *roughness_pb = layer_pb.mutable_roughness();
  roughness_pb->set_enabled(roughness_.enabled);
  *roughness_pb->mutable_top() = SurfaceRoughnessToProto(roughness_.top);
  *roughness_pb->mutable_bottom() = SurfaceRoughnessToProto(roughness_.bottom);
  *roughness_pb->mutable_side() = SurfaceRoughnessToProto(roughness_.side);
  layer_pb.set_top_bottom_association(
      TopBottomAssociationName(top_bottom_association_));
  if (via_references_) {
    layer_pb.mutable_via_references()->set_upper(via_references_->upper);
    layer_pb.mutable_via_references()->set_lower(via_references_->lower);
  }
  return layer_pb;
}

absl::StatusOr<StackupLayer> StackupLayer::FromProto(
    const ::layup::proto::Layer &layer_pb) {
  if (layer_pb.name().empty()) {
    return absl::InvalidArgumentError("Layer has no name");
  }
  absl::StatusOr<LayerType> type = ParseLayerType(layer_pb.type());
  if (!type.ok()) {
    return type.status();
  }
  absl::StatusOr<TopBottomAssociation> association =
      ParseTopBottomAssociation(layer_pb.top_bottom_association());
  if (!association.ok()) {
    return association.status();
  }

  StackupLayer layer(layer_pb.name(), *type);
  layer.material_ = layer_pb.material();
  layer.fill_material_ = layer_pb.fill_material();
  layer.thickness_ = layer_pb.thickness();
  layer.lower_elevation_ = layer_pb.lower_elevation();
  layer.is_negative_ = layer_pb.is_negative();
  if (layer_pb.has_etch_factor()) {
    layer.etch_factor_ = layer_pb.etch_factor();
  }
  const ::layup::proto::Roughness &roughness_pb = layer_pb.roughness();
  layer.roughness_.enabled = roughness_pb.enabled();
  layer.roughness_.top = SurfaceRoughnessFromProto(roughness_pb.top());
  layer.roughness_.bottom = SurfaceRoughnessFromProto(roughness_pb.bottom());
  layer.roughness_.side = SurfaceRoughnessFromProto(roughness_pb.side());
  layer.top_bottom_association_ = *association;
  if (layer_pb.has_via_references()) {
    layer.via_references_ = ViaReferences {
        .upper = layer_pb.via_references().upper(),
        .lower = layer_pb.via_references().lower()
    };
  }
  return layer;
}

std::ostream &operator<<(std::ostream &os, const StackupLayer &layer) {
  os << layer.Describe();
  return os;
}

}  // namespace layup
