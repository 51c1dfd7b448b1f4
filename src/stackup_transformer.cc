#include "stackup_transformer.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "component.h"
#include "geometry/placement.h"
#include "geometry/point.h"
#include "geometry/radian.h"
#include "layer_collection.h"
#include "layer_type.h"
#include "layout.h"
#include "padstack_instance.h"
#include "stackup_layer.h"

namespace layup {

using geometry::Point;
using geometry::Radian;

namespace {

typedef std::pair<const StackupLayer*, const StackupLayer*> TopAndBottom;

std::optional<TopAndBottom> SignalFaces(const LayerCollection &collection) {
  return collection.TopBottomStackupLayers(LayerType::kSignal);
}

// What a placement may change in one layout: the layer collection and the
// components and padstack instances a flip rewrites.
class LayoutSnapshot {
 public:
  explicit LayoutSnapshot(Layout *layout)
      : layout_(layout),
        collection_(layout->GetLayerCollection()) {
    for (const auto &entry : layout->components()) {
      components_.push_back(*entry.second);
    }
    for (const auto &entry : layout->padstack_instances()) {
      padstacks_.push_back(*entry.second);
    }
  }

  void Restore() const {
    layout_->SetLayerCollection(collection_);
    for (const Component &component : components_) {
      Component *live = layout_->FindComponent(component.name());
      LOG_IF(FATAL, live == nullptr)
          << "Component " << component.name() << " vanished mid-transform";
      *live = component;
    }
    for (const PadstackInstance &instance : padstacks_) {
      PadstackInstance *live = layout_->FindPadstackInstance(instance.id());
      LOG_IF(FATAL, live == nullptr)
          << "Padstack instance " << instance.id()
          << " vanished mid-transform";
      *live = instance;
    }
  }

 private:
  Layout *layout_;
  std::shared_ptr<const LayerCollection> collection_;
  std::vector<Component> components_;
  std::vector<PadstackInstance> padstacks_;
};

}  // namespace

const char *StackupTransformerStateName(StackupTransformer::State state) {
  switch (state) {
    case StackupTransformer::State::kIdle:
      return "idle";
    case StackupTransformer::State::kValidatingStack:
      return "validating stack";
    case StackupTransformer::State::kRebuildingElevations:
      return "rebuilding elevations";
    case StackupTransformer::State::kRemappingVias:
      return "remapping vias";
    case StackupTransformer::State::kRemappingComponents:
      return "remapping components";
    case StackupTransformer::State::kRemappingPadstacks:
      return "remapping padstacks";
    case StackupTransformer::State::kCommitted:
      return "committed";
    case StackupTransformer::State::kAborted:
      return "aborted";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os,
                         const StackupTransformer::State &state) {
  os << StackupTransformerStateName(state);
  return os;
}

StackupTransformer::StackupTransformer(
    PhysicalPropertiesDatabase *physical_db, Cell *cell)
    : physical_db_(physical_db),
      cell_(cell),
      stackup_(physical_db, cell->layout()),
      state_(State::kIdle) {
  LOG_IF(FATAL, cell->layout() == nullptr)
      << "Cell " << cell->name() << " has no layout to transform";
}

void StackupTransformer::Transition(State next) {
  VLOG(1) << cell_->name() << ": " << state_ << " -> " << next;
  state_ = next;
}

absl::Status StackupTransformer::Abort(const absl::Status &reason) {
  Transition(State::kAborted);
  LOG(WARNING) << "Transform of " << cell_->name() << " aborted: " << reason;
  return absl::AbortedError(
      absl::StrCat(cell_->name(), ": ", reason.message()));
}

absl::Status StackupTransformer::FlipDesign() {
  Transition(State::kValidatingStack);
  std::shared_ptr<const LayerCollection> original = stackup_.collection();
  if (original->stackup_layers().empty()) {
    return Abort(absl::FailedPreconditionError("No stackup layers to flip"));
  }
  absl::Status status = original->CheckElevationOrder();
  if (!status.ok())
    return Abort(status);

  Transition(State::kRebuildingElevations);
  double max_elevation = 0.0;
  for (const StackupLayer &layer : original->stackup_layers()) {
    if (absl::StrContains(layer.name(), kRadBoxMarker))
      continue;
    max_elevation = std::max({max_elevation,
                              layer.lower_elevation(),
                              layer.UpperElevation()});
  }

  // The flipped layers are placed by elevation and the original mode is
  // restored once they are all in.
  LayerCollection flipped(StackupMode::kOverlapping);
  for (const StackupLayer &layer : original->stackup_layers()) {
    if (layer.IsViaLayer())
      continue;
    StackupLayer copy = layer;
    if (!absl::StrContains(layer.name(), kRadBoxMarker)) {
      copy.set_lower_elevation(max_elevation - layer.UpperElevation());
      copy.set_top_bottom_association(
          Toggled(layer.top_bottom_association()));
    }
    status = flipped.AddStackupLayerAtElevation(copy);
    if (!status.ok())
      return Abort(status);
  }

  Transition(State::kRemappingVias);
  for (const StackupLayer &layer : original->stackup_layers()) {
    if (!layer.IsViaLayer())
      continue;
    const ViaReferences &references = *layer.via_references();
    const StackupLayer *former_upper = flipped.FindLayer(references.upper);
    if (!former_upper) {
      return Abort(absl::NotFoundError(absl::StrCat(
          "Via layer \"", layer.name(), "\" refers to missing layer \"",
          references.upper, "\"")));
    }
    StackupLayer copy = layer;
    copy.set_via_references(ViaReferences {
        .upper = references.lower,
        .lower = references.upper
    });
    copy.set_lower_elevation(former_upper->UpperElevation());
    copy.set_top_bottom_association(Toggled(layer.top_bottom_association()));
    status = flipped.AddStackupLayerAtElevation(copy);
    if (!status.ok())
      return Abort(status);
  }
  for (const StackupLayer &layer : original->non_stackup_layers()) {
    status = flipped.AddNonStackupLayer(layer);
    if (!status.ok())
      return Abort(status);
  }
  flipped.SetMode(original->mode());

  Layout *layout = cell_->layout();

  Transition(State::kRemappingComponents);
  std::vector<std::pair<Component*, Component>> components;
  for (const auto &entry : layout->components()) {
    Component copy = *entry.second;
    if (copy.solder_ball()) {
      copy.solder_ball()->placement =
          Component::Flipped(copy.solder_ball()->placement);
    }
    if (copy.type() == ComponentType::kIC) {
      copy.set_die_orientation(Component::Flipped(copy.die_orientation()));
    }
    components.emplace_back(entry.second.get(), copy);
  }

  Transition(State::kRemappingPadstacks);
  std::map<std::string, size_t> position;
  for (size_t i = 0; i < flipped.stackup_layers().size(); ++i) {
    position[flipped.stackup_layers()[i].name()] = i;
  }
  std::vector<std::pair<PadstackInstance*, PadstackInstance>> padstacks;
  for (const auto &entry : layout->padstack_instances()) {
    const PadstackInstance &instance = *entry.second;
    if (instance.start_layer().empty() || instance.stop_layer().empty())
      continue;
    auto start = position.find(instance.start_layer());
    auto stop = position.find(instance.stop_layer());
    if (start == position.end() || stop == position.end()) {
      return Abort(absl::NotFoundError(absl::StrCat(
          "Padstack instance ", instance.id(), " spans ",
          instance.start_layer(), " to ", instance.stop_layer(),
          ", which are not both stackup layers")));
    }
    // The start layer is the upper one.
    PadstackInstance copy = instance;
    if (start->second > stop->second) {
      copy.set_start_layer(instance.stop_layer());
      copy.set_stop_layer(instance.start_layer());
    }
    padstacks.emplace_back(entry.second.get(), copy);
  }

  stackup_.Commit(flipped);
  for (auto &entry : components) {
    *entry.first = entry.second;
  }
  for (auto &entry : padstacks) {
    *entry.first = entry.second;
  }
  Transition(State::kCommitted);
  LOG(INFO) << "Flipped " << cell_->name() << ": "
            << flipped.stackup_layers().size() << " stackup layers, "
            << components.size() << " components, "
            << padstacks.size() << " padstack instances";
  return absl::OkStatus();
}

absl::Status StackupTransformer::AdjustSolderDielectrics() {
  std::vector<StackupLayer> layers = stackup_.StackupLayers();
  std::vector<StackupLayer> signal_layers = stackup_.SignalLayers();
  if (layers.empty())
    return absl::OkStatus();

  double top_air = 0.0;
  double bottom_air = 0.0;
  double top_dielectric = 0.0;
  double bottom_dielectric = 0.0;
  for (const auto &entry : cell_->layout()->components()) {
    const Component &component = *entry.second;
    double height = component.SolderBallHeight();
    if (height <= 0.0)
      continue;
    const std::string &layer = component.placement_layer();
    if (layer == layers.front().name()) {
      top_air = std::max(top_air, height);
    } else if (layer == layers.back().name()) {
      bottom_air = std::max(bottom_air, height);
    } else if (!signal_layers.empty() &&
               layer == signal_layers.front().name()) {
      top_dielectric = std::max(top_dielectric, height);
    } else if (!signal_layers.empty() &&
               layer == signal_layers.back().name()) {
      bottom_dielectric = std::max(bottom_dielectric, height);
    }
  }

  auto add_or_grow_air = [&](const std::string &name,
                             InsertionMethod method,
                             double height) -> absl::Status {
    std::optional<StackupLayer> existing = stackup_.FindLayer(name);
    if (existing) {
      if (existing->thickness() >= height)
        return absl::OkStatus();
      existing->set_thickness(height);
      return stackup_.UpdateLayer(*existing);
    }
    Stackup::LayerParameters parameters;
    parameters.method = method;
    parameters.type = LayerType::kDielectric;
    parameters.material = "air";
    parameters.thickness = height;
    absl::StatusOr<StackupLayer> added = stackup_.AddLayer(name, parameters);
    return added.status();
  };
  auto resize = [&](StackupLayer layer, double height) -> absl::Status {
    if (!layer.IsDielectric()) {
      return absl::FailedPreconditionError(absl::StrCat(
          "Outermost layer \"", layer.name(), "\" is not a dielectric"));
    }
    layer.set_thickness(height);
    return stackup_.UpdateLayer(layer);
  };

  absl::Status status;
  if (top_air > 0.0) {
    status = add_or_grow_air(kTopAirLayer, InsertionMethod::kAddOnTop, top_air);
    if (!status.ok())
      return status;
  }
  if (bottom_air > 0.0) {
    status = add_or_grow_air(
        kBottomAirLayer, InsertionMethod::kAddOnBottom, bottom_air);
    if (!status.ok())
      return status;
  }
  if (top_dielectric > 0.0) {
    status = resize(layers.front(), top_dielectric);
    if (!status.ok())
      return status;
  }
  if (bottom_dielectric > 0.0) {
    status = resize(layers.back(), bottom_dielectric);
    if (!status.ok())
      return status;
  }
  VLOG(1) << "Solder dielectrics of " << cell_->name() << ": top air "
          << top_air << ", bottom air " << bottom_air << ", top dielectric "
          << top_dielectric << ", bottom dielectric " << bottom_dielectric;
  return absl::OkStatus();
}

absl::Status StackupTransformer::PlaceInLayout(Cell *target,
                                               double angle_degrees,
                                               double offset_x,
                                               double offset_y,
                                               bool flipped,
                                               bool place_on_top) {
  Transition(State::kValidatingStack);
  if (target == nullptr || target->layout() == nullptr) {
    return Abort(absl::InvalidArgumentError("No target layout"));
  }
  if (target == cell_) {
    return Abort(absl::InvalidArgumentError(
        "A cell cannot be placed inside itself"));
  }
  if (!SignalFaces(*target->layout()->GetLayerCollection())) {
    return Abort(absl::FailedPreconditionError(absl::StrCat(
        "Target ", target->name(), " has no signal layers")));
  }

  // Each step below installs its own result, so a failure part way through
  // puts both layouts back as they were.
  LayoutSnapshot source_before(cell_->layout());
  LayoutSnapshot target_before(target->layout());
  auto roll_back = [&](const absl::Status &reason) {
    source_before.Restore();
    target_before.Restore();
    return Abort(reason);
  };

  absl::Status status = AdjustSolderDielectrics();
  if (!status.ok())
    return roll_back(status);

  // Placing on the bottom is done by turning the target over and placing on
  // its (new) top.
  if (!place_on_top) {
    StackupTransformer target_transformer(physical_db_, target);
    status = target_transformer.FlipDesign();
    if (!status.ok())
      return roll_back(status);
    if (!flipped) {
      status = FlipDesign();
      if (!status.ok())
        return roll_back(status);
    }
  } else if (flipped) {
    status = FlipDesign();
    if (!status.ok())
      return roll_back(status);
  }

  status = stackup_.RefreshLayerCollection();
  if (!status.ok())
    return roll_back(status);

  std::optional<TopAndBottom> target_faces =
      SignalFaces(*target->layout()->GetLayerCollection());

  cell_->set_is_black_box(true);
  CellInstance instance(cell_->name(), cell_);
  instance.set_placement(geometry::Placement(
      Radian::DegreesToRadians(angle_degrees),
      Point(physical_db_->ToInternalUnits(offset_x),
            physical_db_->ToInternalUnits(offset_y)),
      flipped));
  instance.set_placement_layer(target_faces->first->name());
  CellInstance *placed = target->layout()->AddCellInstance(instance);

  Transition(State::kCommitted);
  LOG(INFO) << "Placed " << *placed << " in " << target->name();
  return absl::OkStatus();
}

double StackupTransformer::SolderHeightOn(const std::string &layer) const {
  double height = 0.0;
  for (const auto &entry : cell_->layout()->components()) {
    if (entry.second->placement_layer() == layer) {
      height = std::max(height, entry.second->SolderBallHeight());
    }
  }
  return height;
}

void StackupTransformer::RemoveSolderPec(const std::string &layer) {
  for (const auto &entry : cell_->layout()->components()) {
    Component *component = entry.second.get();
    if (component->SolderBallHeight() <= 0.0 ||
        component->placement_layer() != layer) {
      continue;
    }
    component->set_port_reference_size(PortReferenceSize {
        .auto_size = false,
        .width = 0.0,
        .height = 0.0
    });
    VLOG(2) << "Removed solder PEC from " << component->name();
  }
}

double StackupTransformer::InferSolderHeight(
    bool from_bottom, std::vector<std::string> *face_layers) const {
  std::vector<StackupLayer> signal_layers = stackup_.SignalLayers();
  std::stable_sort(signal_layers.begin(), signal_layers.end(),
                   [&](const StackupLayer &lhs, const StackupLayer &rhs) {
    return from_bottom ?
        lhs.UpperElevation() < rhs.UpperElevation() :
        lhs.UpperElevation() > rhs.UpperElevation();
  });

  std::optional<double> face;
  double height = 0.0;
  for (const StackupLayer &layer : signal_layers) {
    double elevation = from_bottom ?
        layer.lower_elevation() : layer.UpperElevation();
    if (!face) {
      face = elevation;
    } else if (from_bottom ? elevation > *face : elevation < *face) {
      break;
    }
    height = std::max(height, SolderHeightOn(layer.name()));
    face_layers->push_back(layer.name());
  }
  return height;
}

absl::Status StackupTransformer::PlaceInLayout3D(Cell *target,
                                                 double angle_degrees,
                                                 double offset_x,
                                                 double offset_y,
                                                 bool flipped,
                                                 bool place_on_top,
                                                 double solder_height) {
  Transition(State::kValidatingStack);
  if (target == nullptr || target->layout() == nullptr) {
    return Abort(absl::InvalidArgumentError("No target layout"));
  }
  if (target == cell_) {
    return Abort(absl::InvalidArgumentError(
        "A cell cannot be placed inside itself"));
  }
  std::optional<TopAndBottom> target_faces =
      SignalFaces(*target->layout()->GetLayerCollection());
  if (!target_faces) {
    return Abort(absl::FailedPreconditionError(absl::StrCat(
        "Target ", target->name(), " has no signal layers")));
  }
  std::shared_ptr<const LayerCollection> source = stackup_.collection();
  std::optional<TopAndBottom> source_faces = SignalFaces(*source);
  if (!source_faces) {
    return Abort(absl::FailedPreconditionError("No signal layers to place"));
  }

  std::vector<std::string> solder_faces;
  if (solder_height <= 0.0) {
    // The face that meets the target.
    bool from_bottom = flipped != place_on_top;
    solder_height = InferSolderHeight(from_bottom, &solder_faces);
  }

  double target_top = target_faces->first->UpperElevation();
  double target_bottom = target_faces->second->lower_elevation();
  double source_top = source_faces->first->UpperElevation();
  double source_bottom = source_faces->second->lower_elevation();

  double elevation;
  if (place_on_top && flipped) {
    elevation = target_top + source_top;
  } else if (place_on_top) {
    elevation = target_top - source_bottom;
  } else if (flipped) {
    elevation = target_bottom + source_bottom;
    solder_height = -solder_height;
  } else {
    elevation = target_bottom - source_top;
    solder_height = -solder_height;
  }

  double angle = Radian::DegreesToRadians(angle_degrees);
  geometry::Transform3D transform = {
      .origin = {0.0, 0.0, 0.0},
      .axis_from = {1.0, 0.0, 0.0},
      .axis_to = {std::cos(angle), -std::sin(angle), 0.0},
      .rotation_radians = flipped ? Radian::kPi : 0.0,
      .translation = {offset_x, offset_y, elevation + solder_height}
  };

  absl::Status status = stackup_.RefreshLayerCollection();
  if (!status.ok())
    return Abort(status);

  for (const std::string &layer : solder_faces) {
    RemoveSolderPec(layer);
  }
  cell_->set_is_black_box(true);
  CellInstance instance(cell_->name(), cell_);
  instance.set_placement_layer(place_on_top ?
      target_faces->first->name() : target_faces->second->name());
  instance.set_transform_3d(transform);
  CellInstance *placed = target->layout()->AddCellInstance(instance);
  Transition(State::kCommitted);
  LOG(INFO) << "Placed " << *placed << " in " << target->name()
            << " with " << transform.Describe();
  return absl::OkStatus();
}

absl::StatusOr<CellInstance*> StackupTransformer::PlaceComponent3D(
    const std::string &model_name,
    double angle_degrees,
    double offset_x,
    double offset_y,
    bool place_on_top) {
  Transition(State::kValidatingStack);
  if (model_name.empty()) {
    return Abort(absl::InvalidArgumentError("3D models must be named"));
  }
  std::optional<TopAndBottom> faces = SignalFaces(*stackup_.collection());
  if (!faces) {
    return Abort(absl::FailedPreconditionError(
        "No signal layers to place a 3D model on"));
  }

  double angle = Radian::DegreesToRadians(angle_degrees);
  double elevation = place_on_top ?
      faces->first->UpperElevation() : faces->second->lower_elevation();
  geometry::Transform3D transform = {
      .origin = {0.0, 0.0, 0.0},
      .axis_from = {1.0, 0.0, 0.0},
      .axis_to = {std::cos(angle), -std::sin(angle), 0.0},
      .rotation_radians = place_on_top ? 0.0 : Radian::kPi,
      .translation = {offset_x, offset_y, elevation}
  };

  CellInstance instance;
  instance.set_name(model_name);
  instance.set_model_name(model_name);
  instance.set_placement_layer(place_on_top ?
      faces->first->name() : faces->second->name());
  instance.set_transform_3d(transform);
  absl::Status status = stackup_.RefreshLayerCollection();
  if (!status.ok())
    return Abort(status);
  CellInstance *placed = cell_->layout()->AddCellInstance(instance);
  Transition(State::kCommitted);
  return placed;
}

}  // namespace layup
