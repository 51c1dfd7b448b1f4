#include "layer_collection.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace layup {

namespace {

// Elevations are sums of thicknesses in metres. Anything closer than a
// picometre is the same elevation.
constexpr double kElevationTolerance = 1e-12;

}  // namespace

absl::StatusOr<StackupMode> ParseStackupMode(const std::string &name) {
  std::string lower = absl::AsciiStrToLower(name);
  if (lower == "laminate")
    return StackupMode::kLaminate;
  if (lower == "overlapping")
    return StackupMode::kOverlapping;
  if (lower == "multizone")
    return StackupMode::kMultiZone;
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown stackup mode: \"", name, "\""));
}

const char *StackupModeName(StackupMode mode) {
  switch (mode) {
    case StackupMode::kLaminate:
      return "Laminate";
    case StackupMode::kOverlapping:
      return "Overlapping";
    case StackupMode::kMultiZone:
      return "MultiZone";
  }
  return "Laminate";
}

std::ostream &operator<<(std::ostream &os, const StackupMode &mode) {
  os << StackupModeName(mode);
  return os;
}

void LayerCollection::SetMode(StackupMode mode) {
  mode_ = mode;
  Normalise();
}

absl::Status LayerCollection::CheckCanAdd(const StackupLayer &layer) const {
  if (layer.name().empty()) {
    return absl::InvalidArgumentError("Layers must be named");
  }
  if (HasLayer(layer.name())) {
    return absl::AlreadyExistsError(
        absl::StrCat("Layer \"", layer.name(), "\" already exists"));
  }
  return absl::OkStatus();
}

absl::Status LayerCollection::InsertStackupLayerAt(
    size_t index, const StackupLayer &layer) {
  absl::Status status = CheckCanAdd(layer);
  if (!status.ok())
    return status;
  LOG_IF(FATAL, index > stackup_layers_.size())
      << "Insertion index " << index << " is beyond the end of the stackup";
  stackup_layers_.insert(stackup_layers_.begin() + index, layer);
  Normalise();
  VLOG(3) << "Inserted " << layer << " at " << index;
  return absl::OkStatus();
}

absl::Status LayerCollection::AddLayerTop(const StackupLayer &layer) {
  if (!layer.IsStackupLayer())
    return AddNonStackupLayer(layer);
  StackupLayer copy = layer;
  if (!IsLaminate()) {
    double top = 0.0;
    for (const StackupLayer &existing : stackup_layers_) {
      top = std::max(top, existing.UpperElevation());
    }
    copy.set_lower_elevation(top);
  }
  return InsertStackupLayerAt(0, copy);
}

absl::Status LayerCollection::AddLayerBottom(const StackupLayer &layer) {
  if (!layer.IsStackupLayer())
    return AddNonStackupLayer(layer);
  StackupLayer copy = layer;
  if (!IsLaminate() && !stackup_layers_.empty()) {
    double bottom = stackup_layers_.front().lower_elevation();
    for (const StackupLayer &existing : stackup_layers_) {
      bottom = std::min(bottom, existing.lower_elevation());
    }
    copy.set_lower_elevation(bottom - copy.thickness());
  }
  return InsertStackupLayerAt(stackup_layers_.size(), copy);
}

absl::Status LayerCollection::AddLayerAbove(const StackupLayer &layer,
                                            const std::string &base_layer) {
  std::optional<size_t> base_index = StackupIndexOf(base_layer);
  if (!base_index) {
    return absl::NotFoundError(
        absl::StrCat("No stackup layer named \"", base_layer, "\""));
  }
  StackupLayer copy = layer;
  if (!IsLaminate()) {
    copy.set_lower_elevation(
        stackup_layers_[*base_index].UpperElevation());
  }
  return InsertStackupLayerAt(*base_index, copy);
}

absl::Status LayerCollection::AddLayerBelow(const StackupLayer &layer,
                                            const std::string &base_layer) {
  std::optional<size_t> base_index = StackupIndexOf(base_layer);
  if (!base_index) {
    return absl::NotFoundError(
        absl::StrCat("No stackup layer named \"", base_layer, "\""));
  }
  StackupLayer copy = layer;
  if (!IsLaminate()) {
    copy.set_lower_elevation(
        stackup_layers_[*base_index].lower_elevation() - copy.thickness());
  }
  return InsertStackupLayerAt(*base_index + 1, copy);
}

absl::Status LayerCollection::AddStackupLayerAtElevation(
    const StackupLayer &layer) {
  if (!layer.IsStackupLayer()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Layer \"", layer.name(), "\" is not a stackup layer"));
  }
  // After every layer at or above the new one.
  size_t index = 0;
  while (index < stackup_layers_.size() &&
         stackup_layers_[index].lower_elevation() >=
             layer.lower_elevation() - kElevationTolerance) {
    ++index;
  }
  return InsertStackupLayerAt(index, layer);
}

absl::Status LayerCollection::AddNonStackupLayer(const StackupLayer &layer) {
  absl::Status status = CheckCanAdd(layer);
  if (!status.ok())
    return status;
  if (layer.IsStackupLayer()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Layer \"", layer.name(), "\" is a stackup layer"));
  }
  non_stackup_layers_.push_back(layer);
  return absl::OkStatus();
}

absl::Status LayerCollection::ReplaceLayer(const std::string &name,
                                           const StackupLayer &layer) {
  if (layer.name() != name && HasLayer(layer.name())) {
    return absl::AlreadyExistsError(
        absl::StrCat("Cannot rename \"", name, "\" to \"", layer.name(),
                     "\": a layer with that name exists"));
  }
  auto match = [&](const StackupLayer &existing) {
    return existing.name() == name;
  };
  for (std::vector<StackupLayer> *group :
           {&stackup_layers_, &non_stackup_layers_}) {
    auto it = std::find_if(group->begin(), group->end(), match);
    if (it == group->end())
      continue;
    if (it->IsStackupLayer() != layer.IsStackupLayer()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Layer \"", name, "\" cannot change between stackup "
                       "and non-stackup in place"));
    }
    *it = layer;
    Normalise();
    return absl::OkStatus();
  }
  return absl::NotFoundError(absl::StrCat("No layer named \"", name, "\""));
}

absl::Status LayerCollection::MoveLayerAbove(const std::string &name,
                                             const std::string &base_layer) {
  if (name == base_layer) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot move \"", name, "\" relative to itself"));
  }
  std::optional<size_t> index = StackupIndexOf(name);
  if (!index) {
    return absl::NotFoundError(
        absl::StrCat("No stackup layer named \"", name, "\""));
  }
  if (!StackupIndexOf(base_layer)) {
    return absl::NotFoundError(
        absl::StrCat("No stackup layer named \"", base_layer, "\""));
  }
  StackupLayer layer = stackup_layers_[*index];
  stackup_layers_.erase(stackup_layers_.begin() + *index);

  // The base has possibly shifted up by one.
  size_t base_index = *StackupIndexOf(base_layer);
  if (!IsLaminate()) {
    layer.set_lower_elevation(
        stackup_layers_[base_index].UpperElevation());
  }
  stackup_layers_.insert(stackup_layers_.begin() + base_index, layer);
  Normalise();
  return absl::OkStatus();
}

bool LayerCollection::RemoveLayer(const std::string &name) {
  auto match = [&](const StackupLayer &existing) {
    return existing.name() == name;
  };
  for (std::vector<StackupLayer> *group :
           {&stackup_layers_, &non_stackup_layers_}) {
    auto it = std::find_if(group->begin(), group->end(), match);
    if (it == group->end())
      continue;
    group->erase(it);
    Normalise();
    return true;
  }
  return false;
}

std::vector<StackupLayer> LayerCollection::Layers() const {
  std::vector<StackupLayer> layers(stackup_layers_);
  layers.insert(layers.end(),
                non_stackup_layers_.begin(),
                non_stackup_layers_.end());
  return layers;
}

const StackupLayer *LayerCollection::FindLayer(const std::string &name) const {
  for (const std::vector<StackupLayer> *group :
           {&stackup_layers_, &non_stackup_layers_}) {
    for (const StackupLayer &layer : *group) {
      if (layer.name() == name)
        return &layer;
    }
  }
  return nullptr;
}

std::optional<size_t> LayerCollection::StackupIndexOf(
    const std::string &name) const {
  for (size_t i = 0; i < stackup_layers_.size(); ++i) {
    if (stackup_layers_[i].name() == name)
      return i;
  }
  return std::nullopt;
}

std::optional<std::pair<const StackupLayer*, const StackupLayer*>>
LayerCollection::TopBottomStackupLayers(
    const std::optional<LayerType> &type) const {
  const StackupLayer *top = nullptr;
  const StackupLayer *bottom = nullptr;
  for (const StackupLayer &layer : stackup_layers_) {
    if (type && layer.type() != *type)
      continue;
    if (!top)
      top = &layer;
    bottom = &layer;
  }
  if (!top)
    return std::nullopt;
  return std::make_pair(top, bottom);
}

absl::Status LayerCollection::CheckElevationOrder() const {
  for (size_t i = stackup_layers_.size(); i > 1; --i) {
    const StackupLayer &below = stackup_layers_[i - 1];
    const StackupLayer &above = stackup_layers_[i - 2];
    if (above.lower_elevation() <
            below.lower_elevation() - kElevationTolerance) {
      return absl::FailedPreconditionError(absl::StrFormat(
          "Layer \"%s\" (z=%g) is ordered above \"%s\" (z=%g) but sits lower",
          above.name(), above.lower_elevation(),
          below.name(), below.lower_elevation()));
    }
  }
  return absl::OkStatus();
}

void LayerCollection::Normalise() {
  if (IsLaminate()) {
    RecomputeLaminateElevations();
  } else {
    SortByElevation();
  }
}

void LayerCollection::RecomputeLaminateElevations() {
  // A via layer is only placed by its references if both exist and are not
  // themselves via layers; otherwise it stacks like any other layer.
  auto resolved_references = [&](const StackupLayer &layer)
      -> std::optional<std::pair<size_t, size_t>> {
    if (!layer.IsViaLayer())
      return std::nullopt;
    std::optional<size_t> upper = StackupIndexOf(layer.via_references()->upper);
    std::optional<size_t> lower = StackupIndexOf(layer.via_references()->lower);
    if (!upper || !lower ||
        stackup_layers_[*upper].IsViaLayer() ||
        stackup_layers_[*lower].IsViaLayer()) {
      return std::nullopt;
    }
    return std::make_pair(*upper, *lower);
  };

  std::vector<StackupLayer> vias;
  std::vector<StackupLayer> stack;
  for (const StackupLayer &layer : stackup_layers_) {
    if (resolved_references(layer)) {
      vias.push_back(layer);
    } else {
      stack.push_back(layer);
    }
  }

  double elevation = 0.0;
  for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
    it->set_lower_elevation(elevation);
    elevation += it->thickness();
  }
  stackup_layers_ = stack;

  // Each via goes directly above its lower reference.
  for (StackupLayer &via : vias) {
    const StackupLayer &upper =
        stackup_layers_[*StackupIndexOf(via.via_references()->upper)];
    size_t lower_index = *StackupIndexOf(via.via_references()->lower);
    const StackupLayer &lower = stackup_layers_[lower_index];
    via.set_lower_elevation(lower.UpperElevation());
    via.set_thickness(
        std::max(0.0, upper.lower_elevation() - lower.UpperElevation()));
    stackup_layers_.insert(stackup_layers_.begin() + lower_index, via);
  }
}

void LayerCollection::SortByElevation() {
  std::stable_sort(
      stackup_layers_.begin(), stackup_layers_.end(),
      [](const StackupLayer &lhs, const StackupLayer &rhs) {
        return lhs.lower_elevation() >
            rhs.lower_elevation() + kElevationTolerance;
      });
}

std::string LayerCollection::Describe() const {
  std::stringstream ss;
  ss << "LayerCollection (" << mode_ << ", " << size() << " layers)"
     << std::endl;
  for (const StackupLayer &layer : stackup_layers_) {
    ss << "  " << layer << std::endl;
  }
  for (const StackupLayer &layer : non_stackup_layers_) {
    ss << "  " << layer << std::endl;
  }
  return ss.str();
}

::layup::proto::StackupDefinition LayerCollection::ToProto() const {
  ::layup::proto::StackupDefinition stackup_pb;
  stackup_pb.set_mode(StackupModeName(mode_));
  for (const StackupLayer &layer : stackup_layers_) {
    *stackup_pb.add_layers() = layer.ToProto();
  }
  for (const StackupLayer &layer : non_stackup_layers_) {
    *stackup_pb.add_non_stackup_layers() = layer.ToProto();
  }
  return stackup_pb;
}

absl::StatusOr<LayerCollection> LayerCollection::FromProto(
    const ::layup::proto::StackupDefinition &stackup_pb) {
  StackupMode mode = StackupMode::kLaminate;
  if (!stackup_pb.mode().empty()) {
    absl::StatusOr<StackupMode> parsed = ParseStackupMode(stackup_pb.mode());
    if (!parsed.ok())
      return parsed.status();
    mode = *parsed;
  }

  LayerCollection collection(mode);
  for (const auto &layer_pb : stackup_pb.layers()) {
    absl::StatusOr<StackupLayer> layer = StackupLayer::FromProto(layer_pb);
    if (!layer.ok())
      return layer.status();
    if (!layer->IsStackupLayer()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Layer \"", layer->name(),
                       "\" is listed with the stackup layers but has type ",
                       LayerTypeName(layer->type())));
    }
    absl::Status status = collection.IsLaminate() ?
        collection.AddLayerBottom(*layer) :
        collection.AddStackupLayerAtElevation(*layer);
    if (!status.ok())
      return status;
  }
  for (const auto &layer_pb : stackup_pb.non_stackup_layers()) {
    absl::StatusOr<StackupLayer> layer = StackupLayer::FromProto(layer_pb);
    if (!layer.ok())
      return layer.status();
    absl::Status status = collection.AddNonStackupLayer(*layer);
    if (!status.ok())
      return status;
  }
  return collection;
}

std::ostream &operator<<(std::ostream &os, const LayerCollection &collection) {
  os << collection.Describe();
  return os;
}

}  // namespace layup
