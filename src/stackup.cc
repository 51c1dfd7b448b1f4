#include "stackup.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "geometry/rectangle.h"
#include "geometry/region.h"

namespace layup {

absl::StatusOr<InsertionMethod> ParseInsertionMethod(const std::string &name) {
  static const std::map<std::string, InsertionMethod> kMethods = {
      {"add_on_top", InsertionMethod::kAddOnTop},
      {"add_on_bottom", InsertionMethod::kAddOnBottom},
      {"insert_above", InsertionMethod::kInsertAbove},
      {"insert_below", InsertionMethod::kInsertBelow},
      {"add_at_elevation", InsertionMethod::kAddAtElevation}
  };
  auto it = kMethods.find(absl::AsciiStrToLower(name));
  if (it == kMethods.end()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown insertion method: \"", name, "\""));
  }
  return it->second;
}

std::shared_ptr<const LayerCollection> Stackup::collection() const {
  uint64_t generation = layout_->layer_collection_generation();
  if (!cached_collection_ || generation != cached_generation_) {
    cached_collection_ = layout_->GetLayerCollection();
    cached_generation_ = generation;
  }
  return cached_collection_;
}

void Stackup::Commit(const LayerCollection &collection) {
  layout_->SetLayerCollection(
      std::make_shared<const LayerCollection>(collection));
  cached_collection_.reset();
  VLOG(2) << "Installed layer collection:" << std::endl << collection;
}

std::string Stackup::ResolveMaterial(const std::string &name) const {
  auto material = physical_db_->FindMaterial(name);
  if (!material) {
    LOG(WARNING) << "Material \"" << name << "\" is not in the material "
                 << "library; keeping the name";
    return name;
  }
  const std::string &canonical = material->get().name;
  if (canonical != name) {
    LOG(WARNING) << "Material \"" << name << "\" not found; using \""
                 << canonical << "\"";
  }
  return canonical;
}

absl::StatusOr<StackupLayer> Stackup::AddLayer(
    const std::string &name, const LayerParameters &parameters) {
  LayerCollection copy = *collection();
  absl::StatusOr<StackupLayer> added = AddLayerTo(&copy, name, parameters);
  if (!added.ok())
    return added.status();
  Commit(copy);
  return added;
}

absl::StatusOr<StackupLayer> Stackup::AddLayerTo(
    LayerCollection *collection,
    const std::string &name,
    const LayerParameters &parameters) const {
  if (collection->HasLayer(name)) {
    return absl::AlreadyExistsError(
        absl::StrCat("Layer \"", name, "\" already exists"));
  }

  const LayerTypeInfo &info = GetLayerTypeInfo(parameters.type);

  StackupLayer layer(name, parameters.type);
  std::string material = parameters.material.empty() ?
      info.default_material : parameters.material;
  if (!material.empty()) {
    layer.set_material(ResolveMaterial(material));
  }
  if (info.has_fill_material) {
    layer.set_fill_material(ResolveMaterial(
        parameters.fill_material.empty() ?
            "fr4_epoxy" : parameters.fill_material));
  }
  layer.set_thickness(parameters.thickness);
  layer.set_etch_factor(parameters.etch_factor);
  layer.set_is_negative(parameters.is_negative);
  layer.roughness().enabled = parameters.enable_roughness;

  absl::Status status;
  if (!layer.IsStackupLayer()) {
    status = ApplyTo(collection, layer, StackupOperation::kNonStackup);
  } else {
    switch (parameters.method) {
      case InsertionMethod::kAddOnTop:
        status = ApplyTo(collection, layer, StackupOperation::kAddOnTop);
        break;
      case InsertionMethod::kAddOnBottom:
        status = ApplyTo(collection, layer, StackupOperation::kAddOnBottom);
        break;
      case InsertionMethod::kInsertAbove:
      case InsertionMethod::kInsertBelow: {
        if (!parameters.base_layer) {
          return absl::InvalidArgumentError(absl::StrCat(
              "Inserting layer \"", name, "\" relative to another layer "
              "needs a base layer"));
        }
        StackupOperation operation =
            parameters.method == InsertionMethod::kInsertAbove ?
                StackupOperation::kInsertAbove :
                StackupOperation::kInsertBelow;
        status = ApplyTo(collection, layer, operation,
                         *parameters.base_layer);
        break;
      }
      case InsertionMethod::kAddAtElevation:
        if (collection->mode() != StackupMode::kOverlapping) {
          return absl::FailedPreconditionError(absl::StrCat(
              "Layer \"", name, "\" can only be added at an elevation in "
              "overlapping mode; the stackup is ",
              StackupModeName(collection->mode())));
        }
        if (!parameters.elevation) {
          return absl::InvalidArgumentError(absl::StrCat(
              "No elevation given for layer \"", name, "\""));
        }
        layer.set_lower_elevation(*parameters.elevation);
        status = ApplyTo(collection, layer, StackupOperation::kAddAtElevation);
        break;
    }
  }
  if (!status.ok())
    return status;

  const StackupLayer *added = collection->FindLayer(name);
  LOG_IF(FATAL, !added) << "Layer " << name << " vanished after being added";
  return *added;
}

bool Stackup::RemoveLayer(const std::string &name) {
  LayerCollection copy = *collection();
  if (!copy.RemoveLayer(name))
    return false;
  Commit(copy);
  return true;
}

absl::Status Stackup::UpdateLayer(const StackupLayer &layer) {
  return SetLayoutStackup(layer, StackupOperation::kChangeAttribute);
}

absl::Status Stackup::RenameLayer(const std::string &old_name,
                                  const std::string &new_name) {
  std::optional<StackupLayer> layer = FindLayer(old_name);
  if (!layer) {
    return absl::NotFoundError(
        absl::StrCat("No layer named \"", old_name, "\""));
  }
  if (old_name == new_name)
    return absl::OkStatus();

  layer->set_name(new_name);
  LayerCollection copy = *collection();
  absl::Status status = copy.ReplaceLayer(old_name, *layer);
  if (!status.ok())
    return status;

  // Via layers refer to their neighbours by name.
  for (StackupLayer via : copy.stackup_layers()) {
    if (!via.IsViaLayer())
      continue;
    ViaReferences references = *via.via_references();
    if (references.upper != old_name && references.lower != old_name)
      continue;
    if (references.upper == old_name)
      references.upper = new_name;
    if (references.lower == old_name)
      references.lower = new_name;
    via.set_via_references(references);
    status = copy.ReplaceLayer(via.name(), via);
    if (!status.ok())
      return status;
  }

  Commit(copy);
  size_t changed = layout_->RenameLayerReferences(old_name, new_name);
  VLOG(1) << "Renamed layer " << old_name << " to " << new_name
          << "; updated " << changed << " layout objects";
  return absl::OkStatus();
}

absl::Status Stackup::MoveLayerAbove(const std::string &name,
                                     const std::string &base_layer) {
  std::optional<StackupLayer> layer = FindLayer(name);
  if (!layer) {
    return absl::NotFoundError(absl::StrCat("No layer named \"", name, "\""));
  }
  return SetLayoutStackup(
      *layer, StackupOperation::kChangePosition, base_layer);
}

std::vector<StackupLayer> Stackup::Layers() const {
  return collection()->Layers();
}

std::vector<StackupLayer> Stackup::SignalLayers() const {
  std::vector<StackupLayer> signal_layers;
  for (const StackupLayer &layer : collection()->stackup_layers()) {
    if (layer.IsSignal())
      signal_layers.push_back(layer);
  }
  return signal_layers;
}

std::vector<StackupLayer> Stackup::StackupLayers() const {
  return collection()->stackup_layers();
}

std::vector<StackupLayer> Stackup::NonStackupLayers() const {
  return collection()->non_stackup_layers();
}

std::optional<StackupLayer> Stackup::FindLayer(const std::string &name) const {
  const StackupLayer *layer = collection()->FindLayer(name);
  if (!layer)
    return std::nullopt;
  return *layer;
}

absl::StatusOr<StackupLimits> Stackup::GetStackupLimits(
    bool only_metals) const {
  const StackupLayer *top = nullptr;
  const StackupLayer *bottom = nullptr;
  std::shared_ptr<const LayerCollection> snapshot = collection();
  for (const StackupLayer &layer : snapshot->stackup_layers()) {
    if (only_metals && !layer.IsSignal())
      continue;
    // Ties go to the first layer for the top and the last for the bottom.
    if (!top || layer.lower_elevation() > top->lower_elevation())
      top = &layer;
    if (!bottom || layer.lower_elevation() <= bottom->lower_elevation())
      bottom = &layer;
  }
  if (!top) {
    return absl::NotFoundError(only_metals ?
        "The stackup has no signal layers" : "The stackup has no layers");
  }
  return StackupLimits {
      .top_layer = top->name(),
      .top_elevation = top->lower_elevation(),
      .bottom_layer = bottom->name(),
      .bottom_elevation = bottom->lower_elevation()
  };
}

double Stackup::GetLayoutThickness() const {
  std::shared_ptr<const LayerCollection> snapshot = collection();
  auto top_and_bottom = snapshot->TopBottomStackupLayers();
  if (!top_and_bottom)
    return 0.0;
  return top_and_bottom->first->UpperElevation() -
      top_and_bottom->second->lower_elevation();
}

absl::Status Stackup::CheckElevationOrder() const {
  return collection()->CheckElevationOrder();
}

absl::Status Stackup::RefreshLayerCollection() {
  std::shared_ptr<const LayerCollection> snapshot = collection();
  LayerCollection fresh(snapshot->mode());
  for (const StackupLayer &layer : snapshot->stackup_layers()) {
    absl::Status status = snapshot->IsLaminate() ?
        fresh.AddLayerBottom(layer) : fresh.AddStackupLayerAtElevation(layer);
    if (!status.ok())
      return status;
  }
  for (const StackupLayer &layer : snapshot->non_stackup_layers()) {
    absl::Status status = fresh.AddNonStackupLayer(layer);
    if (!status.ok())
      return status;
  }
  Commit(fresh);
  return absl::OkStatus();
}

absl::Status Stackup::SetLayoutStackup(const StackupLayer &layer,
                                       StackupOperation operation,
                                       const std::string &base_layer) {
  LayerCollection copy = *collection();
  absl::Status status = ApplyTo(&copy, layer, operation, base_layer);
  if (!status.ok())
    return status;
  Commit(copy);
  return absl::OkStatus();
}

absl::Status Stackup::ApplyTo(LayerCollection *collection,
                              const StackupLayer &layer,
                              StackupOperation operation,
                              const std::string &base_layer) {
  absl::Status status;
  switch (operation) {
    case StackupOperation::kChangeAttribute:
      status = collection->ReplaceLayer(layer.name(), layer);
      break;
    case StackupOperation::kChangeName:
      status = collection->ReplaceLayer(base_layer, layer);
      break;
    case StackupOperation::kChangePosition:
      status = collection->ReplaceLayer(layer.name(), layer);
      if (status.ok())
        status = collection->MoveLayerAbove(layer.name(), base_layer);
      break;
    case StackupOperation::kInsertBelow:
      status = collection->AddLayerBelow(layer, base_layer);
      break;
    case StackupOperation::kInsertAbove:
      status = collection->AddLayerAbove(layer, base_layer);
      break;
    case StackupOperation::kAddOnTop:
      status = collection->AddLayerTop(layer);
      break;
    case StackupOperation::kAddOnBottom:
      status = collection->AddLayerBottom(layer);
      break;
    case StackupOperation::kNonStackup:
      status = collection->AddNonStackupLayer(layer);
      break;
    case StackupOperation::kAddAtElevation:
      status = collection->AddStackupLayerAtElevation(layer);
      break;
  }
  if (!status.ok()) {
    VLOG(1) << "Could not apply layer " << layer.name() << ": " << status;
  }
  return status;
}

absl::Status Stackup::CreateSymmetricStackup(
    const SymmetricStackupParameters &parameters) {
  if (parameters.layer_count < 2 || parameters.layer_count % 2 != 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "A symmetric stackup needs an even number of signal layers, not ",
        parameters.layer_count));
  }
  int half = parameters.layer_count / 2;

  LayerParameters outer = {
      .method = InsertionMethod::kAddOnTop,
      .type = LayerType::kSignal,
      .thickness = parameters.outer_layer_thickness
  };
  LayerParameters dielectric = {
      .method = InsertionMethod::kAddOnTop,
      .type = LayerType::kDielectric,
      .material = parameters.dielectric_material,
      .thickness = parameters.dielectric_thickness
  };

  std::vector<std::pair<std::string, LayerParameters>> layers = {
      {"BOT", outer},
      {absl::StrCat("D", half), dielectric},
      {"TOP", outer}
  };
  if (parameters.soldermask) {
    LayerParameters mask = {
        .method = InsertionMethod::kAddOnTop,
        .type = LayerType::kDielectric,
        .material = "solder_mask",
        .thickness = parameters.soldermask_thickness
    };
    layers.push_back({"SMT", mask});
    mask.method = InsertionMethod::kAddOnBottom;
    layers.push_back({"SMB", mask});

    layers[0].second.fill_material = "solder_mask";
    layers[2].second.fill_material = "solder_mask";
  }

  for (int layer_number = half; layer_number > 1; --layer_number) {
    LayerParameters inner = {
        .base_layer = "TOP",
        .method = InsertionMethod::kInsertBelow,
        .type = LayerType::kSignal,
        .thickness = parameters.inner_layer_thickness
    };
    LayerParameters inner_dielectric = dielectric;
    inner_dielectric.base_layer = "TOP";
    inner_dielectric.method = InsertionMethod::kInsertBelow;

    // Upper half, stacked down from TOP.
    layers.push_back({absl::StrCat("L", layer_number), inner});
    layers.push_back(
        {absl::StrCat("D", layer_number - 1), inner_dielectric});

    // Lower half, stacked up from BOT.
    int mirror_number = parameters.layer_count - layer_number + 1;
    inner.base_layer = "BOT";
    inner.method = InsertionMethod::kInsertAbove;
    inner_dielectric.base_layer = "BOT";
    inner_dielectric.method = InsertionMethod::kInsertAbove;
    layers.push_back({absl::StrCat("L", mirror_number), inner});
    layers.push_back({absl::StrCat("D", mirror_number), inner_dielectric});
  }

  LayerCollection copy = *collection();
  for (const auto &entry : layers) {
    absl::StatusOr<StackupLayer> added =
        AddLayerTo(&copy, entry.first, entry.second);
    if (!added.ok())
      return added.status();
  }
  Commit(copy);
  LOG(INFO) << "Created symmetric stackup with " << parameters.layer_count
            << " signal layers, " << GetLayoutThickness() << " m thick";
  return absl::OkStatus();
}

StackupMode Stackup::mode() const {
  return collection()->mode();
}

absl::Status Stackup::SetMode(StackupMode mode) {
  LayerCollection copy = *collection();
  copy.SetMode(mode);
  Commit(copy);
  return absl::OkStatus();
}

std::map<std::string, double> Stackup::ResidualCopperAreaPerLayer() const {
  std::map<std::string, double> coverage;
  geometry::Rectangle bounding_box = layout_->GetBoundingBox();
  geometry::Region board = geometry::Region::FromRectangle(bounding_box);
  double board_area = board.Area();

  for (const StackupLayer &layer : SignalLayers()) {
    if (board_area <= 0.0) {
      coverage[layer.name()] = 0.0;
      continue;
    }
    geometry::Region copper;
    geometry::Region voids;
    for (const Primitive *primitive :
             layout_->PrimitivesOnLayer(layer.name())) {
      if (primitive->is_void()) {
        voids = voids.Union(primitive->AsRegion());
      } else {
        copper = copper.Union(primitive->AsRegion());
      }
    }
    double area = copper.Difference(voids).Intersection(board).Area();
    coverage[layer.name()] = 100.0 * area / board_area;
  }
  return coverage;
}

}  // namespace layup
