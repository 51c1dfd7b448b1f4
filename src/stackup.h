#ifndef STACKUP_H_
#define STACKUP_H_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "layer_collection.h"
#include "layer_type.h"
#include "layout.h"
#include "physical_properties_database.h"
#include "stackup_layer.h"

namespace layup {

enum class InsertionMethod {
  kAddOnTop,
  kAddOnBottom,
  kInsertAbove,
  kInsertBelow,
  // Only valid in overlapping mode.
  kAddAtElevation
};

// How SetLayoutStackup applies a layer to the installed collection.
enum class StackupOperation {
  // Replace the layer of the same name.
  kChangeAttribute,
  // Replace the layer named by the base layer, which was the old name.
  kChangeName,
  // Move the layer to directly above the base layer.
  kChangePosition,
  kInsertBelow,
  kInsertAbove,
  kAddOnTop,
  kAddOnBottom,
  kNonStackup,
  kAddAtElevation
};

absl::StatusOr<InsertionMethod> ParseInsertionMethod(const std::string &name);

struct StackupLimits {
  std::string top_layer;
  double top_elevation;
  std::string bottom_layer;
  double bottom_elevation;
};

// The stackup of one Layout. All reads go through the layout's installed
// layer collection; all edits build a new collection from a copy of it and
// install the result in a single swap, so a failed edit leaves the layout as
// it was.
class Stackup {
 public:
  struct LayerParameters {
    // Required for kInsertAbove and kInsertBelow.
    std::optional<std::string> base_layer;
    InsertionMethod method = InsertionMethod::kAddOnTop;
    LayerType type = LayerType::kSignal;

    // Empty for the type's default material.
    std::string material;
    // Empty for "fr4_epoxy" on layers that have a fill.
    std::string fill_material;

    // Metres.
    double thickness = 35e-6;
    std::optional<double> etch_factor;
    bool is_negative = false;
    bool enable_roughness = false;

    // Lower elevation for kAddAtElevation, metres.
    std::optional<double> elevation;
  };

  struct SymmetricStackupParameters {
    // Number of signal layers. Must be even.
    int layer_count = 4;
    double inner_layer_thickness = 17e-6;
    double outer_layer_thickness = 50e-6;
    double dielectric_thickness = 100e-6;
    std::string dielectric_material = "fr4_epoxy";
    bool soldermask = true;
    double soldermask_thickness = 20e-6;
  };

  Stackup(PhysicalPropertiesDatabase *physical_db, Layout *layout)
      : physical_db_(physical_db),
        layout_(layout),
        cached_generation_(0) {}

  absl::StatusOr<StackupLayer> AddLayer(const std::string &name,
                                        const LayerParameters &parameters);
  absl::StatusOr<StackupLayer> AddLayer(const std::string &name) {
    return AddLayer(name, LayerParameters());
  }

  bool RemoveLayer(const std::string &name);

  // Replace the attributes of the layer with the same name.
  absl::Status UpdateLayer(const StackupLayer &layer);

  // Renames the layer and everything in the layout that refers to it.
  absl::Status RenameLayer(const std::string &old_name,
                           const std::string &new_name);

  absl::Status MoveLayerAbove(const std::string &name,
                              const std::string &base_layer);

  // Top first. Stackup layers, then non-stackup layers.
  std::vector<StackupLayer> Layers() const;
  std::vector<StackupLayer> SignalLayers() const;
  std::vector<StackupLayer> StackupLayers() const;
  std::vector<StackupLayer> NonStackupLayers() const;
  std::optional<StackupLayer> FindLayer(const std::string &name) const;

  // The layers with the highest and lowest lower elevations, optionally only
  // among signal layers, and those elevations.
  absl::StatusOr<StackupLimits> GetStackupLimits(bool only_metals) const;

  // Upper elevation of the top stackup layer less the lower elevation of the
  // bottom one. Zero for an empty stackup.
  double GetLayoutThickness() const;

  absl::Status CheckElevationOrder() const;

  // Rebuild the collection from the installed one, re-inserting stackup
  // layers by elevation (overlapping) or in order (laminate) and appending
  // the non-stackup layers.
  absl::Status RefreshLayerCollection();

  absl::Status SetLayoutStackup(const StackupLayer &layer,
                                StackupOperation operation,
                                const std::string &base_layer = "");

  absl::Status CreateSymmetricStackup(
      const SymmetricStackupParameters &parameters);

  StackupMode mode() const;
  absl::Status SetMode(StackupMode mode);

  // Percentage of the layout's bounding box covered by copper on each signal
  // layer.
  std::map<std::string, double> ResidualCopperAreaPerLayer() const;

  // The installed collection.
  std::shared_ptr<const LayerCollection> collection() const;

  Layout *layout() const { return layout_; }
  PhysicalPropertiesDatabase *physical_db() const { return physical_db_; }

  // Installs a whole collection built elsewhere in a single swap.
  void Commit(const LayerCollection &collection);

 private:
  // Resolves a material name against the library. Unknown names are kept
  // with a warning.
  std::string ResolveMaterial(const std::string &name) const;

  // AddLayer and SetLayoutStackup against a collection that is not (yet)
  // installed.
  absl::StatusOr<StackupLayer> AddLayerTo(
      LayerCollection *collection,
      const std::string &name,
      const LayerParameters &parameters) const;
  static absl::Status ApplyTo(LayerCollection *collection,
                              const StackupLayer &layer,
                              StackupOperation operation,
                              const std::string &base_layer = "");

  PhysicalPropertiesDatabase *physical_db_;
  Layout *layout_;

  mutable std::shared_ptr<const LayerCollection> cached_collection_;
  mutable uint64_t cached_generation_;
};

}  // namespace layup

#endif  // STACKUP_H_
