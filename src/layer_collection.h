#ifndef LAYER_COLLECTION_H_
#define LAYER_COLLECTION_H_

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "layer_type.h"
#include "layup.pb.h"
#include "stackup_layer.h"

namespace layup {

enum class StackupMode {
  // Layers are stacked on one another with no gaps; elevations follow from
  // thicknesses and order.
  kLaminate,
  // Layers carry their own elevation and may overlap.
  kOverlapping,
  // Treated as kLaminate.
  kMultiZone
};

absl::StatusOr<StackupMode> ParseStackupMode(const std::string &name);
const char *StackupModeName(StackupMode mode);
std::ostream &operator<<(std::ostream &os, const StackupMode &mode);

// An ordered set of layers. Stackup layers are kept top first, then the
// non-stackup layers in insertion order. Names are unique across both.
//
// In laminate mode the elevations are recomputed from the order after every
// change: the bottom stackup layer sits at 0 and each layer rests on the one
// below it. Via layers sit on their lower reference layer and span the gap to
// their upper reference. In overlapping mode the layers keep their own
// elevations and are kept sorted by them.
//
// A LayerCollection is a value: the Layout holds an immutable one, and edits
// are made to a copy which is then installed whole.
class LayerCollection {
 public:
  explicit LayerCollection(StackupMode mode = StackupMode::kLaminate)
      : mode_(mode) {}

  StackupMode mode() const { return mode_; }
  // Changing to a laminate mode recomputes elevations; changing to
  // overlapping keeps them and re-sorts.
  void SetMode(StackupMode mode);

  bool IsLaminate() const { return mode_ != StackupMode::kOverlapping; }

  absl::Status AddLayerTop(const StackupLayer &layer);
  absl::Status AddLayerBottom(const StackupLayer &layer);
  absl::Status AddLayerAbove(const StackupLayer &layer,
                             const std::string &base_layer);
  absl::Status AddLayerBelow(const StackupLayer &layer,
                             const std::string &base_layer);

  // Inserts the layer at its own lower elevation, keeping the order sorted.
  absl::Status AddStackupLayerAtElevation(const StackupLayer &layer);

  absl::Status AddNonStackupLayer(const StackupLayer &layer);

  // Replace the named layer in place. The replacement may carry a new name, as
  // long as it doesn't collide with another layer. A layer cannot move between
  // the stackup and non-stackup groups this way.
  absl::Status ReplaceLayer(const std::string &name, const StackupLayer &layer);

  // Move the named stackup layer so that it sits directly above the base.
  absl::Status MoveLayerAbove(const std::string &name,
                              const std::string &base_layer);

  bool RemoveLayer(const std::string &name);

  // All layers: stackup layers top first, then non-stackup layers.
  std::vector<StackupLayer> Layers() const;

  const std::vector<StackupLayer> &stackup_layers() const {
    return stackup_layers_;
  }
  const std::vector<StackupLayer> &non_stackup_layers() const {
    return non_stackup_layers_;
  }

  const StackupLayer *FindLayer(const std::string &name) const;
  bool HasLayer(const std::string &name) const {
    return FindLayer(name) != nullptr;
  }

  // The first and last stackup layers in order, optionally only considering
  // layers of the given type.
  std::optional<std::pair<const StackupLayer*, const StackupLayer*>>
      TopBottomStackupLayers(
          const std::optional<LayerType> &type = std::nullopt) const;

  // Verifies that walking the stackup from the bottom never goes down.
  absl::Status CheckElevationOrder() const;

  size_t size() const {
    return stackup_layers_.size() + non_stackup_layers_.size();
  }
  bool empty() const { return size() == 0; }

  std::string Describe() const;

  // The materials map is left empty.
  ::layup::proto::StackupDefinition ToProto() const;

  // Laminate stackups are rebuilt from the layer order; overlapping stackups
  // from the stored elevations.
  static absl::StatusOr<LayerCollection> FromProto(
      const ::layup::proto::StackupDefinition &stackup_pb);

 private:
  std::optional<size_t> StackupIndexOf(const std::string &name) const;
  absl::Status CheckCanAdd(const StackupLayer &layer) const;

  // Position of the layer as inserted, before elevations are fixed up.
  absl::Status InsertStackupLayerAt(size_t index, const StackupLayer &layer);

  // Restore the invariants after any change: recompute elevations (laminate)
  // or sort by elevation (overlapping).
  void Normalise();
  void RecomputeLaminateElevations();
  void SortByElevation();

  StackupMode mode_;

  // Top first.
  std::vector<StackupLayer> stackup_layers_;
  std::vector<StackupLayer> non_stackup_layers_;
};

std::ostream &operator<<(std::ostream &os, const LayerCollection &collection);

}  // namespace layup

#endif  // LAYER_COLLECTION_H_
