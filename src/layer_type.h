#ifndef LAYER_TYPE_H_
#define LAYER_TYPE_H_

#include <ostream>
#include <string>

#include <absl/status/statusor.h>

namespace layup {

enum class LayerType {
  kSignal,
  kDielectric,
  kConducting,
  kAirlines,
  kErrors,
  kSymbol,
  kMeasure,
  kAssembly,
  kSilkscreen,
  kSolderMask,
  kSolderPaste,
  kGlue,
  kWirebond,
  kUser,
  kSIWaveHFSSRegion,
  kOutline,
  kPostprocessing,
  kUndefined
};

// Properties common to all layers of a given type.
struct LayerTypeInfo {
  LayerType type;

  // Canonical lower-case name, e.g. "signal".
  const char *name;

  // Whether layers of this type are part of the physical stack and carry an
  // elevation and thickness.
  bool is_stackup;

  // Whether layers of this type have a fill material for the regions not
  // covered by copper.
  bool has_fill_material;

  // Used when a layer is created without a material. Empty if the type has
  // no physical material.
  const char *default_material;
};

const LayerTypeInfo &GetLayerTypeInfo(LayerType type);

// Accepts the canonical names and their common spellings ("SignalLayer",
// "signal_layer", "Signal"), ignoring case.
absl::StatusOr<LayerType> ParseLayerType(const std::string &name);

inline const char *LayerTypeName(LayerType type) {
  return GetLayerTypeInfo(type).name;
}

inline bool IsStackupType(LayerType type) {
  return GetLayerTypeInfo(type).is_stackup;
}

// Which face of the board a layer is associated with. Flipping swaps the two.
enum class TopBottomAssociation {
  kNeither,
  kTopAssociated,
  kBottomAssociated
};

TopBottomAssociation Toggled(TopBottomAssociation association);

absl::StatusOr<TopBottomAssociation> ParseTopBottomAssociation(
    const std::string &name);

const char *TopBottomAssociationName(TopBottomAssociation association);

std::ostream &operator<<(std::ostream &os, const LayerType &type);
std::ostream &operator<<(std::ostream &os,
                         const TopBottomAssociation &association);

}  // namespace layup

#endif  // LAYER_TYPE_H_
