#ifndef ROUGHNESS_H_
#define ROUGHNESS_H_

#include <ostream>
#include <variant>

namespace layup {

// Huray "snowball" model.
struct HurayRoughness {
  // Metres.
  double nodule_radius;
  double surface_ratio;
};

// Groisse model.
struct GroisseRoughness {
  // RMS roughness, metres.
  double roughness;
};

typedef std::variant<std::monostate, HurayRoughness, GroisseRoughness>
    SurfaceRoughness;

enum class RoughnessRegion {
  kTop,
  kBottom,
  kSide
};

// Conductor surface roughness, per surface of a signal layer.
struct LayerRoughness {
  bool enabled = false;
  SurfaceRoughness top;
  SurfaceRoughness bottom;
  SurfaceRoughness side;

  SurfaceRoughness &ForRegion(RoughnessRegion region) {
    switch (region) {
      case RoughnessRegion::kTop:
        return top;
      case RoughnessRegion::kBottom:
        return bottom;
      default:
        return side;
    }
  }

  const SurfaceRoughness &ForRegion(RoughnessRegion region) const {
    return const_cast<LayerRoughness*>(this)->ForRegion(region);
  }
};

inline bool operator==(const HurayRoughness &lhs, const HurayRoughness &rhs) {
  return lhs.nodule_radius == rhs.nodule_radius &&
         lhs.surface_ratio == rhs.surface_ratio;
}

inline bool operator==(const GroisseRoughness &lhs,
                       const GroisseRoughness &rhs) {
  return lhs.roughness == rhs.roughness;
}

inline bool operator==(const LayerRoughness &lhs, const LayerRoughness &rhs) {
  return lhs.enabled == rhs.enabled && lhs.top == rhs.top &&
         lhs.bottom == rhs.bottom && lhs.side == rhs.side;
}

}  // namespace layup

#endif  // ROUGHNESS_H_
