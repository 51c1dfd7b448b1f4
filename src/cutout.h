#ifndef CUTOUT_H_
#define CUTOUT_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "cell.h"
#include "design_database.h"
#include "layout.h"
#include "primitive.h"
#include "geometry/polygon.h"
#include "geometry/region.h"

namespace layup {

enum class ExtentType {
  // The union of the signal geometry, each piece grown by the expansion.
  kConforming,
  // The convex hull of the signal geometry, grown by the expansion.
  kConvexHull,
  // The bounding box of the signal geometry, grown by the expansion.
  kBoundingBox
};

// Accepts "Conforming", "ConvexHull", "BoundingBox" and "Bounding", ignoring
// case.
absl::StatusOr<ExtentType> ParseExtentType(const std::string &name);
const char *ExtentTypeName(ExtentType type);
std::ostream &operator<<(std::ostream &os, const ExtentType &type);

struct CutoutOptions {
  std::vector<std::string> signal_nets;
  std::vector<std::string> reference_nets = {"GND"};

  ExtentType extent_type = ExtentType::kConvexHull;

  // Metres.
  double expansion_size = 0.002;
  bool use_round_corner = false;

  size_t number_of_threads = 4;

  // If given, the cut is made along this polygon instead of around the signal
  // nets, and the signal nets are clipped like the reference nets. Points are
  // in custom_extent_units.
  std::vector<std::pair<double, double>> custom_extent;
  std::string custom_extent_units = "mm";

  // Metres. Only applies to conforming extents; 0 disables it.
  double extent_defeature = 0.0;

  // Removes resistors, inductors and capacitors left with a single pin.
  bool remove_single_pin_components = false;

  // Keep padstack instances whose pad overlaps the extent even if their
  // centre is outside it.
  bool include_partial_instances = false;

  // Clipped primitives keep the voids that fall inside them. Otherwise the
  // voids are dropped.
  bool keep_voids = true;

  // If set, the source is copied into a new cell, the copy is cut and then
  // written here. The source is not changed.
  std::string output_path;
  // Name of the copy. Defaults to a unique name derived from the source.
  std::string output_cell_name;
};

// Reduces a layout to the geometry within some distance of a set of signal
// nets, keeping the reference (usually ground) nets only where they are near
// the signals.
//
// Classification of padstack instances and primitives against the extent is
// split across worker threads. The workers only read the layout; every
// deletion and creation is made on the calling thread once they have all
// finished.
class CutoutEngine {
 public:
  explicit CutoutEngine(DesignDatabase *design_db)
      : design_db_(design_db) {}

  // Returns the cell that was cut: the source itself, or with
  // options.output_path, the new copy.
  //
  // If the extent turns out empty this fails with FailedPrecondition, but by
  // then the nets outside the cut have already been removed.
  absl::StatusOr<Cell*> Cutout(Cell *source, const CutoutOptions &options);

  // The region the cut will be made along, computed from the layout's current
  // contents.
  absl::StatusOr<geometry::Region> ComputeExtent(
      const Layout &layout, const CutoutOptions &options) const;

 private:
  // A replacement for part of a clipped primitive.
  struct ClippedPiece {
    geometry::Polygon outline;
    std::vector<geometry::Polygon> voids;
  };

  // The outcome of classifying one reference primitive.
  struct PrimitiveVerdict {
    absl::Status status;
    bool remove = false;
    std::vector<ClippedPiece> pieces;
  };

  absl::Status CutLayout(Layout *layout, const CutoutOptions &options) const;

  // Removes the nets, padstack instances and primitives not on any of the
  // given nets. Collects the ids of the reference objects left over.
  void RemoveUnusedNets(Layout *layout,
                        const std::vector<std::string> &all_nets,
                        const std::vector<std::string> &reference_nets,
                        std::vector<int64_t> *reference_padstacks,
                        std::vector<int64_t> *reference_primitives) const;

  absl::Status ClipPadstackInstances(
      Layout *layout,
      const geometry::Region &extent,
      const std::vector<int64_t> &reference_padstacks,
      const CutoutOptions &options) const;

  absl::Status ClipPrimitives(
      Layout *layout,
      const geometry::Region &extent,
      const std::vector<int64_t> &reference_primitives,
      const CutoutOptions &options) const;

  static PrimitiveVerdict ClassifyPrimitive(const geometry::Region &extent,
                                            const Primitive &primitive,
                                            bool keep_voids);

  void RemoveOrphanedComponents(Layout *layout,
                                const CutoutOptions &options) const;

  DesignDatabase *design_db_;
};

}  // namespace layup

#endif  // CUTOUT_H_
