#ifndef STACKUP_TRANSFORMER_H_
#define STACKUP_TRANSFORMER_H_

#include <ostream>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "cell.h"
#include "cell_instance.h"
#include "physical_properties_database.h"
#include "stackup.h"

namespace layup {

// Flips a cell's stackup and places it inside other cells, either on a
// placement layer (2D) or with an explicit 3D transform.
//
// Every operation first computes the complete new state and only then
// installs it. When something fails along the way the result is an Aborted
// status and the cell is left as it was.
class StackupTransformer {
 public:
  enum class State {
    kIdle,
    kValidatingStack,
    kRebuildingElevations,
    kRemappingVias,
    kRemappingComponents,
    kRemappingPadstacks,
    kCommitted,
    kAborted
  };

  // Layers whose names contain this are left where they are by a flip.
  static constexpr char kRadBoxMarker[] = "RadBox";

  static constexpr char kTopAirLayer[] = "Top_Air";
  static constexpr char kBottomAirLayer[] = "Bottom_Air";

  StackupTransformer(PhysicalPropertiesDatabase *physical_db, Cell *cell);

  // Mirrors the stackup top to bottom. Elevations become
  // max_elevation - old_upper_elevation, top/bottom associations and via
  // references swap, solder balls and IC dies turn over and padstack
  // instances span the same layers in the new order. Flipping twice restores
  // the original.
  absl::Status FlipDesign();

  // For components with solder balls, make room for the balls: add (or
  // grow) an air layer when the component sits on the outermost stackup
  // layer, or resize the outermost dielectric when it sits on the outermost
  // signal layer under it.
  absl::Status AdjustSolderDielectrics();

  // Places this cell inside the target as a black-boxed instance on the
  // target's top signal layer. Placing on the bottom flips the target
  // instead. Offsets are in metres.
  absl::Status PlaceInLayout(Cell *target,
                             double angle_degrees,
                             double offset_x,
                             double offset_y,
                             bool flipped,
                             bool place_on_top);

  // As PlaceInLayout, but with an explicit 3D transform lifting this cell to
  // the target's top or bottom surface. A solder height of zero or less is
  // inferred from the components on this cell's outermost signal layers.
  absl::Status PlaceInLayout3D(Cell *target,
                               double angle_degrees,
                               double offset_x,
                               double offset_y,
                               bool flipped,
                               bool place_on_top,
                               double solder_height);

  // Places an external 3D model on the top or bottom surface of this cell.
  // Models on the bottom are turned over.
  absl::StatusOr<CellInstance*> PlaceComponent3D(const std::string &model_name,
                                                 double angle_degrees,
                                                 double offset_x,
                                                 double offset_y,
                                                 bool place_on_top);

  State state() const { return state_; }
  Stackup &stackup() { return stackup_; }

 private:
  void Transition(State next);
  absl::Status Abort(const absl::Status &reason);

  // The largest solder ball height among components on the layer.
  double SolderHeightOn(const std::string &layer) const;

  // Shorts no solder ports on the layer to a reference conductor.
  void RemoveSolderPec(const std::string &layer);

  // Walks signal layers inward from one face for as long as they share that
  // face's elevation, collecting the largest solder height. The layers
  // walked are appended to face_layers.
  double InferSolderHeight(bool from_bottom,
                           std::vector<std::string> *face_layers) const;

  PhysicalPropertiesDatabase *physical_db_;
  Cell *cell_;
  Stackup stackup_;
  State state_;
};

const char *StackupTransformerStateName(StackupTransformer::State state);
std::ostream &operator<<(std::ostream &os,
                         const StackupTransformer::State &state);

}  // namespace layup

#endif  // STACKUP_TRANSFORMER_H_
