#ifndef CELL_INSTANCE_H_
#define CELL_INSTANCE_H_

#include <optional>
#include <ostream>
#include <string>

#include "geometry/manipulable.h"
#include "geometry/placement.h"
#include "geometry/point.h"
#include "layup.pb.h"

namespace layup {

class Cell;

// A placement of one cell's layout inside another's. The instance either
// refers to a cell in the design database or, for 3D component models, just
// names the model.
class CellInstance : public geometry::Manipulable {
 public:
  CellInstance()
      : template_cell_(nullptr) {}

  CellInstance(const std::string &name, Cell *template_cell)
      : name_(name),
        template_cell_(template_cell) {}

  // These compose with whatever placement is already set, as if the placed
  // layout were transformed again.
  void MirrorY() override;
  void MirrorX() override;
  void Translate(const geometry::Point &offset) override;
  void Rotate(double theta_radians) override;

  void set_name(const std::string &name) { name_ = name; }
  const std::string &name() const { return name_; }

  void set_template_cell(Cell *cell) { template_cell_ = cell; }
  Cell *template_cell() const { return template_cell_; }

  void set_model_name(const std::string &model_name) {
    model_name_ = model_name;
  }
  const std::string &model_name() const { return model_name_; }

  void set_placement(const geometry::Placement &placement) {
    placement_ = placement;
  }
  const geometry::Placement &placement() const { return placement_; }

  void set_transform_3d(const std::optional<geometry::Transform3D> &transform) {
    transform_3d_ = transform;
  }
  const std::optional<geometry::Transform3D> &transform_3d() const {
    return transform_3d_;
  }
  bool Is3DPlacement() const { return transform_3d_.has_value(); }

  // The layer of the parent layout the instance is mounted on.
  void set_placement_layer(const std::string &layer) {
    placement_layer_ = layer;
  }
  const std::string &placement_layer() const { return placement_layer_; }

  std::string Describe() const;

  ::layup::proto::CellInstance ToProto() const;

  // The template cell is looked up by the caller, since only the design
  // database knows the other cells.
  static CellInstance FromProto(const ::layup::proto::CellInstance &instance_pb,
                                Cell *template_cell);

 private:
  std::string name_;
  Cell *template_cell_;
  std::string model_name_;

  geometry::Placement placement_;
  std::optional<geometry::Transform3D> transform_3d_;
  std::string placement_layer_;
};

std::ostream &operator<<(std::ostream &os, const CellInstance &instance);

}  // namespace layup

#endif  // CELL_INSTANCE_H_
