#include "cell.h"

#include <memory>
#include <set>
#include <string>

#include <glog/logging.h>

#include "cell_instance.h"
#include "layer_collection.h"
#include "layout.h"
#include "physical_properties_database.h"
#include "stackup_layer.h"

namespace layup {

std::set<Cell*> Cell::DirectAncestors() const {
  std::set<Cell*> ancestors;
  if (!layout_)
    return ancestors;
  for (const auto &instance : layout_->cell_instances()) {
    if (!instance->template_cell()) {
      VLOG(3) << "Instance " << instance->name() << " of model "
              << instance->model_name() << " has no template cell";
      continue;
    }
    ancestors.insert(instance->template_cell());
  }
  return ancestors;
}

::layup::proto::Cell Cell::ToProto() const {
  ::layup::proto::Cell cell_pb;
  cell_pb.set_name(name_);
  cell_pb.set_description(description_);
  cell_pb.set_black_box(is_black_box_);
  if (!layout_)
    return cell_pb;

  for (const std::string &net : layout_->nets()) {
    cell_pb.add_nets(net);
  }
  for (const auto &entry : layout_->primitives()) {
    *cell_pb.add_primitives() = entry.second->ToProto();
  }
  for (const auto &entry : layout_->padstack_instances()) {
    *cell_pb.add_padstack_instances() = entry.second->ToProto();
  }
  for (const auto &entry : layout_->components()) {
    *cell_pb.add_components() = entry.second->ToProto();
  }
  for (const auto &instance : layout_->cell_instances()) {
    *cell_pb.add_cell_instances() = instance->ToProto();
  }

  std::shared_ptr<const LayerCollection> collection =
      layout_->GetLayerCollection();
  ::layup::proto::StackupDefinition *stackup_pb = cell_pb.mutable_stackup();
  *stackup_pb = collection->ToProto();
  const PhysicalPropertiesDatabase &physical_db = layout_->physical_db();
  for (const StackupLayer &layer : collection->Layers()) {
    for (const std::string &name : {layer.material(), layer.fill_material()}) {
      if (name.empty())
        continue;
      auto material = physical_db.FindMaterial(name);
      if (!material) {
        VLOG(3) << "Layer " << layer.name() << " uses unknown material "
                << name;
        continue;
      }
      (*stackup_pb->mutable_materials())[name] = material->get().ToProto();
    }
  }
  return cell_pb;
}

}  // namespace layup
