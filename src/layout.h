#ifndef LAYOUT_H_
#define LAYOUT_H_

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>

#include "cell_instance.h"
#include "component.h"
#include "layer_collection.h"
#include "padstack_instance.h"
#include "physical_properties_database.h"
#include "primitive.h"
#include "geometry/rectangle.h"

namespace layup {

class Cell;

// The contents of one board or package design: nets, copper primitives,
// padstack instances, components, placed sub-cells, and the layer collection
// describing the physical stack.
//
// Objects are owned by the Layout and handed out by pointer. Pointers stay
// valid until the object is deleted from the Layout.
//
// The layer collection is held as an immutable snapshot. Readers get a
// shared_ptr to the current snapshot; writers build a new collection and
// install it with SetLayerCollection, so a reader never sees a collection
// half-way through an edit.
class Layout {
 public:
  Layout() = delete;
  Layout(const PhysicalPropertiesDatabase &physical_db)
      : parent_cell_(nullptr),
        physical_db_(physical_db),
        next_id_(1),
        layer_collection_(std::make_shared<const LayerCollection>()),
        layer_collection_generation_(0) {}

  // Deep copy of everything except the parent cell. Cell instances still
  // point at the same template cells.
  std::unique_ptr<Layout> Clone() const;

  bool AddNet(const std::string &name);
  bool HasNet(const std::string &name) const {
    return nets_.find(name) != nets_.end();
  }
  // Only forgets the name; objects on the net are not deleted.
  bool DeleteNet(const std::string &name);
  const std::set<std::string> &nets() const { return nets_; }

  // Takes a copy. A fresh id is assigned if the primitive has none or if its
  // id is taken. The primitive's net is added if missing.
  Primitive *AddPrimitive(const Primitive &primitive);
  bool DeletePrimitive(int64_t id);
  const Primitive *FindPrimitive(int64_t id) const;
  std::vector<const Primitive*> PrimitivesOnLayer(
      const std::string &layer) const;
  const std::map<int64_t, std::unique_ptr<Primitive>> &primitives() const {
    return primitives_;
  }

  PadstackInstance *AddPadstackInstance(const PadstackInstance &instance);
  bool DeletePadstackInstance(int64_t id);
  PadstackInstance *FindPadstackInstance(int64_t id);
  const PadstackInstance *FindPadstackInstance(int64_t id) const;
  const std::map<int64_t, std::unique_ptr<PadstackInstance>>
      &padstack_instances() const {
    return padstack_instances_;
  }

  // Returns nullptr if a component with the same name exists.
  Component *AddComponent(const Component &component);
  bool DeleteComponent(const std::string &name);
  Component *FindComponent(const std::string &name);
  const Component *FindComponent(const std::string &name) const;
  const std::map<std::string, std::unique_ptr<Component>>
      &components() const {
    return components_;
  }

  std::vector<const PadstackInstance*> PinsOf(
      const std::string &component_name) const;

  CellInstance *AddCellInstance(const CellInstance &instance);
  const std::vector<std::unique_ptr<CellInstance>> &cell_instances() const {
    return cell_instances_;
  }

  std::shared_ptr<const LayerCollection> GetLayerCollection() const;
  void SetLayerCollection(std::shared_ptr<const LayerCollection> collection);

  // Incremented by every SetLayerCollection, so that views can tell when
  // their cached copy is stale.
  uint64_t layer_collection_generation() const;

  // Points everything that names the old layer (primitives, padstack spans,
  // component and cell instance placement layers) at the new name. Returns
  // the number of objects changed.
  size_t RenameLayerReferences(const std::string &old_name,
                               const std::string &new_name);

  const geometry::Rectangle GetBoundingBox() const;

  const PhysicalPropertiesDatabase &physical_db() const {
    return physical_db_;
  }

  void set_parent_cell(Cell *cell) { parent_cell_ = cell; }
  Cell *parent_cell() const { return parent_cell_; }

  std::string Describe() const;

 private:
  int64_t NextId(int64_t requested);

  Cell *parent_cell_;

  const PhysicalPropertiesDatabase &physical_db_;

  // Primitives and padstack instances share an id space.
  int64_t next_id_;

  std::set<std::string> nets_;
  std::map<int64_t, std::unique_ptr<Primitive>> primitives_;
  std::map<int64_t, std::unique_ptr<PadstackInstance>> padstack_instances_;
  std::map<std::string, std::unique_ptr<Component>> components_;
  std::vector<std::unique_ptr<CellInstance>> cell_instances_;

  mutable absl::Mutex layer_collection_lock_;
  std::shared_ptr<const LayerCollection> layer_collection_
      ABSL_GUARDED_BY(layer_collection_lock_);
  uint64_t layer_collection_generation_
      ABSL_GUARDED_BY(layer_collection_lock_);
};

}  // namespace layup

#endif  // LAYOUT_H_
