#include "layout.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include <absl/synchronization/mutex.h>

#include "geometry/point.h"
#include "geometry/rectangle.h"

namespace layup {

using geometry::Point;
using geometry::Rectangle;

std::unique_ptr<Layout> Layout::Clone() const {
  std::unique_ptr<Layout> copy(new Layout(physical_db_));
  copy->next_id_ = next_id_;
  copy->nets_ = nets_;
  for (const auto &entry : primitives_) {
    copy->primitives_[entry.first].reset(new Primitive(*entry.second));
  }
  for (const auto &entry : padstack_instances_) {
    copy->padstack_instances_[entry.first].reset(
        new PadstackInstance(*entry.second));
  }
  for (const auto &entry : components_) {
    copy->components_[entry.first].reset(new Component(*entry.second));
  }
  for (const auto &instance : cell_instances_) {
    copy->cell_instances_.emplace_back(new CellInstance(*instance));
  }
  // The collection is immutable, so the copy can share it.
  copy->SetLayerCollection(GetLayerCollection());
  return copy;
}

int64_t Layout::NextId(int64_t requested) {
  bool taken = primitives_.find(requested) != primitives_.end() ||
      padstack_instances_.find(requested) != padstack_instances_.end();
  if (requested > 0 && !taken) {
    next_id_ = std::max(next_id_, requested + 1);
    return requested;
  }
  return next_id_++;
}

bool Layout::AddNet(const std::string &name) {
  if (name.empty())
    return false;
  return nets_.insert(name).second;
}

bool Layout::DeleteNet(const std::string &name) {
  return nets_.erase(name) > 0;
}

Primitive *Layout::AddPrimitive(const Primitive &primitive) {
  Primitive *copy = new Primitive(primitive);
  copy->set_id(NextId(primitive.id()));
  AddNet(copy->net());
  primitives_[copy->id()].reset(copy);
  return copy;
}

bool Layout::DeletePrimitive(int64_t id) {
  return primitives_.erase(id) > 0;
}

const Primitive *Layout::FindPrimitive(int64_t id) const {
  auto it = primitives_.find(id);
  if (it == primitives_.end())
    return nullptr;
  return it->second.get();
}

std::vector<const Primitive*> Layout::PrimitivesOnLayer(
    const std::string &layer) const {
  std::vector<const Primitive*> found;
  for (const auto &entry : primitives_) {
    if (entry.second->layer() == layer) {
      found.push_back(entry.second.get());
    }
  }
  return found;
}

PadstackInstance *Layout::AddPadstackInstance(
    const PadstackInstance &instance) {
  PadstackInstance *copy = new PadstackInstance(instance);
  copy->set_id(NextId(instance.id()));
  AddNet(copy->net());
  padstack_instances_[copy->id()].reset(copy);
  return copy;
}

bool Layout::DeletePadstackInstance(int64_t id) {
  return padstack_instances_.erase(id) > 0;
}

PadstackInstance *Layout::FindPadstackInstance(int64_t id) {
  auto it = padstack_instances_.find(id);
  if (it == padstack_instances_.end())
    return nullptr;
  return it->second.get();
}

const PadstackInstance *Layout::FindPadstackInstance(int64_t id) const {
  auto it = padstack_instances_.find(id);
  if (it == padstack_instances_.end())
    return nullptr;
  return it->second.get();
}

Component *Layout::AddComponent(const Component &component) {
  auto it = components_.find(component.name());
  if (it != components_.end()) {
    LOG(WARNING) << "Component " << component.name() << " already exists";
    return nullptr;
  }
  Component *copy = new Component(component);
  components_[copy->name()].reset(copy);
  return copy;
}

bool Layout::DeleteComponent(const std::string &name) {
  return components_.erase(name) > 0;
}

Component *Layout::FindComponent(const std::string &name) {
  auto it = components_.find(name);
  if (it == components_.end())
    return nullptr;
  return it->second.get();
}

const Component *Layout::FindComponent(const std::string &name) const {
  auto it = components_.find(name);
  if (it == components_.end())
    return nullptr;
  return it->second.get();
}

std::vector<const PadstackInstance*> Layout::PinsOf(
    const std::string &component_name) const {
  std::vector<const PadstackInstance*> pins;
  for (const auto &entry : padstack_instances_) {
    const PadstackInstance &instance = *entry.second;
    if (instance.is_pin() && instance.component() == component_name) {
      pins.push_back(&instance);
    }
  }
  return pins;
}

CellInstance *Layout::AddCellInstance(const CellInstance &instance) {
  CellInstance *copy = new CellInstance(instance);
  cell_instances_.emplace_back(copy);
  return copy;
}

std::shared_ptr<const LayerCollection> Layout::GetLayerCollection() const {
  absl::MutexLock lock(&layer_collection_lock_);
  return layer_collection_;
}

void Layout::SetLayerCollection(
    std::shared_ptr<const LayerCollection> collection) {
  LOG_IF(FATAL, !collection) << "Layer collection must not be null";
  absl::MutexLock lock(&layer_collection_lock_);
  layer_collection_ = std::move(collection);
  ++layer_collection_generation_;
}

uint64_t Layout::layer_collection_generation() const {
  absl::MutexLock lock(&layer_collection_lock_);
  return layer_collection_generation_;
}

size_t Layout::RenameLayerReferences(const std::string &old_name,
                                     const std::string &new_name) {
  size_t changed = 0;
  for (auto &entry : primitives_) {
    if (entry.second->layer() == old_name) {
      entry.second->set_layer(new_name);
      ++changed;
    }
  }
  for (auto &entry : padstack_instances_) {
    PadstackInstance *instance = entry.second.get();
    bool touched = false;
    if (instance->start_layer() == old_name) {
      instance->set_start_layer(new_name);
      touched = true;
    }
    if (instance->stop_layer() == old_name) {
      instance->set_stop_layer(new_name);
      touched = true;
    }
    changed += touched ? 1 : 0;
  }
  for (auto &entry : components_) {
    if (entry.second->placement_layer() == old_name) {
      entry.second->set_placement_layer(new_name);
      ++changed;
    }
  }
  for (auto &instance : cell_instances_) {
    if (instance->placement_layer() == old_name) {
      instance->set_placement_layer(new_name);
      ++changed;
    }
  }
  return changed;
}

const Rectangle Layout::GetBoundingBox() const {
  std::optional<Rectangle> bounding_box;
  auto subsume = [&](const Rectangle &box) {
    if (!bounding_box) {
      bounding_box = box;
      return;
    }
    Rectangle::ExpandBounds(box, &bounding_box.value());
  };
  for (const auto &entry : primitives_) {
    subsume(entry.second->GetBoundingBox());
  }
  for (const auto &entry : padstack_instances_) {
    subsume(entry.second->GetPadBox());
  }
  if (!bounding_box) {
    // Layout is empty.
    return Rectangle(Point(0, 0), Point(0, 0));
  }
  return *bounding_box;
}

std::string Layout::Describe() const {
  std::stringstream ss;
  ss << "Layout: " << nets_.size() << " nets, "
     << primitives_.size() << " primitives, "
     << padstack_instances_.size() << " padstack instances, "
     << components_.size() << " components, "
     << cell_instances_.size() << " cell instances" << std::endl;
  ss << *GetLayerCollection();
  return ss.str();
}

}  // namespace layup
