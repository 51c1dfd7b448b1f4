#include "design_database.h"

#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <google/protobuf/text_format.h>

#include "cell.h"
#include "cell_instance.h"
#include "component.h"
#include "layer_collection.h"
#include "layout.h"
#include "padstack_instance.h"
#include "physical_properties_database.h"
#include "primitive.h"

namespace layup {

Cell *DesignDatabase::AddCell(const std::string &name) {
  std::unique_ptr<Cell> cell(new Cell(name));
  cell->SetLayout(new Layout(physical_db_));
  Cell *raw = cell.get();
  if (!ConsumeCell(raw)) {
    return nullptr;
  }
  cell.release();
  return raw;
}

bool DesignDatabase::ConsumeCell(Cell *cell) {
  auto it = cells_.find(cell->name());
  if (it != cells_.end()) {
    VLOG(10) << "Could not consume cell, name exists: \"" << cell->name()
             << "\"";
    return false;
  }
  cells_.insert({cell->name(), std::unique_ptr<Cell>(cell)});
  return true;
}

bool DesignDatabase::DeleteCell(const std::string &name) {
  auto it = cells_.find(name);
  if (it == cells_.end()) {
    return false;
  }
  cells_.erase(it);
  VLOG(2) << "Deleted cell " << name;
  return true;
}

Cell *DesignDatabase::FindCellOrDie(const std::string &name) const {
  Cell *cell = FindCell(name);
  LOG_IF(FATAL, !cell) << "Cell \"" << name << "\" not found";
  return cell;
}

Cell *DesignDatabase::FindCell(const std::string &name) const {
  auto it = cells_.find(name);
  if (it == cells_.end()) {
    return nullptr;
  }
  return it->second.get();
}

absl::StatusOr<Cell*> DesignDatabase::CloneCell(
    const Cell &source, const std::string &new_name) {
  if (FindCell(new_name)) {
    return absl::AlreadyExistsError(
        absl::StrCat("Cell \"", new_name, "\" already exists"));
  }
  std::unique_ptr<Cell> copy(new Cell(new_name));
  copy->set_description(source.description());
  copy->set_is_black_box(source.is_black_box());
  if (source.layout()) {
    copy->SetLayout(source.layout()->Clone().release());
  } else {
    copy->SetLayout(new Layout(physical_db_));
  }
  Cell *raw = copy.release();
  ConsumeCell(raw);
  VLOG(2) << "Cloned cell " << source.name() << " as " << new_name;
  return raw;
}

std::string DesignDatabase::UniqueCellName(const std::string &base) const {
  if (!FindCell(base))
    return base;
  for (size_t i = 1;; ++i) {
    std::string candidate = absl::StrCat(base, "_", i);
    if (!FindCell(candidate))
      return candidate;
  }
}

std::vector<const Cell*> DesignDatabase::DependenciesFirst(const Cell &top) {
  std::vector<const Cell*> ordered;
  std::set<const Cell*> visited;

  // Iterative post-order: a cell is emitted once all of its ancestors have
  // been.
  std::vector<std::pair<const Cell*, bool>> to_visit;
  to_visit.push_back({&top, false});
  while (!to_visit.empty()) {
    auto [cell, expanded] = to_visit.back();
    to_visit.pop_back();
    if (expanded) {
      ordered.push_back(cell);
      continue;
    }
    if (visited.find(cell) != visited.end())
      continue;
    visited.insert(cell);
    to_visit.push_back({cell, true});
    for (Cell *ancestor : cell->DirectAncestors()) {
      if (visited.find(ancestor) == visited.end()) {
        to_visit.push_back({ancestor, false});
      }
    }
  }
  return ordered;
}

bool DesignDatabase::IsTextFormatPath(const std::string &path) {
  return absl::EndsWith(path, ".txt") || absl::EndsWith(path, ".pbtxt");
}

::layup::proto::Design DesignDatabase::ToDesign(const Cell &top) const {
  ::layup::proto::Design design_pb;
  design_pb.set_top(top.name());
  for (const Cell *cell : DependenciesFirst(top)) {
    *design_pb.add_cells() = cell->ToProto();
  }
  return design_pb;
}

absl::Status DesignDatabase::WriteCell(const std::string &top_name,
                                       const std::string &path) const {
  Cell *top = FindCell(top_name);
  if (!top) {
    return absl::NotFoundError(
        absl::StrCat("Cell \"", top_name, "\" not found"));
  }
  return WriteCell(*top, path);
}

absl::Status DesignDatabase::WriteCell(const Cell &top,
                                       const std::string &path) const {
  ::layup::proto::Design design_pb = ToDesign(top);

  std::fstream output_file(
      path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!output_file.is_open()) {
    return absl::PermissionDeniedError(
        absl::StrCat("Could not open \"", path, "\" for writing"));
  }

  bool written = false;
  if (IsTextFormatPath(path)) {
    std::string text_format;
    written = google::protobuf::TextFormat::PrintToString(
        design_pb, &text_format);
    output_file << text_format;
  } else {
    written = design_pb.SerializeToOstream(&output_file);
  }
  output_file.close();
  if (!written || output_file.fail()) {
    return absl::InternalError(
        absl::StrCat("Failed to write design to \"", path, "\""));
  }
  LOG(INFO) << "Wrote " << design_pb.cells_size() << " cells to " << path;
  return absl::OkStatus();
}

absl::StatusOr<Cell*> DesignDatabase::ReadCell(const std::string &path) {
  std::ifstream input_file(path, std::ios::in | std::ios::binary);
  if (!input_file.is_open()) {
    return absl::NotFoundError(
        absl::StrCat("Could not open design file \"", path, "\""));
  }

  ::layup::proto::Design design_pb;
  if (IsTextFormatPath(path)) {
    std::ostringstream ss;
    ss << input_file.rdbuf();
    if (!google::protobuf::TextFormat::ParseFromString(ss.str(), &design_pb)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Could not parse text format design \"", path, "\""));
    }
  } else if (!design_pb.ParseFromIstream(&input_file)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse design \"", path, "\""));
  }
  return LoadDesign(design_pb);
}

absl::StatusOr<Cell*> DesignDatabase::LoadDesign(
    const ::layup::proto::Design &design_pb) {
  // Names in the file to the cells they were loaded as.
  std::map<std::string, Cell*> loaded;
  for (const auto &cell_pb : design_pb.cells()) {
    absl::StatusOr<std::unique_ptr<Cell>> cell = LoadCell(cell_pb, loaded);
    if (!cell.ok()) {
      return cell.status();
    }
    std::string name = UniqueCellName(cell_pb.name());
    LOG_IF(WARNING, name != cell_pb.name())
        << "Cell \"" << cell_pb.name() << "\" exists; loaded as \"" << name
        << "\"";
    (*cell)->set_name(name);
    Cell *raw = cell->release();
    ConsumeCell(raw);
    loaded[cell_pb.name()] = raw;
  }

  auto top = loaded.find(design_pb.top());
  if (top == loaded.end()) {
    return absl::NotFoundError(
        absl::StrCat("Design has no top cell named \"", design_pb.top(),
                     "\""));
  }
  LOG(INFO) << "Loaded " << loaded.size() << " cells; top is "
            << top->second->name();
  return top->second;
}

absl::StatusOr<std::unique_ptr<Cell>> DesignDatabase::LoadCell(
    const ::layup::proto::Cell &cell_pb,
    const std::map<std::string, Cell*> &loaded) {
  std::unique_ptr<Cell> cell(new Cell(cell_pb.name()));
  cell->set_description(cell_pb.description());
  cell->set_is_black_box(cell_pb.black_box());
  Layout *layout = new Layout(physical_db_);
  cell->SetLayout(layout);

  for (const auto &entry : cell_pb.stackup().materials()) {
    Material material = Material::FromProto(entry.second);
    if (material.name.empty()) {
      material.name = entry.first;
    }
    physical_db_.UpsertMaterial(material);
  }
  absl::StatusOr<LayerCollection> collection =
      LayerCollection::FromProto(cell_pb.stackup());
  if (!collection.ok()) {
    return collection.status();
  }
  layout->SetLayerCollection(
      std::make_shared<const LayerCollection>(*collection));

  for (const std::string &net : cell_pb.nets()) {
    layout->AddNet(net);
  }
  for (const auto &primitive_pb : cell_pb.primitives()) {
    layout->AddPrimitive(Primitive::FromProto(primitive_pb));
  }
  for (const auto &instance_pb : cell_pb.padstack_instances()) {
    layout->AddPadstackInstance(PadstackInstance::FromProto(instance_pb));
  }
  for (const auto &component_pb : cell_pb.components()) {
    absl::StatusOr<Component> component = Component::FromProto(component_pb);
    if (!component.ok()) {
      return component.status();
    }
    if (!layout->AddComponent(*component)) {
      return absl::AlreadyExistsError(
          absl::StrCat("Cell \"", cell_pb.name(), "\" has two components "
                       "named \"", component->name(), "\""));
    }
  }
  for (const auto &instance_pb : cell_pb.cell_instances()) {
    Cell *template_cell = nullptr;
    if (!instance_pb.template_cell().empty()) {
      auto it = loaded.find(instance_pb.template_cell());
      template_cell = it != loaded.end() ?
          it->second : FindCell(instance_pb.template_cell());
      if (!template_cell) {
        return absl::NotFoundError(
            absl::StrCat("Instance \"", instance_pb.name(), "\" in cell \"",
                         cell_pb.name(), "\" refers to unknown cell \"",
                         instance_pb.template_cell(), "\""));
      }
    }
    layout->AddCellInstance(
        CellInstance::FromProto(instance_pb, template_cell));
  }

  VLOG(3) << "Loaded cell " << cell_pb.name() << " with "
          << layout->primitives().size() << " primitives and "
          << layout->padstack_instances().size() << " padstack instances";
  return cell;
}

std::string DesignDatabase::Describe() const {
  std::stringstream ss;
  for (const auto &entry : cells_) {
    const Cell *const cell = entry.second.get();
    ss << entry.first;
    if (cell->is_black_box()) {
      ss << " (black box)";
    }
    if (cell->layout()) {
      ss << "\t" << cell->layout()->primitives().size() << " primitives, "
         << cell->layout()->padstack_instances().size() << " padstacks, "
         << cell->layout()->components().size() << " components";
    }
    ss << std::endl;
  }
  return ss.str();
}

std::ostream &operator<<(std::ostream &os, const DesignDatabase &design_db) {
  os << design_db.Describe();
  return os;
}

}  // namespace layup
