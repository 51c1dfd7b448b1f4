#include "cutout.h"

#include <cstdint>
#include <exception>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <boost/geometry/core/exception.hpp>

#include "cell.h"
#include "component.h"
#include "design_database.h"
#include "fork_join.h"
#include "layout.h"
#include "padstack_instance.h"
#include "physical_properties_database.h"
#include "primitive.h"
#include "geometry/point.h"
#include "geometry/polygon.h"
#include "geometry/rectangle.h"
#include "geometry/region.h"

namespace layup {

using geometry::IntersectionType;
using geometry::Point;
using geometry::Polygon;
using geometry::Rectangle;
using geometry::Region;

namespace {

bool IsDiscrete(ComponentType type) {
  return type == ComponentType::kResistor ||
         type == ComponentType::kInductor ||
         type == ComponentType::kCapacitor;
}

void LogPhase(const std::string &phase, absl::Time *start) {
  absl::Time now = absl::Now();
  LOG(INFO) << phase << " took " << absl::FormatDuration(now - *start);
  *start = now;
}

}  // namespace

absl::StatusOr<ExtentType> ParseExtentType(const std::string &name) {
  std::string lower = absl::AsciiStrToLower(name);
  if (lower == "conforming")
    return ExtentType::kConforming;
  if (lower == "convexhull" || lower == "convex_hull")
    return ExtentType::kConvexHull;
  if (lower == "boundingbox" || lower == "bounding_box" ||
      lower == "bounding")
    return ExtentType::kBoundingBox;
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown extent type: \"", name, "\""));
}

const char *ExtentTypeName(ExtentType type) {
  switch (type) {
    case ExtentType::kConforming:
      return "Conforming";
    case ExtentType::kConvexHull:
      return "ConvexHull";
    case ExtentType::kBoundingBox:
      return "BoundingBox";
  }
  return "ConvexHull";
}

std::ostream &operator<<(std::ostream &os, const ExtentType &type) {
  os << ExtentTypeName(type);
  return os;
}

absl::StatusOr<Cell*> CutoutEngine::Cutout(Cell *source,
                                           const CutoutOptions &options) {
  if (!source || !source->layout()) {
    return absl::InvalidArgumentError("Cutout source has no layout");
  }
  if (options.signal_nets.empty() && options.custom_extent.empty()) {
    return absl::InvalidArgumentError(
        "A cutout needs signal nets or a custom extent");
  }
  if (options.expansion_size < 0.0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Expansion size must not be negative, got ", options.expansion_size));
  }

  Cell *target = source;
  if (!options.output_path.empty()) {
    if (!design_db_) {
      return absl::FailedPreconditionError(
          "Writing a cutout needs a design database");
    }
    std::string name = options.output_cell_name.empty() ?
        design_db_->UniqueCellName(absl::StrCat(source->name(), "_cutout")) :
        options.output_cell_name;
    absl::StatusOr<Cell*> copy = design_db_->CloneCell(*source, name);
    if (!copy.ok()) {
      return copy.status();
    }
    target = *copy;
  }

  LOG(INFO) << "Cutout of " << source->name() << " started; signal nets: ["
            << absl::StrJoin(options.signal_nets, ", ")
            << "], reference nets: ["
            << absl::StrJoin(options.reference_nets, ", ") << "], "
            << options.extent_type << " extent";
  absl::Time start = absl::Now();

  absl::Status status = CutLayout(target->layout(), options);
  if (status.ok() && !options.output_path.empty()) {
    status = design_db_->WriteCell(*target, options.output_path);
  }
  if (!status.ok()) {
    LOG(ERROR) << "Cutout of " << source->name() << " failed: " << status;
    if (target != source) {
      design_db_->DeleteCell(target->name());
    }
    return status;
  }
  LOG(INFO) << "Cutout of " << source->name() << " into " << target->name()
            << " completed in " << absl::FormatDuration(absl::Now() - start);
  return target;
}

absl::Status CutoutEngine::CutLayout(Layout *layout,
                                     const CutoutOptions &options) const {
  std::vector<std::string> reference_nets = options.reference_nets;
  std::vector<std::string> all_nets;
  if (!options.custom_extent.empty()) {
    // Everything is clipped along the custom polygon.
    reference_nets.insert(reference_nets.end(),
                          options.signal_nets.begin(),
                          options.signal_nets.end());
    all_nets = reference_nets;
  } else {
    all_nets = options.signal_nets;
    all_nets.insert(all_nets.end(),
                    reference_nets.begin(), reference_nets.end());
  }

  absl::Time phase_start = absl::Now();
  std::vector<int64_t> reference_padstacks;
  std::vector<int64_t> reference_primitives;
  RemoveUnusedNets(layout, all_nets, reference_nets,
                   &reference_padstacks, &reference_primitives);
  LogPhase("Net clean up", &phase_start);

  absl::StatusOr<Region> extent = ComputeExtent(*layout, options);
  if (!extent.ok()) {
    return extent.status();
  }
  if (extent->Empty()) {
    return absl::FailedPreconditionError(
        absl::StrCat("Could not create a cutout extent around nets [",
                     absl::StrJoin(options.signal_nets, ", "), "]"));
  }
  VLOG(2) << "Cutout extent: " << *extent;
  LogPhase("Extent creation", &phase_start);

  absl::Status status = ClipPadstackInstances(
      layout, *extent, reference_padstacks, options);
  if (!status.ok())
    return status;
  LogPhase("Padstack instance removal", &phase_start);

  status = ClipPrimitives(layout, *extent, reference_primitives, options);
  if (!status.ok())
    return status;
  LogPhase("Primitive clean up", &phase_start);

  RemoveOrphanedComponents(layout, options);
  LogPhase("Component clean up", &phase_start);
  return absl::OkStatus();
}

absl::StatusOr<Region> CutoutEngine::ComputeExtent(
    const Layout &layout, const CutoutOptions &options) const {
  const PhysicalPropertiesDatabase &physical_db = layout.physical_db();
  if (options.expansion_size < 0.0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Expansion size must not be negative, got ", options.expansion_size));
  }

  if (!options.custom_extent.empty()) {
    absl::StatusOr<double> metres_per_unit =
        PhysicalPropertiesDatabase::UnitsToMetres(options.custom_extent_units);
    if (!metres_per_unit.ok()) {
      return metres_per_unit.status();
    }
    Polygon polygon;
    for (const auto &[x, y] : options.custom_extent) {
      polygon.AddVertex(Point(
          physical_db.ToInternalUnits(x * *metres_per_unit),
          physical_db.ToInternalUnits(y * *metres_per_unit)));
    }
    if (polygon.Empty()) {
      return absl::InvalidArgumentError(
          "A custom extent needs at least 3 distinct points");
    }
    return Region::FromPolygon(polygon);
  }

  std::set<std::string> signal_nets(
      options.signal_nets.begin(), options.signal_nets.end());
  std::vector<Polygon> signal_geometry;
  for (const auto &entry : layout.primitives()) {
    const Primitive &primitive = *entry.second;
    if (primitive.is_void() ||
        signal_nets.find(primitive.net()) == signal_nets.end())
      continue;
    signal_geometry.push_back(primitive.outline());
  }
  for (const auto &entry : layout.padstack_instances()) {
    const PadstackInstance &instance = *entry.second;
    if (signal_nets.find(instance.net()) == signal_nets.end())
      continue;
    Polygon pad = Polygon::FromRectangle(instance.GetPadBox());
    if (!pad.Empty()) {
      signal_geometry.push_back(pad);
    }
  }
  VLOG(2) << signal_geometry.size() << " shapes on the signal nets";
  if (signal_geometry.empty()) {
    return Region();
  }

  int64_t expansion = physical_db.ToInternalUnits(options.expansion_size);
  try {
    switch (options.extent_type) {
      case ExtentType::kConforming: {
        Region extent;
        for (const Polygon &polygon : signal_geometry) {
          extent = extent.Union(Region::FromPolygon(polygon).Expanded(
              expansion, options.use_round_corner));
        }
        if (options.extent_defeature > 0.0) {
          extent = extent.Defeatured(
              physical_db.ToInternalUnits(options.extent_defeature));
        }
        return extent;
      }
      case ExtentType::kBoundingBox: {
        Rectangle bounding_box = signal_geometry.front().GetBoundingBox();
        for (const Polygon &polygon : signal_geometry) {
          Rectangle::ExpandBounds(polygon.GetBoundingBox(), &bounding_box);
        }
        return Region::FromRectangle(bounding_box.WithPadding(expansion));
      }
      case ExtentType::kConvexHull:
      default:
        return Region::FromPolygons(signal_geometry).ConvexHull().Expanded(
            expansion, options.use_round_corner);
    }
  } catch (const boost::geometry::exception &e) {
    return absl::InternalError(
        absl::StrCat("Extent computation failed: ", e.what()));
  } catch (const std::exception &e) {
    return absl::InternalError(
        absl::StrCat("Extent computation failed: ", e.what()));
  }
}

void CutoutEngine::RemoveUnusedNets(
    Layout *layout,
    const std::vector<std::string> &all_nets,
    const std::vector<std::string> &reference_nets,
    std::vector<int64_t> *reference_padstacks,
    std::vector<int64_t> *reference_primitives) const {
  std::set<std::string> keep(all_nets.begin(), all_nets.end());
  std::set<std::string> reference(reference_nets.begin(),
                                  reference_nets.end());

  std::set<std::string> nets = layout->nets();
  size_t nets_removed = 0;
  for (const std::string &net : nets) {
    if (keep.find(net) == keep.end()) {
      layout->DeleteNet(net);
      ++nets_removed;
    }
  }

  std::vector<int64_t> doomed;
  for (const auto &entry : layout->padstack_instances()) {
    const std::string &net = entry.second->net();
    if (keep.find(net) == keep.end()) {
      doomed.push_back(entry.first);
    } else if (reference.find(net) != reference.end()) {
      reference_padstacks->push_back(entry.first);
    }
  }
  for (int64_t id : doomed) {
    layout->DeletePadstackInstance(id);
  }
  size_t padstacks_removed = doomed.size();

  doomed.clear();
  for (const auto &entry : layout->primitives()) {
    const Primitive &primitive = *entry.second;
    if (keep.find(primitive.net()) == keep.end()) {
      doomed.push_back(entry.first);
    } else if (reference.find(primitive.net()) != reference.end() &&
               !primitive.is_void()) {
      reference_primitives->push_back(entry.first);
    }
  }
  for (int64_t id : doomed) {
    layout->DeletePrimitive(id);
  }

  LOG(INFO) << "Removed " << nets_removed << " nets, " << padstacks_removed
            << " padstack instances and " << doomed.size()
            << " primitives outside the cutout nets";
}

absl::Status CutoutEngine::ClipPadstackInstances(
    Layout *layout,
    const Region &extent,
    const std::vector<int64_t> &reference_padstacks,
    const CutoutOptions &options) const {
  std::vector<const PadstackInstance*> instances;
  for (int64_t id : reference_padstacks) {
    const PadstackInstance *instance = layout->FindPadstackInstance(id);
    LOG_IF(FATAL, !instance) << "Padstack instance " << id << " vanished";
    instances.push_back(instance);
  }

  std::vector<char> outside(instances.size(), 0);
  absl::Status status = ForkJoinWithStatus(
      options.number_of_threads, instances.size(),
      [&](size_t i) -> absl::Status {
    const PadstackInstance &instance = *instances[i];
    try {
      bool inside = extent.Contains(instance.position()) ||
          (options.include_partial_instances &&
           extent.Intersects(instance.GetPadBox()));
      outside[i] = inside ? 0 : 1;
    } catch (const boost::geometry::exception &e) {
      return absl::InternalError(
          absl::StrCat("Could not classify padstack instance ",
                       instance.id(), ": ", e.what()));
    }
    return absl::OkStatus();
  });
  if (!status.ok())
    return status;

  size_t removed = 0;
  for (size_t i = 0; i < instances.size(); ++i) {
    if (!outside[i])
      continue;
    layout->DeletePadstackInstance(reference_padstacks[i]);
    ++removed;
  }
  LOG(INFO) << "Removed " << removed << " of " << instances.size()
            << " reference padstack instances";
  return absl::OkStatus();
}

CutoutEngine::PrimitiveVerdict CutoutEngine::ClassifyPrimitive(
    const Region &extent, const Primitive &primitive, bool keep_voids) {
  PrimitiveVerdict verdict;

  // Adds one single-polygon region as a new primitive, plus the voids (by
  // index into the primitive's voids) that it should carry.
  auto add_piece = [&](const Region &piece,
                       const std::vector<size_t> &void_indices) {
    std::vector<Polygon> outlines = piece.Outlines();
    if (outlines.empty() || outlines.front().Empty())
      return;
    ClippedPiece clipped {.outline = outlines.front(), .voids = piece.Holes()};
    for (size_t index : void_indices) {
      clipped.voids.push_back(primitive.voids()[index]);
    }
    verdict.pieces.push_back(clipped);
  };

  try {
    Region outline = Region::FromPolygon(primitive.outline());
    IntersectionType type = extent.Classify(outline);
    if (type == IntersectionType::kDisjoint) {
      verdict.remove = true;
      return verdict;
    }
    if (type == IntersectionType::kContains) {
      return verdict;
    }
    verdict.remove = true;

    std::vector<Region> voids;
    for (const Polygon &void_outline : primitive.voids()) {
      voids.push_back(Region::FromPolygon(void_outline));
    }

    for (const Region &piece : extent.Intersection(outline).Split()) {
      if (piece.Empty())
        continue;
      if (!keep_voids) {
        add_piece(piece, {});
        continue;
      }

      std::vector<size_t> inside;
      Region to_subtract;
      bool subtract = false;
      for (size_t i = 0; i < voids.size(); ++i) {
        switch (piece.Classify(voids[i])) {
          case IntersectionType::kContains:
            inside.push_back(i);
            break;
          case IntersectionType::kContainedBy:
          case IntersectionType::kOverlaps:
            to_subtract = to_subtract.Union(voids[i]);
            subtract = true;
            break;
          default:
            // Voids that miss the piece are dropped.
            break;
        }
      }
      if (!subtract) {
        add_piece(piece, inside);
        continue;
      }

      for (const Region &cleaned : piece.Difference(to_subtract).Split()) {
        if (cleaned.Empty())
          continue;
        std::vector<size_t> kept;
        for (size_t index : inside) {
          if (cleaned.Classify(voids[index]) == IntersectionType::kContains) {
            kept.push_back(index);
          }
        }
        add_piece(cleaned, kept);
      }
    }
  } catch (const boost::geometry::exception &e) {
    verdict.status = absl::InternalError(
        absl::StrCat("Could not clip primitive ", primitive.id(), ": ",
                     e.what()));
  }
  return verdict;
}

absl::Status CutoutEngine::ClipPrimitives(
    Layout *layout,
    const Region &extent,
    const std::vector<int64_t> &reference_primitives,
    const CutoutOptions &options) const {
  std::vector<const Primitive*> primitives;
  for (int64_t id : reference_primitives) {
    const Primitive *primitive = layout->FindPrimitive(id);
    LOG_IF(FATAL, !primitive) << "Primitive " << id << " vanished";
    primitives.push_back(primitive);
  }

  std::vector<PrimitiveVerdict> verdicts(primitives.size());
  absl::Status status = ForkJoinWithStatus(
      options.number_of_threads, primitives.size(),
      [&](size_t i) -> absl::Status {
    verdicts[i] = ClassifyPrimitive(extent, *primitives[i], options.keep_voids);
    return verdicts[i].status;
  });
  if (!status.ok())
    return status;

  size_t created = 0;
  for (size_t i = 0; i < primitives.size(); ++i) {
    const Primitive &original = *primitives[i];
    for (const ClippedPiece &piece : verdicts[i].pieces) {
      Primitive replacement(original.layer(), original.net(), piece.outline);
      for (const Polygon &void_outline : piece.voids) {
        replacement.AddVoid(void_outline);
      }
      layout->AddPrimitive(replacement);
      ++created;
    }
  }
  size_t removed = 0;
  for (size_t i = 0; i < primitives.size(); ++i) {
    if (!verdicts[i].remove)
      continue;
    layout->DeletePrimitive(reference_primitives[i]);
    ++removed;
  }
  LOG(INFO) << "Removed " << removed << " of " << primitives.size()
            << " reference primitives and created " << created
            << " clipped ones";
  return absl::OkStatus();
}

void CutoutEngine::RemoveOrphanedComponents(
    Layout *layout, const CutoutOptions &options) const {
  std::vector<std::string> unpinned;
  std::vector<std::string> single_pinned;
  for (const auto &entry : layout->components()) {
    size_t num_pins = layout->PinsOf(entry.first).size();
    if (num_pins == 0) {
      unpinned.push_back(entry.first);
    } else if (num_pins == 1 && options.remove_single_pin_components &&
               IsDiscrete(entry.second->type())) {
      single_pinned.push_back(entry.first);
    }
  }
  for (const std::string &name : unpinned) {
    layout->DeleteComponent(name);
  }
  LOG(INFO) << "Deleted " << unpinned.size() << " components with no pins";
  if (options.remove_single_pin_components) {
    for (const std::string &name : single_pinned) {
      layout->DeleteComponent(name);
    }
    LOG(INFO) << "Deleted " << single_pinned.size()
              << " single-pin components";
  }
}

}  // namespace layup
