#include <iostream>
#include <stdlib.h>
#include <string>
#include <utility>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <google/protobuf/stubs/common.h>

#include "cell.h"
#include "cutout.h"
#include "design_database.h"
#include "physical_properties_database.h"
#include "stackup.h"
#include "stackup_io.h"
#include "stackup_transformer.h"

#include "c_make_header.h"

DEFINE_string(design, "", "Path to the layup.Design protobuf to read");
DEFINE_string(cell, "",
              "Cell to work on; defaults to the top cell of --design");
DEFINE_string(output, "", "Where to write the result");

DEFINE_string(import_stackup, "",
              "Replace the cell's stackup with this .json or .csv file first");
DEFINE_string(export_stackup, "",
              "Write the resulting stackup to this .json or .csv file");
DEFINE_bool(include_material_with_layer, false,
            "Exported JSON stackups carry material definitions per layer");
DEFINE_bool(flip, false, "Flip the cell upside down");

DEFINE_string(signal_nets, "", "Comma-separated nets to cut around");
DEFINE_string(reference_nets, "GND",
              "Comma-separated nets to clip to the extent");
DEFINE_string(extent_type, "ConvexHull",
              "Conforming, ConvexHull or BoundingBox");
DEFINE_double(expansion_size, 0.002, "Extent expansion, metres");
DEFINE_bool(use_round_corner, false, "Round the corners of the expansion");
DEFINE_int32(number_of_threads, 4, "Cutout worker threads");
DEFINE_string(custom_extent, "",
              "Cut along this polygon instead: \"x0,y0;x1,y1;...\"");
DEFINE_string(custom_extent_units, "mm", "Units of --custom_extent");
DEFINE_double(extent_defeature, 0.0,
              "Defeature conforming extents by this much, metres");
DEFINE_bool(remove_single_pin_components, false,
            "Remove R, L and C components left with one pin");
DEFINE_bool(include_partial_instances, false,
            "Keep padstack instances whose pad only overlaps the extent");
DEFINE_bool(keep_voids, true, "Clipped primitives keep their voids");

namespace {

std::vector<std::string> SplitList(const std::string &list) {
  return absl::StrSplit(list, ',', absl::SkipWhitespace());
}

absl::StatusOr<std::vector<std::pair<double, double>>> ParseExtent(
    const std::string &text) {
  std::vector<std::pair<double, double>> points;
  for (const std::string &point :
           absl::StrSplit(text, ';', absl::SkipWhitespace())) {
    std::vector<std::string> coordinates = absl::StrSplit(point, ',');
    std::pair<double, double> xy;
    if (coordinates.size() != 2 ||
        !absl::SimpleAtod(coordinates[0], &xy.first) ||
        !absl::SimpleAtod(coordinates[1], &xy.second)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Bad custom extent point: \"", point, "\""));
    }
    points.push_back(xy);
  }
  return points;
}

absl::StatusOr<layup::CutoutOptions> CutoutOptionsFromFlags() {
  layup::CutoutOptions options;
  options.signal_nets = SplitList(FLAGS_signal_nets);
  options.reference_nets = SplitList(FLAGS_reference_nets);

  auto extent_type = layup::ParseExtentType(FLAGS_extent_type);
  if (!extent_type.ok()) {
    return extent_type.status();
  }
  options.extent_type = *extent_type;

  options.expansion_size = FLAGS_expansion_size;
  options.use_round_corner = FLAGS_use_round_corner;
  if (FLAGS_number_of_threads < 1) {
    return absl::InvalidArgumentError(
        "--number_of_threads must be at least 1");
  }
  options.number_of_threads = FLAGS_number_of_threads;

  auto custom_extent = ParseExtent(FLAGS_custom_extent);
  if (!custom_extent.ok()) {
    return custom_extent.status();
  }
  options.custom_extent = *custom_extent;
  options.custom_extent_units = FLAGS_custom_extent_units;
  options.extent_defeature = FLAGS_extent_defeature;
  options.remove_single_pin_components = FLAGS_remove_single_pin_components;
  options.include_partial_instances = FLAGS_include_partial_instances;
  options.keep_voids = FLAGS_keep_voids;
  options.output_path = FLAGS_output;
  return options;
}

absl::Status Run() {
  // The design database contains our design and all our dependencies.
  layup::DesignDatabase design_db;
  layup::PhysicalPropertiesDatabase &physical_db = design_db.physical_db();

  absl::StatusOr<layup::Cell*> top = design_db.ReadCell(FLAGS_design);
  if (!top.ok()) {
    return top.status();
  }
  layup::Cell *cell = *top;
  if (!FLAGS_cell.empty()) {
    cell = design_db.FindCell(FLAGS_cell);
    if (cell == nullptr) {
      return absl::NotFoundError(absl::StrCat(
          "No cell \"", FLAGS_cell, "\" in ", FLAGS_design));
    }
  }

  if (!FLAGS_import_stackup.empty()) {
    layup::Stackup stackup(&physical_db, cell->layout());
    absl::Status status = layup::StackupIo::Import(
        &stackup, FLAGS_import_stackup);
    if (!status.ok()) {
      return status;
    }
  }

  if (FLAGS_flip) {
    layup::StackupTransformer transformer(&physical_db, cell);
    absl::Status status = transformer.FlipDesign();
    if (!status.ok()) {
      return status;
    }
  }

  bool written = false;
  if (!FLAGS_signal_nets.empty() || !FLAGS_custom_extent.empty()) {
    auto options = CutoutOptionsFromFlags();
    if (!options.ok()) {
      return options.status();
    }
    layup::CutoutEngine engine(&design_db);
    absl::StatusOr<layup::Cell*> cut = engine.Cutout(cell, *options);
    if (!cut.ok()) {
      return cut.status();
    }
    cell = *cut;
    written = !FLAGS_output.empty();
  }

  if (!FLAGS_output.empty() && !written) {
    absl::Status status = design_db.WriteCell(*cell, FLAGS_output);
    if (!status.ok()) {
      return status;
    }
  }

  if (!FLAGS_export_stackup.empty()) {
    layup::Stackup stackup(&physical_db, cell->layout());
    absl::Status status = layup::StackupIo::Export(
        stackup, FLAGS_export_stackup, FLAGS_include_material_with_layer);
    if (!status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

}   // namespace

int main(int argc, char **argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  std::string version =
      "layup v" xstr(layup_VERSION_MAJOR) "." xstr(layup_VERSION_MINOR);
  std::cout << version << std::endl;
  LOG(INFO) << version << " start";

  if (FLAGS_design.empty()) {
    LOG(ERROR) << "--design is required";
    return EXIT_FAILURE;
  }

  absl::Status status = Run();

  google::protobuf::ShutdownProtobufLibrary();

  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
