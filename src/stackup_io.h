#ifndef STACKUP_IO_H_
#define STACKUP_IO_H_

#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "layer_type.h"
#include "stackup.h"
#include "layup.pb.h"

namespace layup {

// Reads and writes stackup definitions.
//
// JSON files hold a StackupDefinition message in the protobuf JSON mapping.
// CSV files hold one stackup layer per row, top first, under the header
//   Name,Type,Material,Dielectric_Fill,Thickness
// with thicknesses in metres or with explicit units ("35um").
//
// Importing replaces the stackup layers with the ones in the file, in the
// file's order: layers that already exist are updated in place, new ones are
// added, and those the file doesn't mention are removed. Non-stackup layers
// not mentioned by the file are kept. The result is installed in one step.
class StackupIo {
 public:
  static constexpr char kCsvHeader[] =
      "Name,Type,Material,Dielectric_Fill,Thickness";

  // Chooses the format from the extension (".json" or ".csv"). Anything else
  // is Unimplemented.
  static absl::Status Export(const Stackup &stackup, const std::string &path,
                             bool include_material_with_layer = false);
  static absl::Status Import(Stackup *stackup, const std::string &path);

  // With include_material_with_layer, each layer carries the definitions of
  // its materials; otherwise the whole material library is written alongside
  // the layers.
  static absl::Status ExportJson(const Stackup &stackup,
                                 const std::string &path,
                                 bool include_material_with_layer);
  static absl::Status ImportJson(Stackup *stackup, const std::string &path);

  static absl::Status ExportCsv(const Stackup &stackup,
                                const std::string &path);
  static absl::Status ImportCsv(Stackup *stackup, const std::string &path);

  static ::layup::proto::StackupDefinition ToDefinition(
      const Stackup &stackup, bool include_material_with_layer);
  static absl::Status ApplyDefinition(
      Stackup *stackup, const ::layup::proto::StackupDefinition &stackup_pb);

  static std::string ToCsv(const Stackup &stackup);
  static absl::Status ApplyCsv(Stackup *stackup, const std::string &csv);

 private:
  struct CsvRow {
    std::string name;
    LayerType type;
    std::string material;
    std::string fill_material;
    double thickness;
  };

  static absl::StatusOr<std::vector<CsvRow>> ParseCsv(const std::string &csv);

  static absl::StatusOr<std::string> ReadFile(const std::string &path);
  static absl::Status WriteFile(const std::string &path,
                                const std::string &contents);
};

}  // namespace layup

#endif  // STACKUP_IO_H_
