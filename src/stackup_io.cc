#include "stackup_io.h"

#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <google/protobuf/util/json_util.h>

#include "layer_collection.h"
#include "layer_type.h"
#include "physical_properties_database.h"
#include "stackup_layer.h"

namespace layup {

namespace {

void UpsertDefinition(const ::layup::proto::Material &material_pb,
                      const std::string &fallback_name,
                      PhysicalPropertiesDatabase *physical_db) {
  Material material = Material::FromProto(material_pb);
  if (material.name.empty()) {
    material.name = fallback_name;
  }
  if (material.name.empty()) {
    return;
  }
  physical_db->UpsertMaterial(material);
}

void WarnIfUnknown(const PhysicalPropertiesDatabase &physical_db,
                   const StackupLayer &layer) {
  for (const std::string &name : {layer.material(), layer.fill_material()}) {
    if (!name.empty() && !physical_db.HasMaterial(name)) {
      LOG(WARNING) << "Layer \"" << layer.name() << "\" refers to material \""
                   << name << "\", which is not in the material library";
    }
  }
}

std::string Extension(const std::string &path) {
  size_t slash = path.find_last_of('/');
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos ||
      (slash != std::string::npos && dot < slash)) {
    return "";
  }
  return absl::AsciiStrToLower(path.substr(dot + 1));
}

}   // namespace

absl::Status StackupIo::Export(
    const Stackup &stackup, const std::string &path,
    bool include_material_with_layer) {
  std::string extension = Extension(path);
  if (extension == "json") {
    return ExportJson(stackup, path, include_material_with_layer);
  } else if (extension == "csv") {
    return ExportCsv(stackup, path);
  }
  return absl::UnimplementedError(absl::StrCat(
      "Can't export a stackup to \"", path, "\": unsupported format \"",
      extension, "\""));
}

absl::Status StackupIo::Import(Stackup *stackup, const std::string &path) {
  std::string extension = Extension(path);
  if (extension == "json") {
    return ImportJson(stackup, path);
  } else if (extension == "csv") {
    return ImportCsv(stackup, path);
  }
  return absl::UnimplementedError(absl::StrCat(
      "Can't import a stackup from \"", path, "\": unsupported format \"",
      extension, "\""));
}

::layup::proto::StackupDefinition StackupIo::ToDefinition(
    const Stackup &stackup, bool include_material_with_layer) {
  const PhysicalPropertiesDatabase &physical_db = *stackup.physical_db();
  ::layup::proto::StackupDefinition stackup_pb =
      stackup.collection()->ToProto();

  if (!include_material_with_layer) {
    for (const auto &entry : physical_db.materials()) {
      (*stackup_pb.mutable_materials())[entry.second.name] =
          entry.second.ToProto();
    }
    return stackup_pb;
  }

  auto attach = [&](::layup::proto::Layer *layer_pb) {
    auto material = physical_db.FindMaterial(layer_pb->material());
    if (material) {
      *layer_pb->mutable_material_definition() = material->get().ToProto();
    }
    auto fill = physical_db.FindMaterial(layer_pb->fill_material());
    if (fill) {
      *layer_pb->mutable_fill_material_definition() = fill->get().ToProto();
    }
  };
  for (::layup::proto::Layer &layer_pb : *stackup_pb.mutable_layers()) {
    attach(&layer_pb);
  }
  for (::layup::proto::Layer &layer_pb :
           *stackup_pb.mutable_non_stackup_layers()) {
    attach(&layer_pb);
  }
  return stackup_pb;
}

absl::Status StackupIo::ApplyDefinition(
    Stackup *stackup, const ::layup::proto::StackupDefinition &stackup_pb) {
  PhysicalPropertiesDatabase *physical_db = stackup->physical_db();
  std::shared_ptr<const LayerCollection> current = stackup->collection();

  ::layup::proto::StackupDefinition definition = stackup_pb;
  if (definition.mode().empty()) {
    definition.set_mode(StackupModeName(current->mode()));
  }

  absl::StatusOr<LayerCollection> imported =
      LayerCollection::FromProto(definition);
  if (!imported.ok()) {
    return imported.status();
  }

  for (const auto &entry : definition.materials()) {
    UpsertDefinition(entry.second, entry.first, physical_db);
  }
  auto upsert_layer_materials = [&](const ::layup::proto::Layer &layer_pb) {
    if (layer_pb.has_material_definition()) {
      UpsertDefinition(
          layer_pb.material_definition(), layer_pb.material(), physical_db);
    }
    if (layer_pb.has_fill_material_definition()) {
      UpsertDefinition(layer_pb.fill_material_definition(),
                       layer_pb.fill_material(),
                       physical_db);
    }
  };
  for (const ::layup::proto::Layer &layer_pb : definition.layers()) {
    upsert_layer_materials(layer_pb);
  }
  for (const ::layup::proto::Layer &layer_pb :
           definition.non_stackup_layers()) {
    upsert_layer_materials(layer_pb);
  }

  LayerCollection next = *imported;
  for (const StackupLayer &layer : current->non_stackup_layers()) {
    if (next.HasLayer(layer.name())) {
      continue;
    }
    absl::Status status = next.AddNonStackupLayer(layer);
    if (!status.ok()) {
      return status;
    }
  }

  for (const StackupLayer &layer : current->stackup_layers()) {
    if (!next.HasLayer(layer.name())) {
      VLOG(1) << "Removing layer \"" << layer.name()
              << "\", which the imported stackup doesn't have";
    }
  }
  for (const StackupLayer &layer : next.Layers()) {
    WarnIfUnknown(*physical_db, layer);
  }

  stackup->Commit(next);
  return absl::OkStatus();
}

absl::Status StackupIo::ExportJson(const Stackup &stackup,
                                   const std::string &path,
                                   bool include_material_with_layer) {
  ::layup::proto::StackupDefinition stackup_pb =
      ToDefinition(stackup, include_material_with_layer);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(
      stackup_pb, &json, options);
  if (!status.ok()) {
    return absl::InternalError(absl::StrCat(
        "Could not convert stackup to JSON: ", status.ToString()));
  }
  absl::Status written = WriteFile(path, json);
  if (written.ok()) {
    LOG(INFO) << "Wrote stackup (" << stackup_pb.layers_size()
              << " stackup layers) to " << path;
  }
  return written;
}

absl::Status StackupIo::ImportJson(Stackup *stackup, const std::string &path) {
  absl::StatusOr<std::string> json = ReadFile(path);
  if (!json.ok()) {
    return json.status();
  }

  ::layup::proto::StackupDefinition stackup_pb;
  google::protobuf::util::JsonParseOptions options;
  auto status = google::protobuf::util::JsonStringToMessage(
      *json, &stackup_pb, options);
  if (!status.ok()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Could not parse stackup from \"", path, "\": ", status.ToString()));
  }

  absl::Status applied = ApplyDefinition(stackup, stackup_pb);
  if (applied.ok()) {
    LOG(INFO) << "Imported stackup (" << stackup_pb.layers_size()
              << " stackup layers) from " << path;
  }
  return applied;
}

std::string StackupIo::ToCsv(const Stackup &stackup) {
  std::vector<std::string> lines = {kCsvHeader};
  for (const StackupLayer &layer : stackup.StackupLayers()) {
    lines.push_back(absl::StrJoin(
        {layer.name(),
         std::string(LayerTypeName(layer.type())),
         layer.material(),
         layer.fill_material(),
         absl::StrFormat("%.12g", layer.thickness())}, ","));
  }
  return absl::StrCat(absl::StrJoin(lines, "\n"), "\n");
}

absl::Status StackupIo::ExportCsv(const Stackup &stackup,
                                  const std::string &path) {
  absl::Status written = WriteFile(path, ToCsv(stackup));
  if (written.ok()) {
    LOG(INFO) << "Wrote stackup to " << path;
  }
  return written;
}

absl::StatusOr<std::vector<StackupIo::CsvRow>> StackupIo::ParseCsv(
    const std::string &csv) {
  std::vector<CsvRow> rows;
  bool seen_header = false;
  int line_number = 0;
  for (absl::string_view line : absl::StrSplit(csv, '\n')) {
    ++line_number;
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) {
      continue;
    }
    std::vector<std::string> fields = absl::StrSplit(line, ',');
    for (std::string &field : fields) {
      absl::StripAsciiWhitespace(&field);
    }

    if (!seen_header) {
      std::vector<std::string> expected = absl::StrSplit(kCsvHeader, ',');
      bool matches = fields.size() == expected.size();
      for (size_t i = 0; matches && i < fields.size(); ++i) {
        matches = absl::EqualsIgnoreCase(fields[i], expected[i]);
      }
      if (!matches) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Stackup CSV header must be \"", kCsvHeader, "\", got \"",
            line, "\""));
      }
      seen_header = true;
      continue;
    }

    if (fields.size() != 5) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Line %d: expected 5 fields, got %d", line_number, fields.size()));
    }
    if (fields[0].empty()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Line %d: layer has no name", line_number));
    }
    absl::StatusOr<LayerType> type = ParseLayerType(fields[1]);
    if (!type.ok()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Line %d: %s", line_number, type.status().message()));
    }
    if (!IsStackupType(*type)) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Line %d: \"%s\" layers are not stackup layers",
          line_number, LayerTypeName(*type)));
    }
    absl::StatusOr<double> thickness =
        PhysicalPropertiesDatabase::ParseLength(fields[4]);
    if (!thickness.ok()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Line %d: %s", line_number, thickness.status().message()));
    }
    rows.push_back(CsvRow {
        .name = fields[0],
        .type = *type,
        .material = fields[2],
        .fill_material = fields[3],
        .thickness = *thickness
    });
  }
  if (!seen_header) {
    return absl::InvalidArgumentError("Stackup CSV is empty");
  }
  return rows;
}

absl::Status StackupIo::ApplyCsv(Stackup *stackup, const std::string &csv) {
  absl::StatusOr<std::vector<CsvRow>> rows = ParseCsv(csv);
  if (!rows.ok()) {
    return rows.status();
  }

  PhysicalPropertiesDatabase *physical_db = stackup->physical_db();
  std::shared_ptr<const LayerCollection> current = stackup->collection();

  // Rows carry no elevations, so they are stacked in order and the original
  // mode restored afterwards.
  LayerCollection next(StackupMode::kLaminate);
  std::set<std::string> seen;
  for (const CsvRow &row : *rows) {
    if (!seen.insert(row.name).second) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Layer \"", row.name, "\" appears more than once"));
    }
    const LayerTypeInfo &info = GetLayerTypeInfo(row.type);

    const StackupLayer *existing = current->FindLayer(row.name);
    StackupLayer layer =
        existing ? *existing : StackupLayer(row.name, row.type);
    if (existing && !existing->IsStackupLayer()) {
      layer.set_via_references(std::nullopt);
    }
    layer.set_type(row.type);

    if (!row.material.empty()) {
      layer.set_material(row.material);
    } else if (!existing) {
      layer.set_material(info.default_material);
    }
    if (!info.has_fill_material) {
      layer.set_fill_material("");
    } else if (!row.fill_material.empty()) {
      layer.set_fill_material(row.fill_material);
    } else if (layer.fill_material().empty()) {
      layer.set_fill_material("fr4_epoxy");
    }
    layer.set_thickness(row.thickness);

    WarnIfUnknown(*physical_db, layer);
    absl::Status status = next.AddLayerBottom(layer);
    if (!status.ok()) {
      return status;
    }
  }

  for (const StackupLayer &layer : current->non_stackup_layers()) {
    if (next.HasLayer(layer.name())) {
      continue;
    }
    absl::Status status = next.AddNonStackupLayer(layer);
    if (!status.ok()) {
      return status;
    }
  }
  for (const StackupLayer &layer : current->stackup_layers()) {
    if (!next.HasLayer(layer.name())) {
      VLOG(1) << "Removing layer \"" << layer.name()
              << "\", which the imported stackup doesn't have";
    }
  }

  next.SetMode(current->mode());
  stackup->Commit(next);
  return absl::OkStatus();
}

absl::Status StackupIo::ImportCsv(Stackup *stackup, const std::string &path) {
  absl::StatusOr<std::string> csv = ReadFile(path);
  if (!csv.ok()) {
    return csv.status();
  }
  absl::Status applied = ApplyCsv(stackup, *csv);
  if (!applied.ok()) {
    return absl::Status(applied.code(), absl::StrCat(
        "Could not import stackup from \"", path, "\": ", applied.message()));
  }
  LOG(INFO) << "Imported stackup from " << path;
  return absl::OkStatus();
}

absl::StatusOr<std::string> StackupIo::ReadFile(const std::string &path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return absl::NotFoundError(absl::StrCat("Could not open ", path));
  }
  std::ostringstream contents;
  contents << input.rdbuf();
  return contents.str();
}

absl::Status StackupIo::WriteFile(const std::string &path,
                                  const std::string &contents) {
  std::ofstream output(path, std::ios::out | std::ios::trunc);
  if (!output.is_open()) {
    return absl::PermissionDeniedError(
        absl::StrCat("Could not open ", path, " for writing"));
  }
  output << contents;
  output.close();
  if (output.fail()) {
    return absl::InternalError(absl::StrCat("Could not write ", path));
  }
  return absl::OkStatus();
}

}  // namespace layup
