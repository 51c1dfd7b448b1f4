#include "physical_properties_database.h"

#include <cctype>
#include <cmath>
#include <map>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/strip.h>

namespace layup {

absl::StatusOr<double> PhysicalPropertiesDatabase::UnitsToMetres(
    const std::string &units) {
  static const std::map<std::string, double> kMetresPerUnit = {
      {"m", 1.0},
      {"meter", 1.0},
      {"meters", 1.0},
      {"cm", 1e-2},
      {"mm", 1e-3},
      {"um", 1e-6},
      {"nm", 1e-9},
      {"mil", 2.54e-5},
      {"in", 2.54e-2},
      {"inch", 2.54e-2}
  };
  auto it = kMetresPerUnit.find(absl::AsciiStrToLower(units));
  if (it == kMetresPerUnit.end()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown length units: \"", units, "\""));
  }
  return it->second;
}

absl::StatusOr<double> PhysicalPropertiesDatabase::ParseLength(
    const std::string &text, const std::string &default_units) {
  std::string stripped(absl::StripAsciiWhitespace(text));
  if (stripped.empty()) {
    return absl::InvalidArgumentError("Empty length");
  }

  // The units are the trailing run of letters. An exponent ("1e-5") is always
  // followed by digits so it stays with the number.
  size_t split = stripped.size();
  while (split > 0 && std::isalpha(static_cast<unsigned char>(
             stripped[split - 1]))) {
    --split;
  }
  std::string number(absl::StripAsciiWhitespace(stripped.substr(0, split)));
  std::string units(stripped.substr(split));

  double value;
  if (!absl::SimpleAtod(number, &value)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse length: \"", text, "\""));
  }
  absl::StatusOr<double> scale = UnitsToMetres(
      units.empty() ? default_units : units);
  if (!scale.ok()) {
    return scale.status();
  }
  return value * *scale;
}

int64_t PhysicalPropertiesDatabase::ToInternalUnits(
    const double metres) const {
  return std::llround(metres * internal_units_per_metre_);
}

double PhysicalPropertiesDatabase::ToMetres(
    const int64_t internal_value) const {
  return static_cast<double>(internal_value) / internal_units_per_metre_;
}

absl::Status PhysicalPropertiesDatabase::AddMaterial(
    const Material &material) {
  if (material.name.empty()) {
    return absl::InvalidArgumentError("Materials must be named");
  }
  std::string key = absl::AsciiStrToLower(material.name);
  auto it = materials_.find(key);
  if (it != materials_.end()) {
    return absl::AlreadyExistsError(
        absl::StrCat("Material \"", material.name, "\" already exists as \"",
                     it->second.name, "\""));
  }
  materials_.insert({key, material});
  VLOG(3) << "Added material " << material;
  return absl::OkStatus();
}

absl::Status PhysicalPropertiesDatabase::AddConductor(
    const std::string &name, double conductivity) {
  return AddMaterial(Material {
      .name = name,
      .conductivity = conductivity,
      .permittivity = 1.0,
      .loss_tangent = 0.0
  });
}

absl::Status PhysicalPropertiesDatabase::AddDielectric(
    const std::string &name, double permittivity, double loss_tangent) {
  return AddMaterial(Material {
      .name = name,
      .conductivity = 0.0,
      .permittivity = permittivity,
      .loss_tangent = loss_tangent
  });
}

void PhysicalPropertiesDatabase::UpsertMaterial(const Material &material) {
  std::string key = absl::AsciiStrToLower(material.name);
  auto it = materials_.find(key);
  if (it == materials_.end()) {
    materials_.insert({key, material});
    return;
  }
  // Keep the name under which the material was first registered.
  std::string name = it->second.name;
  it->second = material;
  it->second.name = name;
}

std::optional<std::reference_wrapper<const Material>>
PhysicalPropertiesDatabase::FindMaterial(const std::string &name) const {
  auto it = materials_.find(absl::AsciiStrToLower(name));
  if (it == materials_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const Material &PhysicalPropertiesDatabase::GetMaterialOrDie(
    const std::string &name) const {
  auto material = FindMaterial(name);
  LOG_IF(FATAL, !material) << "No material named \"" << name << "\"";
  return material->get();
}

void PhysicalPropertiesDatabase::LoadDefaultMaterials() {
  materials_.clear();
  UpsertMaterial({.name = "copper",
                  .conductivity = 5.8e7,
                  .permittivity = 1.0,
                  .loss_tangent = 0.0});
  UpsertMaterial({.name = "fr4_epoxy",
                  .conductivity = 0.0,
                  .permittivity = 4.4,
                  .loss_tangent = 0.02});
  UpsertMaterial({.name = "solder_mask",
                  .conductivity = 0.0,
                  .permittivity = 3.1,
                  .loss_tangent = 0.035});
  UpsertMaterial({.name = "air",
                  .conductivity = 0.0,
                  .permittivity = 1.0006,
                  .loss_tangent = 0.0});
}

std::string PhysicalPropertiesDatabase::DescribeMaterials() const {
  std::stringstream ss;
  for (const auto &entry : materials_) {
    ss << entry.second << std::endl;
  }
  return ss.str();
}

::layup::proto::Material Material::ToProto() const {
  ::layup::proto::Material material_pb;
  material_pb.set_name(name);
  material_pb.set_conductivity(conductivity);
  material_pb.set_permittivity(permittivity);
  material_pb.set_loss_tangent(loss_tangent);
  return material_pb;
}

Material Material::FromProto(const ::layup::proto::Material &material_pb) {
  return Material {
      .name = material_pb.name(),
      .conductivity = material_pb.conductivity(),
      .permittivity = material_pb.permittivity(),
      .loss_tangent = material_pb.loss_tangent()
  };
}

std::ostream &operator<<(std::ostream &os, const Material &material) {
  os << absl::StrFormat("%s (sigma=%g S/m, er=%g, tan_d=%g)",
                        material.name,
                        material.conductivity,
                        material.permittivity,
                        material.loss_tangent);
  return os;
}

std::ostream &operator<<(std::ostream &os,
                         const PhysicalPropertiesDatabase &physical_db) {
  os << physical_db.DescribeMaterials();
  return os;
}

}  // namespace layup
