#ifndef PHYSICAL_PROPERTIES_DATABASE_H_
#define PHYSICAL_PROPERTIES_DATABASE_H_

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "layup.pb.h"

namespace layup {

struct Material {
  std::string name;

  // S/m. Zero for dielectrics.
  double conductivity;

  // Relative permittivity.
  double permittivity;
  double loss_tangent;

  bool IsConductor() const { return conductivity > 0.0; }

  ::layup::proto::Material ToProto() const;
  static Material FromProto(const ::layup::proto::Material &material_pb);
};

// Manages units and the material library.
//
// Planar coordinates are kept in integer internal units (nanometres) so that
// polygon booleans are exact-ish. Stackup quantities (thickness, elevation)
// stay in floating-point metres, because they are summed and flipped but never
// clipped.
class PhysicalPropertiesDatabase {
 public:
  // Converts the given unit name ("mm", "um", "mil", ...) to its size in
  // metres.
  static absl::StatusOr<double> UnitsToMetres(const std::string &units);

  // Parses a length like "35um", "0.1 mm" or "1.4mil" into metres. A bare
  // number is taken to be in `default_units`.
  static absl::StatusOr<double> ParseLength(
      const std::string &text, const std::string &default_units = "m");

  PhysicalPropertiesDatabase()
      : internal_units_per_metre_(1e9) {
    LoadDefaultMaterials();
  }

  int64_t ToInternalUnits(const double metres) const;
  double ToMetres(const int64_t internal_value) const;

  // Material names are unique without regard to case.
  absl::Status AddMaterial(const Material &material);
  absl::Status AddConductor(const std::string &name, double conductivity);
  absl::Status AddDielectric(const std::string &name,
                             double permittivity,
                             double loss_tangent);

  // Adds the material or overwrites the properties of an existing material
  // with the same (case-insensitive) name.
  void UpsertMaterial(const Material &material);

  // Case-insensitive.
  std::optional<std::reference_wrapper<const Material>> FindMaterial(
      const std::string &name) const;
  const Material &GetMaterialOrDie(const std::string &name) const;
  bool HasMaterial(const std::string &name) const {
    return FindMaterial(name).has_value();
  }

  // Keyed by lower-cased name.
  const std::map<std::string, Material> &materials() const {
    return materials_;
  }

  void set_internal_units_per_metre(double new_value) {
    internal_units_per_metre_ = new_value;
  }
  double internal_units_per_metre() const {
    return internal_units_per_metre_;
  }

  std::string DescribeMaterials() const;

 private:
  void LoadDefaultMaterials();

  double internal_units_per_metre_;

  std::map<std::string, Material> materials_;
};

std::ostream &operator<<(std::ostream &os, const Material &material);

std::ostream &operator<<(std::ostream &os,
                         const PhysicalPropertiesDatabase &physical_db);

}  // namespace layup

#endif  // PHYSICAL_PROPERTIES_DATABASE_H_
