#include "layer_type.h"

#include <ostream>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_replace.h>
#include <absl/strings/string_view.h>
#include <absl/strings/strip.h>

namespace layup {

namespace {

// Indexed by the enum value, so the order here must match the declaration.
const std::vector<LayerTypeInfo> &LayerTypeTable() {
  static const std::vector<LayerTypeInfo> kTable = {
      {LayerType::kSignal, "signal", true, true, "copper"},
      {LayerType::kDielectric, "dielectric", true, false, "fr4_epoxy"},
      {LayerType::kConducting, "conducting", false, true, "copper"},
      {LayerType::kAirlines, "airlines", false, false, ""},
      {LayerType::kErrors, "errors", false, false, ""},
      {LayerType::kSymbol, "symbol", false, false, ""},
      {LayerType::kMeasure, "measure", false, false, ""},
      {LayerType::kAssembly, "assembly", false, false, ""},
      {LayerType::kSilkscreen, "silkscreen", false, false, ""},
      {LayerType::kSolderMask, "soldermask", false, false, "solder_mask"},
      {LayerType::kSolderPaste, "solderpaste", false, false, ""},
      {LayerType::kGlue, "glue", false, false, ""},
      {LayerType::kWirebond, "wirebond", false, false, ""},
      {LayerType::kUser, "user", false, false, ""},
      {LayerType::kSIWaveHFSSRegion, "siwavehfsssolverregions", false, false,
       ""},
      {LayerType::kOutline, "outline", false, false, ""},
      {LayerType::kPostprocessing, "postprocessing", false, false, ""},
      {LayerType::kUndefined, "undefined", false, false, ""}
  };
  return kTable;
}

}  // namespace

const LayerTypeInfo &GetLayerTypeInfo(LayerType type) {
  const auto &table = LayerTypeTable();
  size_t index = static_cast<size_t>(type);
  LOG_IF(FATAL, index >= table.size() || table[index].type != type)
      << "Layer type table is out of order at index " << index;
  return table[index];
}

absl::StatusOr<LayerType> ParseLayerType(const std::string &name) {
  std::string normalised = absl::StrReplaceAll(
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(name)),
      {{"_", ""}, {" ", ""}});
  absl::string_view stem = normalised;
  absl::ConsumeSuffix(&stem, "layer");
  for (const LayerTypeInfo &info : LayerTypeTable()) {
    if (stem == info.name) {
      return info.type;
    }
  }
  // Shorthands seen in stackup files.
  if (stem == "siwavehfssregion") {
    return LayerType::kSIWaveHFSSRegion;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown layer type: \"", name, "\""));
}

TopBottomAssociation Toggled(TopBottomAssociation association) {
  switch (association) {
    case TopBottomAssociation::kTopAssociated:
      return TopBottomAssociation::kBottomAssociated;
    case TopBottomAssociation::kBottomAssociated:
      return TopBottomAssociation::kTopAssociated;
    default:
      return association;
  }
}

absl::StatusOr<TopBottomAssociation> ParseTopBottomAssociation(
    const std::string &name) {
  std::string lower = absl::AsciiStrToLower(name);
  if (lower == "top" || lower == "topassociated" || lower == "top_associated")
    return TopBottomAssociation::kTopAssociated;
  if (lower == "bottom" || lower == "bottomassociated" ||
      lower == "bottom_associated")
    return TopBottomAssociation::kBottomAssociated;
  if (lower == "neither" || lower.empty())
    return TopBottomAssociation::kNeither;
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown top/bottom association: \"", name, "\""));
}

const char *TopBottomAssociationName(TopBottomAssociation association) {
  switch (association) {
    case TopBottomAssociation::kTopAssociated:
      return "top";
    case TopBottomAssociation::kBottomAssociated:
      return "bottom";
    case TopBottomAssociation::kNeither:
      return "neither";
  }
  return "neither";
}

std::ostream &operator<<(std::ostream &os, const LayerType &type) {
  os << LayerTypeName(type);
  return os;
}

std::ostream &operator<<(std::ostream &os,
                         const TopBottomAssociation &association) {
  os << TopBottomAssociationName(association);
  return os;
}

}  // namespace layup
