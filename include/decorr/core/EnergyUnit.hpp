#pragma once

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace decorr {

enum class EnergyUnit {
  kT,
  KJPerMol,
  KcalPerMol,
};

inline std::string energy_unit_name(EnergyUnit u) {
  switch (u) {
    case EnergyUnit::kT: return "kT";
    case EnergyUnit::KJPerMol: return "kJ/mol";
    case EnergyUnit::KcalPerMol: return "kcal/mol";
  }
  return "kT";
}

inline EnergyUnit parse_energy_unit(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(::tolower(c)); });
  if (s == "kt") return EnergyUnit::kT;
  if (s == "kj/mol" || s == "kj_mol" || s == "kjmol") return EnergyUnit::KJPerMol;
  if (s == "kcal/mol" || s == "kcal_mol" || s == "kcalmol") return EnergyUnit::KcalPerMol;
  throw std::runtime_error("invalid energy_unit: '" + s + "' (use kT|kJ/mol|kcal/mol)");
}

// Metadata carried by every table. Transforms copy it into their result.
struct TableAttrs {
  double temperature = 0.0; // Kelvin
  EnergyUnit energy_unit = EnergyUnit::kT;

  bool operator==(const TableAttrs& o) const {
    return temperature == o.temperature && energy_unit == o.energy_unit;
  }
  bool operator!=(const TableAttrs& o) const { return !(*this == o); }
};

} // namespace decorr
