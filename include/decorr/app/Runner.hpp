#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "decorr/config/IniConfig.hpp"
#include "decorr/core/EnergyUnit.hpp"
#include "decorr/preprocess/Decorrelate.hpp"
#include "decorr/preprocess/Slicing.hpp"
#include "decorr/preprocess/Subsampling.hpp"

namespace decorr {

enum class Operation {
  Slicing,
  StatisticalInefficiency,
  EquilibriumDetection,
  DecorrelateUNk,
  DecorrelateDHdl,
};

std::string operation_name(Operation op);
Operation parse_operation(std::string s);

// Everything a run needs, resolved from the config once.
struct RunSpec {
  std::filesystem::path input;
  std::optional<double> temperature;       // overrides the file's attrs
  std::optional<EnergyUnit> energy_unit;   // overrides the file's attrs

  Operation operation = Operation::DecorrelateUNk;
  preprocess::UNkMethod method = preprocess::UNkMethod::DHdl;
  // For statistical_inefficiency / equilibrium_detection:
  // "none", "row_sum" or a column name.
  std::string series = "none";

  preprocess::Window window;
  bool conservative = false;
  bool drop_duplicates = true;
  bool sort = false;
  bool remove_burnin = true;
  bool force = false;

  std::filesystem::path output;
  bool dry_run = false;
};

RunSpec parse_run_spec(const IniConfig& cfg);

// Apply the configured operation. Pure: does no I/O.
TimeSeriesTable apply_operation(const RunSpec& spec, const TimeSeriesTable& table);

// Runner: main() only handles CLI + config, then calls Runner(cfg).run().
// Runner owns the pipeline: read table -> preprocess -> write table -> report.
class Runner {
public:
  explicit Runner(const IniConfig& cfg);

  // Execute the run. Returns 0 on success.
  int run();

  // Resolve the config and check the input exists, without reading or
  // writing any table (CLI: --validate-config).
  int validate_config();

private:
  const IniConfig& cfg_;

  int run_impl_(bool validate_only);
};

} // namespace decorr
