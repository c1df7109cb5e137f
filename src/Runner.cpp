#include "decorr/app/Runner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "decorr/io/TableReader.hpp"
#include "decorr/io/TableWriter.hpp"
#include "decorr/util/Parallel.hpp"
#include "decorr/util/Timer.hpp"

namespace fs = std::filesystem;

namespace decorr {

namespace {

fs::path resolve_path(const fs::path& base_dir, const std::string& p) {
  fs::path path(p);
  if (path.is_absolute()) return path;
  return (base_dir / path).lexically_normal();
}

Series select_series(const RunSpec& spec, const TimeSeriesTable& table) {
  if (spec.series == "row_sum") return table.row_sum();
  return table.column_series(spec.series);
}

void report_table(const char* what, const TimeSeriesTable& t) {
  std::cerr << "[decorr] " << what << ": rows=" << t.size() << " states=" << t.rows_per_state().size()
            << " columns=" << t.n_columns() << " temperature=" << t.attrs().temperature
            << " energy_unit=" << energy_unit_name(t.attrs().energy_unit) << "\n";
}

void report_per_state(const TimeSeriesTable& in, const TimeSeriesTable& out) {
  const auto after = out.rows_per_state();
  for (const auto& [state, n_in] : in.rows_per_state()) {
    std::size_t n_out = 0;
    for (const auto& [s, n] : after) {
      if (s == state) n_out = n;
    }
    std::cerr << "         state " << preprocess::detail::describe_state(state) << ": " << n_in << " -> " << n_out << "\n";
  }
}

} // namespace

std::string operation_name(Operation op) {
  switch (op) {
    case Operation::Slicing: return "slicing";
    case Operation::StatisticalInefficiency: return "statistical_inefficiency";
    case Operation::EquilibriumDetection: return "equilibrium_detection";
    case Operation::DecorrelateUNk: return "decorrelate_u_nk";
    case Operation::DecorrelateDHdl: return "decorrelate_dhdl";
  }
  return "decorrelate_u_nk";
}

Operation parse_operation(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(::tolower(c)); });
  if (s == "slicing" || s == "slice") return Operation::Slicing;
  if (s == "statistical_inefficiency" || s == "subsample") return Operation::StatisticalInefficiency;
  if (s == "equilibrium_detection") return Operation::EquilibriumDetection;
  if (s == "decorrelate_u_nk") return Operation::DecorrelateUNk;
  if (s == "decorrelate_dhdl") return Operation::DecorrelateDHdl;
  throw std::runtime_error("invalid operation: '" + s +
                           "' (use slicing|statistical_inefficiency|equilibrium_detection|decorrelate_u_nk|decorrelate_dhdl)");
}

RunSpec parse_run_spec(const IniConfig& cfg) {
  cfg.require_known_keys("input", {"file", "temperature", "energy_unit"});
  cfg.require_known_keys("preprocess", {"operation", "method", "series", "lower", "upper", "step", "conservative",
                                        "drop_duplicates", "sort", "remove_burnin", "force"});
  cfg.require_known_keys("output", {"file", "dry_run"});

  RunSpec spec;
  const fs::path base = cfg.base_dir();

  spec.input = resolve_path(base, cfg.get_string("input", "file"));
  spec.temperature = cfg.get_optional_double("input", "temperature");
  if (cfg.has_key("input", "energy_unit")) {
    spec.energy_unit = parse_energy_unit(cfg.get_string("input", "energy_unit"));
  }

  spec.operation = parse_operation(cfg.get_string("preprocess", "operation", std::string("decorrelate_u_nk")));
  spec.method = preprocess::parse_unk_method(cfg.get_string("preprocess", "method", std::string("dhdl")));
  spec.series = cfg.get_string("preprocess", "series", std::string("none"));
  spec.window.lower = cfg.get_optional_double("preprocess", "lower");
  spec.window.upper = cfg.get_optional_double("preprocess", "upper");
  spec.window.step = cfg.get_optional_size("preprocess", "step");
  spec.conservative = cfg.get_bool("preprocess", "conservative", false);
  spec.drop_duplicates = cfg.get_bool("preprocess", "drop_duplicates", true);
  spec.sort = cfg.get_bool("preprocess", "sort", false);
  spec.remove_burnin = cfg.get_bool("preprocess", "remove_burnin", true);
  spec.force = cfg.get_bool("preprocess", "force", false);

  if (spec.window.step && *spec.window.step == 0) {
    throw std::runtime_error("preprocess.step must be >= 1");
  }
  if (spec.window.lower && spec.window.upper && *spec.window.lower > *spec.window.upper) {
    throw std::runtime_error("preprocess.lower must not exceed preprocess.upper");
  }
  const bool takes_series = spec.operation == Operation::StatisticalInefficiency ||
                            spec.operation == Operation::EquilibriumDetection;
  if (!takes_series && spec.series != "none") {
    throw std::runtime_error("preprocess.series is only used by statistical_inefficiency and equilibrium_detection");
  }

  spec.dry_run = cfg.get_bool("output", "dry_run", false);
  if (!spec.dry_run) {
    spec.output = resolve_path(base, cfg.get_string("output", "file"));
  } else if (cfg.has_key("output", "file")) {
    spec.output = resolve_path(base, cfg.get_string("output", "file"));
  }
  return spec;
}

TimeSeriesTable apply_operation(const RunSpec& spec, const TimeSeriesTable& table) {
  preprocess::SubsampleOptions sopt;
  sopt.lower = spec.window.lower;
  sopt.upper = spec.window.upper;
  sopt.step = spec.window.step;
  sopt.conservative = spec.conservative;
  sopt.drop_duplicates = spec.drop_duplicates;
  sopt.sort = spec.sort;

  switch (spec.operation) {
    case Operation::Slicing: {
      preprocess::SliceOptions opt;
      opt.lower = spec.window.lower;
      opt.upper = spec.window.upper;
      opt.step = spec.window.step;
      opt.force = spec.force;
      return preprocess::slicing(table, opt);
    }
    case Operation::StatisticalInefficiency:
      if (spec.series == "none") return preprocess::statistical_inefficiency(table, sopt);
      return preprocess::statistical_inefficiency(table, select_series(spec, table), sopt);
    case Operation::EquilibriumDetection:
      if (spec.series == "none") return preprocess::equilibrium_detection(table, sopt);
      return preprocess::equilibrium_detection(table, select_series(spec, table), sopt);
    case Operation::DecorrelateUNk:
    case Operation::DecorrelateDHdl: {
      preprocess::DecorrelateOptions dopt;
      dopt.lower = spec.window.lower;
      dopt.upper = spec.window.upper;
      dopt.step = spec.window.step;
      dopt.conservative = spec.conservative;
      dopt.drop_duplicates = spec.drop_duplicates;
      dopt.sort = spec.sort;
      dopt.remove_burnin = spec.remove_burnin;
      if (spec.operation == Operation::DecorrelateDHdl) return preprocess::decorrelate_dhdl(table, dopt);
      return preprocess::decorrelate_u_nk(table, spec.method, dopt);
    }
  }
  throw std::runtime_error("apply_operation: unhandled operation");
}

Runner::Runner(const IniConfig& cfg) : cfg_(cfg) {}

int Runner::run() { return run_impl_(false); }

int Runner::validate_config() { return run_impl_(true); }

int Runner::run_impl_(bool validate_only) {
  const RunSpec spec = parse_run_spec(cfg_);

  if (!fs::exists(spec.input)) {
    throw std::runtime_error("input file does not exist: " + spec.input.string());
  }

  if (validate_only) {
    std::cerr << "[decorr] validation OK (no table processed)\n"
              << "         input=" << spec.input.string() << "\n"
              << "         operation=" << operation_name(spec.operation);
    if (spec.operation == Operation::DecorrelateUNk) {
      std::cerr << " method=" << preprocess::unk_method_name(spec.method);
    }
    std::cerr << "\n";
    if (!spec.output.empty()) std::cerr << "         output=" << spec.output.string() << "\n";
    return 0;
  }

  util::StageTimes times;

  io::TableFile file = times.time("read", [&] { return io::read_table(spec.input); });
  TableAttrs attrs = file.table.attrs();
  if (spec.temperature) attrs.temperature = *spec.temperature;
  if (spec.energy_unit) attrs.energy_unit = *spec.energy_unit;
  file.table.set_attrs(attrs);
  report_table("input", file.table);

  const TimeSeriesTable result = times.time("preprocess", [&] { return apply_operation(spec, file.table); });
  std::cerr << "[decorr] " << operation_name(spec.operation);
  if (spec.operation == Operation::DecorrelateUNk) {
    std::cerr << " (method=" << preprocess::unk_method_name(spec.method) << ")";
  }
  std::cerr << ": " << file.table.size() << " -> " << result.size() << " rows\n";
  report_per_state(file.table, result);

  if (spec.dry_run) {
    std::cerr << "[decorr] dry_run: output not written\n";
  } else {
    times.time("write", [&] { io::write_table(spec.output, result, file.state_columns); });
    std::cerr << "[decorr] wrote " << spec.output.string() << "\n";
  }

  std::cerr << "[decorr] profiling (threads=" << util::max_threads() << ")\n";
  for (const auto& [name, seconds] : times.stages()) {
    std::cerr << "  " << name << "_seconds: " << std::setprecision(6) << seconds << "\n";
  }
  std::cerr << "  total_seconds: " << times.total_seconds() << "\n";
  return 0;
}

} // namespace decorr
