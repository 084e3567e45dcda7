#include "psychro/core/case_runner.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/core/expected_utils.hpp"
#include "psychro/process/cooling.hpp"
#include "psychro/process/heating.hpp"
#include "psychro/process/mixing.hpp"
#include <chrono>
#include <format>
#include <iomanip>
#include <iostream>

namespace psychro::core {

namespace {

using io::output::CaseRecord;
using Type = io::CaseConfig::Type;

// Heating and dry cooling results share the inlet/outlet/heat layout
template <typename ProcessResult>
auto make_record(const io::CaseConfig& config, const ProcessResult& result) -> CaseRecord {
  CaseRecord record;
  record.name = config.name;
  record.type = config.type;
  record.inlets.push_back(io::output::to_stream_record(result.inlet));
  record.outlet = io::output::to_stream_record(result.outlet);
  record.heat_of_process = result.heat_of_process;
  return record;
}

auto make_mixing_record(const io::CaseConfig& config, const process::MixingResult& result) -> CaseRecord {
  CaseRecord record;
  record.name = config.name;
  record.type = config.type;
  for (const auto& inlet : result.inlets) {
    record.inlets.push_back(io::output::to_stream_record(inlet));
  }
  record.outlet = io::output::to_stream_record(result.outlet);
  return record;
}

auto make_coil_record(const io::CaseConfig& config, const process::RealCoolingResult& result)
    -> std::expected<CaseRecord, CalculationError> {
  auto record = make_record(config, result);
  record.condensate_mass_flow = result.condensate_mass_flow;
  record.condensate_temperature = result.condensate_temperature;
  record.bypass_factor = result.bypass_factor;
  PSYCHRO_TRY_ASSIGN(record.coolant_mass_flow, process::coolant_mass_flow(result.coolant, result.heat_of_process));
  return record;
}

auto run_coil_case(const io::CaseConfig& config, const properties::HumidAirFlow& inlet,
                   const solver::SolverConfig& solver_config) -> std::expected<CaseRecord, CalculationError> {
  if (!config.coolant) {
    return std::unexpected(InvalidArgumentError("coolant data is required for cooling coil cases"));
  }
  auto coolant = process::CoolantData::of(config.coolant->supply_temperature, config.coolant->return_temperature);
  if (!coolant) {
    return std::unexpected(coolant.error());
  }

  auto to_record = [&](const process::RealCoolingResult& result) { return make_coil_record(config, result); };

  switch (config.type) {
  case Type::CoolingTemperature:
    return process::cooling_from_temperature(inlet, *coolant, config.target).and_then(to_record);
  case Type::CoolingRelativeHumidity:
    return process::cooling_from_relative_humidity(inlet, *coolant, config.target, solver_config).and_then(to_record);
  case Type::CoolingPower:
    return process::cooling_from_power(inlet, *coolant, config.target, solver_config).and_then(to_record);
  default:
    return std::unexpected(
        InvalidArgumentError(std::format("'{}' is not a cooling coil case", io::to_string(config.type))));
  }
}

auto run_mixing_case(const io::CaseConfig& config, const properties::HumidAirFlow& inlet,
                     const solver::SolverConfig& solver_config) -> std::expected<CaseRecord, CalculationError> {
  if (!config.second) {
    return std::unexpected(InvalidArgumentError("a second flow is required for mixing cases"));
  }
  auto second = build_flow(*config.second);
  if (!second) {
    return std::unexpected(second.error());
  }

  auto to_record = [&](const process::MixingResult& result) { return make_mixing_record(config, result); };

  if (config.type == Type::MixingTarget) {
    return process::mix_to_target_temperature(inlet.air(), config.inlet.minimum_flow, second->air(),
                                              config.second->minimum_flow, config.target_flow, config.target,
                                              solver_config)
        .transform(to_record);
  }
  return process::mix_two(inlet, *second).transform(to_record);
}

} // namespace

auto build_flow(const io::FlowConfig& config) -> std::expected<properties::HumidAirFlow, CalculationError> {
  auto air = config.relative_humidity
                 ? properties::HumidAir::from_relative_humidity(config.pressure, config.temperature,
                                                                *config.relative_humidity)
                 : properties::HumidAir::from_humidity_ratio(config.pressure, config.temperature,
                                                             config.humidity_ratio.value_or(0.0));
  if (!air) {
    return std::unexpected(air.error());
  }
  return properties::HumidAirFlow::of(*air, config.dry_air_mass_flow);
}

auto to_solver_config(const io::SolverSettings& settings) noexcept -> solver::SolverConfig {
  solver::SolverConfig config;
  config.tolerance = settings.tolerance;
  config.max_iterations = settings.max_iterations;
  config.strict_convergence = settings.strict_convergence;
  return config;
}

auto run_case(const io::CaseConfig& config, const io::SolverSettings& settings)
    -> std::expected<CaseRecord, CalculationError> {

  auto inlet = build_flow(config.inlet);
  if (!inlet) {
    return std::unexpected(inlet.error());
  }

  const auto solver_config = to_solver_config(settings);
  auto to_record = [&](const auto& result) { return make_record(config, result); };

  switch (config.type) {
  case Type::HeatingPower:
    return process::heating_from_power(*inlet, config.target).transform(to_record);
  case Type::HeatingTemperature:
    return process::heating_from_temperature(*inlet, config.target).transform(to_record);
  case Type::HeatingRelativeHumidity:
    return process::heating_from_relative_humidity(*inlet, config.target).transform(to_record);
  case Type::DryCoolingPower:
    return process::dry_cooling_from_power(*inlet, config.target).transform(to_record);
  case Type::DryCoolingTemperature:
    return process::dry_cooling_from_temperature(*inlet, config.target).transform(to_record);
  case Type::CoolingTemperature:
  case Type::CoolingRelativeHumidity:
  case Type::CoolingPower:
    return run_coil_case(config, *inlet, solver_config);
  case Type::Mixing:
  case Type::MixingTarget:
    return run_mixing_case(config, *inlet, solver_config);
  }
  return std::unexpected(InvalidArgumentError("unknown case type"));
}

// ============================================================================
// CaseRunner
// ============================================================================

auto CaseRunner::run_cases(const io::Configuration& config, PerformanceMetrics& metrics)
    -> std::expected<std::vector<CaseRecord>, ApplicationError> {

  std::cout << "\n=== RUNNING PROCESS CASES ===" << std::endl;

  auto start = std::chrono::high_resolution_clock::now();

  std::vector<std::expected<CaseRecord, CalculationError>> results;
  results.reserve(config.cases.size());
  for (const auto& case_config : config.cases) {
    auto result = expected_utils::with_context(run_case(case_config, config.solver),
                                               std::format("case '{}'", case_config.name));
    if (result) {
      std::cout << constants::string_processing::colors::green << "✓ " << case_config.name << " ("
                << io::to_string(case_config.type) << ")" << constants::string_processing::colors::reset
                << std::endl;
    } else {
      std::cout << constants::string_processing::colors::red << "✗ " << case_config.name << " ("
                << io::to_string(case_config.type) << ")" << constants::string_processing::colors::reset
                << std::endl;
    }
    results.push_back(std::move(result));
  }

  auto end = std::chrono::high_resolution_clock::now();
  metrics.calculation_time = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  auto records = expected_utils::collect_all(std::move(results));
  if (!records) {
    return std::unexpected(ApplicationError{"Case calculation failed: " + records.error().full_message(),
                                            constants::application::exit_failure});
  }

  metrics.cases_run = records->size();
  std::cout << "✓ " << metrics.cases_run << " case(s) completed in " << metrics.calculation_time.count() << " ms"
            << std::endl;

  return std::move(records.value());
}

auto CaseRunner::run_chart(const io::Configuration& config, PerformanceMetrics& metrics)
    -> std::expected<io::ChartGenerator::Result, ApplicationError> {

  std::cout << "\n=== GENERATING PSYCHROMETRIC CHART ===" << std::endl;
  std::cout << "  Pressure: " << config.chart.pressure << " Pa" << std::endl;
  std::cout << "  Temperatures: " << config.chart.temperature_min << " to " << config.chart.temperature_max
            << " degC (" << config.chart.temperature_points << " points)" << std::endl;
  std::cout << "  Relative humidity curves: " << config.chart.relative_humidities.size() << std::endl;

  auto start = std::chrono::high_resolution_clock::now();

  io::ChartGenerator generator(config.chart);
  auto chart = generator.generate();

  auto end = std::chrono::high_resolution_clock::now();
  metrics.chart_time = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  if (!chart) {
    return std::unexpected(ApplicationError{"Chart generation failed: " + chart.error().full_message(),
                                            constants::application::exit_failure});
  }

  std::cout << "✓ Chart generated successfully!" << std::endl;
  std::cout << "  Chart time: " << metrics.chart_time.count() << " ms" << std::endl;

  return std::move(chart.value());
}

auto CaseRunner::display_case_results(const std::vector<CaseRecord>& records, bool verbose) const -> void {
  if (records.empty()) {
    return;
  }

  std::cout << "\n=== CASE SUMMARY ===" << std::endl;
  for (const auto& record : records) {
    display_record(record, verbose);
  }
}

auto CaseRunner::display_record(const CaseRecord& record, bool verbose) const -> void {
  using namespace constants::string_processing;

  std::cout << "\n" << colors::cyan << "┌─ " << record.name << " [" << io::to_string(record.type) << "]"
            << colors::reset << std::endl;

  if (record.inlets.size() == 1) {
    display_stream("Inlet", record.inlets.front(), verbose);
  } else {
    for (std::size_t i = 0; i < record.inlets.size(); ++i) {
      display_stream(std::format("Inlet {}", i + 1), record.inlets[i], verbose);
    }
  }
  display_stream("Outlet", record.outlet, verbose);

  std::cout << std::fixed << std::setprecision(float_precision_2);
  std::cout << "│ Heat of process : " << std::setw(wide_field_width) << std::right << record.heat_of_process << " W"
            << std::endl;

  if (record.bypass_factor) {
    std::cout << "│ Bypass factor   : " << std::setw(wide_field_width) << std::right
              << std::setprecision(float_precision_3) << *record.bypass_factor << std::endl;
  }
  if (record.condensate_mass_flow) {
    std::cout << "│ Condensate      : " << std::setw(wide_field_width) << std::right
              << std::setprecision(float_precision_6) << *record.condensate_mass_flow << " kg/s at "
              << std::setprecision(float_precision_2) << record.condensate_temperature.value_or(0.0) << " degC"
              << std::endl;
  }
  if (record.coolant_mass_flow) {
    std::cout << "│ Coolant flow    : " << std::setw(wide_field_width) << std::right
              << std::setprecision(float_precision_3) << *record.coolant_mass_flow << " kg/s" << std::endl;
  }

  std::cout << colors::cyan << "└" << std::string(separator_width - 1, '-') << colors::reset << std::endl;
  std::cout << std::defaultfloat;
}

auto CaseRunner::display_stream(std::string_view label, const io::output::StreamRecord& stream, bool verbose) const
    -> void {
  using namespace constants::string_processing;

  std::cout << "│ " << std::setw(16) << std::left << label << ": " << std::fixed
            << std::setprecision(float_precision_2) << stream.temperature << " degC, "
            << std::setprecision(float_precision_2) << stream.relative_humidity << " %, "
            << std::setprecision(float_precision_6) << stream.humidity_ratio << " kg/kg, "
            << std::setprecision(float_precision_3) << stream.specific_enthalpy << " kJ/kg, "
            << stream.dry_air_mass_flow << " kg/s" << std::endl;

  if (verbose) {
    std::cout << "│   pressure " << std::setprecision(float_precision_2) << stream.pressure << " Pa, dew point "
              << stream.dew_point_temperature << " degC, humid air " << std::setprecision(float_precision_3)
              << stream.humid_air_mass_flow << " kg/s, volume " << stream.volumetric_flow << " m3/s" << std::endl;
  }
  std::cout << std::right << std::defaultfloat;
}

} // namespace psychro::core
