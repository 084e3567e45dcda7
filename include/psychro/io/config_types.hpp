#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace psychro::io {

struct SolverSettings {
  double tolerance = constants::solver::tolerance;
  int max_iterations = constants::solver::max_iterations;
  bool strict_convergence = false;
};

struct OutputConfig {
  enum class Format { CSV, HDF5 };
  std::string directory = "psychro_outputs";
  std::vector<Format> formats = {Format::CSV};
  std::string case_name = "results";
};

// Air state and dry air flow of one stream; exactly one of relative_humidity and humidity_ratio is set
struct FlowConfig {
  double pressure = constants::defaults::pressure;
  double temperature = 0.0;
  std::optional<double> relative_humidity;
  std::optional<double> humidity_ratio;
  double dry_air_mass_flow = 0.0;
  // Locked minimum flow, only used by target temperature mixing
  double minimum_flow = 0.0;
};

struct CoolantConfig {
  double supply_temperature = 0.0;
  double return_temperature = 0.0;
};

struct CaseConfig {
  enum class Type {
    HeatingPower,
    HeatingTemperature,
    HeatingRelativeHumidity,
    DryCoolingPower,
    DryCoolingTemperature,
    CoolingTemperature,
    CoolingRelativeHumidity,
    CoolingPower,
    Mixing,
    MixingTarget
  };

  std::string name;
  Type type = Type::HeatingTemperature;
  FlowConfig inlet;
  std::optional<FlowConfig> second;
  std::optional<CoolantConfig> coolant;
  // Power [W], temperature [°C] or relative humidity [%] depending on the type
  double target = 0.0;
  // Outlet dry air flow of target temperature mixing [kg/s]
  double target_flow = 0.0;
};

struct ChartConfig {
  bool enabled = false;
  double pressure = constants::defaults::pressure;
  double temperature_min = constants::defaults::chart::temperature_min;
  double temperature_max = constants::defaults::chart::temperature_max;
  int temperature_points = constants::defaults::chart::temperature_points;
  std::vector<double> relative_humidities = {10.0, 20.0, 30.0, 40.0, 50.0, 60.0, 70.0, 80.0, 90.0, 100.0};
};

struct Configuration {
  SolverSettings solver;
  OutputConfig output;
  std::vector<CaseConfig> cases;
  ChartConfig chart;
  // Print per-case diagnostics
  bool verbose = false;
};

[[nodiscard]] constexpr auto requires_coolant(CaseConfig::Type type) noexcept -> bool {
  return type == CaseConfig::Type::CoolingTemperature || type == CaseConfig::Type::CoolingRelativeHumidity ||
         type == CaseConfig::Type::CoolingPower;
}

[[nodiscard]] constexpr auto requires_second_flow(CaseConfig::Type type) noexcept -> bool {
  return type == CaseConfig::Type::Mixing || type == CaseConfig::Type::MixingTarget;
}

[[nodiscard]] constexpr auto to_string(CaseConfig::Type type) noexcept -> std::string_view {
  switch (type) {
  case CaseConfig::Type::HeatingPower:
    return "heating_power";
  case CaseConfig::Type::HeatingTemperature:
    return "heating_temperature";
  case CaseConfig::Type::HeatingRelativeHumidity:
    return "heating_rh";
  case CaseConfig::Type::DryCoolingPower:
    return "dry_cooling_power";
  case CaseConfig::Type::DryCoolingTemperature:
    return "dry_cooling_temperature";
  case CaseConfig::Type::CoolingTemperature:
    return "cooling_temperature";
  case CaseConfig::Type::CoolingRelativeHumidity:
    return "cooling_rh";
  case CaseConfig::Type::CoolingPower:
    return "cooling_power";
  case CaseConfig::Type::Mixing:
    return "mixing";
  case CaseConfig::Type::MixingTarget:
    return "mixing_target";
  }
  return "unknown";
}

} // namespace psychro::io
