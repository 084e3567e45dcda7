#pragma once
#include "psychro/core/exceptions.hpp"
#include "psychro/properties/humid_air_state.hpp"
#include <expected>
#include <vector>

namespace psychro::process {

using properties::HumidAir;
using properties::HumidAirFlow;

/**
 * @brief Chilled water supply and return temperatures of a cooling coil [°C]
 */
class CoolantData {
private:
  double supply_temperature_;
  double return_temperature_;

  CoolantData(double supply_temperature, double return_temperature) noexcept
      : supply_temperature_(supply_temperature), return_temperature_(return_temperature) {}

public:
  /// Both temperatures in [0, 90] °C with supply <= return
  [[nodiscard]] static auto of(double supply_temperature, double return_temperature)
      -> std::expected<CoolantData, core::CalculationError>;

  [[nodiscard]] auto supply_temperature() const noexcept -> double { return supply_temperature_; }
  [[nodiscard]] auto return_temperature() const noexcept -> double { return return_temperature_; }

  /// Mean coil wall temperature
  [[nodiscard]] auto average_temperature() const noexcept -> double {
    return (supply_temperature_ + return_temperature_) / 2.0;
  }
};

// Heat of process in W: positive when heat is added to the air, negative when removed.

struct HeatingResult {
  HumidAirFlow inlet;
  HumidAirFlow outlet;
  double heat_of_process;
};

struct DryCoolingResult {
  HumidAirFlow inlet;
  HumidAirFlow outlet;
  double heat_of_process;
};

struct RealCoolingResult {
  HumidAirFlow inlet;
  HumidAirFlow outlet;
  double heat_of_process;
  double condensate_temperature;
  double condensate_mass_flow;
  double bypass_factor;
  CoolantData coolant;
};

struct MixingResult {
  std::vector<HumidAirFlow> inlets;
  HumidAirFlow outlet;
};

/// Flow of the given dry air mass at a new state
[[nodiscard]] auto make_flow(double pressure, double temperature, double humidity_ratio, double dry_air_mass_flow)
    -> std::expected<HumidAirFlow, core::CalculationError>;

} // namespace psychro::process
