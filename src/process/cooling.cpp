#include "psychro/process/cooling.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/core/expected_utils.hpp"
#include "psychro/properties/components.hpp"
#include "psychro/properties/humid_air.hpp"
#include "psychro/properties/limits.hpp"
#include "psychro/solver/brent_solver.hpp"
#include <algorithm>
#include <cmath>

namespace psychro::process {

namespace humid_air = properties::humid_air;
namespace limits = properties::limits;
using constants::conversion::kw_to_w;

namespace {

auto dry_unchanged(const HumidAirFlow& inlet, double power) -> DryCoolingResult {
  return DryCoolingResult{.inlet = inlet, .outlet = inlet, .heat_of_process = power};
}

auto coil_unchanged(const HumidAirFlow& inlet, const CoolantData& coolant) -> RealCoolingResult {
  return RealCoolingResult{.inlet = inlet,
                           .outlet = inlet,
                           .heat_of_process = 0.0,
                           .condensate_temperature = inlet.temperature(),
                           .condensate_mass_flow = 0.0,
                           .bypass_factor = 1.0,
                           .coolant = coolant};
}

} // namespace

auto dry_cooling_from_power(const HumidAirFlow& inlet, double power)
    -> std::expected<DryCoolingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_finite("cooling power", power));
  if (power > 0.0) {
    return std::unexpected(core::InvalidArgumentError("cooling power", power, "<= 0 W"));
  }

  const double mda = inlet.dry_air_mass_flow();
  if (power == 0.0 || mda == 0.0) {
    return dry_unchanged(inlet, power);
  }

  const double x = inlet.humidity_ratio();
  const double p = inlet.pressure();
  const double h_out = (mda * inlet.specific_enthalpy() + power / kw_to_w) / mda;

  double t_out = 0.0;
  PSYCHRO_TRY_ASSIGN(t_out, humid_air::dry_bulb_temperature_from_enthalpy(h_out, x, p));

  auto outlet = make_flow(p, t_out, x, mda);
  if (!outlet) {
    return std::unexpected(outlet.error());
  }
  return DryCoolingResult{.inlet = inlet, .outlet = *outlet, .heat_of_process = power};
}

auto dry_cooling_from_temperature(const HumidAirFlow& inlet, double target_temperature)
    -> std::expected<DryCoolingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_temperature(target_temperature, "target temperature"));
  if (target_temperature > inlet.temperature()) {
    return std::unexpected(core::InvalidArgumentError(
        "target temperature", target_temperature, std::format("<= inlet temperature ({})", inlet.temperature())));
  }
  if (target_temperature == inlet.temperature() || inlet.dry_air_mass_flow() == 0.0) {
    return dry_unchanged(inlet, 0.0);
  }

  const double tdp = inlet.air().dew_point_temperature();
  if (target_temperature < tdp) {
    return std::unexpected(core::InvalidArgumentError(
        "target temperature", target_temperature,
        std::format(">= inlet dew point ({:.3f}) for dry cooling", tdp)));
  }

  const double mda = inlet.dry_air_mass_flow();
  const double x = inlet.humidity_ratio();
  const double p = inlet.pressure();

  double h_out = 0.0;
  PSYCHRO_TRY_ASSIGN(h_out, humid_air::specific_enthalpy(target_temperature, x, p));
  const double power = (mda * h_out - mda * inlet.specific_enthalpy()) * kw_to_w;

  auto outlet = make_flow(p, target_temperature, x, mda);
  if (!outlet) {
    return std::unexpected(outlet.error());
  }
  return DryCoolingResult{.inlet = inlet, .outlet = *outlet, .heat_of_process = power};
}

auto cooling_from_temperature(const HumidAirFlow& inlet, const CoolantData& coolant, double target_temperature)
    -> std::expected<RealCoolingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_finite("target temperature", target_temperature));
  if (target_temperature < 0.0) {
    return std::unexpected(core::InvalidArgumentError("target temperature", target_temperature, ">= 0 °C"));
  }
  const double t_in = inlet.temperature();
  if (target_temperature > t_in) {
    return std::unexpected(core::InvalidArgumentError("target temperature", target_temperature,
                                                      std::format("<= inlet temperature ({})", t_in)));
  }
  if (target_temperature == t_in || inlet.dry_air_mass_flow() == 0.0) {
    return coil_unchanged(inlet, coolant);
  }

  const double mda = inlet.dry_air_mass_flow();
  const double x_in = inlet.humidity_ratio();
  const double p = inlet.pressure();
  const double t_wall = coolant.average_temperature();

  double bypass_factor = 0.0;
  PSYCHRO_TRY_ASSIGN(bypass_factor, coil_bypass_factor(t_wall, t_in, target_temperature));
  const double m_direct = (1.0 - bypass_factor) * mda;
  const double m_bypass = mda - m_direct;

  // Air in contact with the wall leaves at wall temperature, saturated if it condensed
  const bool condensing = t_wall < inlet.air().dew_point_temperature();
  double x_wall = x_in;
  double m_condensate = 0.0;
  if (condensing) {
    double ps_wall = 0.0;
    PSYCHRO_TRY_ASSIGN(ps_wall, humid_air::saturation_pressure(t_wall));
    PSYCHRO_TRY_ASSIGN(x_wall, humid_air::max_humidity_ratio(ps_wall, p));
    PSYCHRO_TRY_ASSIGN(m_condensate, condensate_discharge(m_direct, x_in, x_wall));
  }

  double h_wall = 0.0;
  PSYCHRO_TRY_ASSIGN(h_wall, humid_air::specific_enthalpy(t_wall, x_wall, p));
  const double h_condensate = properties::liquid_water::specific_enthalpy(t_wall);
  const double power = (m_direct * (h_wall - inlet.specific_enthalpy()) + m_condensate * h_condensate) * kw_to_w;

  const double x_out = (x_wall * m_direct + x_in * m_bypass) / mda;

  auto outlet = make_flow(p, target_temperature, x_out, mda);
  if (!outlet) {
    return std::unexpected(outlet.error());
  }
  return RealCoolingResult{.inlet = inlet,
                           .outlet = *outlet,
                           .heat_of_process = power,
                           .condensate_temperature = t_wall,
                           .condensate_mass_flow = m_condensate,
                           .bypass_factor = bypass_factor,
                           .coolant = coolant};
}

auto cooling_from_relative_humidity(const HumidAirFlow& inlet, const CoolantData& coolant,
                                    double target_relative_humidity, const solver::SolverConfig& config)
    -> std::expected<RealCoolingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_in_range("target relative humidity", target_relative_humidity, 0.0,
                                            constants::limits::max_process_relative_humidity));
  if (target_relative_humidity < inlet.relative_humidity()) {
    return std::unexpected(core::InvalidArgumentError(
        "target relative humidity", target_relative_humidity,
        std::format(">= inlet relative humidity ({}) for cooling", inlet.relative_humidity())));
  }
  if (target_relative_humidity == inlet.relative_humidity() || inlet.dry_air_mass_flow() == 0.0) {
    return coil_unchanged(inlet, coolant);
  }

  const double p = inlet.pressure();
  auto residual = [&](double t_out) -> std::expected<double, core::CalculationError> {
    auto trial = cooling_from_temperature(inlet, coolant, t_out);
    if (!trial) {
      return std::unexpected(trial.error());
    }
    double rh_out = 0.0;
    PSYCHRO_TRY_ASSIGN(rh_out, humid_air::relative_humidity(t_out, trial->outlet.humidity_ratio(), p));
    return target_relative_humidity - rh_out;
  };

  // Coil outlet temperatures below 0 °C are rejected, so the search stays above freezing
  const double t_lower = std::max(inlet.air().dew_point_temperature(), 0.0);

  double t_out = 0.0;
  PSYCHRO_TRY_ASSIGN(t_out, solver::find_root(residual, inlet.temperature(), t_lower, config));
  return cooling_from_temperature(inlet, coolant, t_out);
}

auto cooling_from_power(const HumidAirFlow& inlet, const CoolantData& coolant, double power,
                        const solver::SolverConfig& config)
    -> std::expected<RealCoolingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_finite("cooling power", power));
  if (power > 0.0) {
    return std::unexpected(core::InvalidArgumentError("cooling power", power, "<= 0 W"));
  }

  // Cooling the whole flow down to 0 kJ/kg bounds the physical range
  const double power_limit = (0.0 - inlet.specific_enthalpy()) * inlet.humid_air_mass_flow() * kw_to_w;
  if (power < power_limit) {
    return std::unexpected(
        core::InvalidArgumentError("cooling power", power, std::format(">= {:.1f} W for this flow", power_limit)));
  }
  if (power == 0.0 || inlet.dry_air_mass_flow() == 0.0) {
    return coil_unchanged(inlet, coolant);
  }

  // Dry cooling puts all the power into sensible heat, so it gives the coldest outlet
  auto dry = dry_cooling_from_power(inlet, power);
  if (!dry) {
    return std::unexpected(dry.error());
  }

  auto residual = [&](double t_out) -> std::expected<double, core::CalculationError> {
    auto trial = cooling_from_temperature(inlet, coolant, t_out);
    if (!trial) {
      return std::unexpected(trial.error());
    }
    return trial->heat_of_process - power;
  };

  const double t_lower = std::max(dry->outlet.temperature(), 0.0);

  double t_out = 0.0;
  PSYCHRO_TRY_ASSIGN(t_out, solver::find_root(residual, inlet.temperature(), t_lower, config));
  return cooling_from_temperature(inlet, coolant, t_out);
}

auto coil_bypass_factor(double wall_temperature, double inlet_temperature, double outlet_temperature)
    -> std::expected<double, core::CalculationError> {
  PSYCHRO_TRY_VOID(limits::require_finite("wall temperature", wall_temperature));
  PSYCHRO_TRY_VOID(limits::require_finite("inlet temperature", inlet_temperature));
  PSYCHRO_TRY_VOID(limits::require_finite("outlet temperature", outlet_temperature));
  if (inlet_temperature == wall_temperature) {
    return std::unexpected(core::InvalidArgumentError("wall temperature", wall_temperature,
                                                      std::format("!= inlet temperature ({})", inlet_temperature)));
  }
  return (outlet_temperature - wall_temperature) / (inlet_temperature - wall_temperature);
}

auto condensate_discharge(double dry_air_mass_flow, double inlet_humidity_ratio, double outlet_humidity_ratio)
    -> std::expected<double, core::CalculationError> {
  PSYCHRO_TRY_VOID(limits::require_non_negative("dry air mass flow", dry_air_mass_flow));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(inlet_humidity_ratio));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(outlet_humidity_ratio));
  if (inlet_humidity_ratio == 0.0) {
    return 0.0;
  }
  return dry_air_mass_flow * (inlet_humidity_ratio - outlet_humidity_ratio);
}

auto coolant_mass_flow(const CoolantData& coolant, double heat_of_process)
    -> std::expected<double, core::CalculationError> {
  PSYCHRO_TRY_VOID(limits::require_finite("heat of process", heat_of_process));
  if (heat_of_process == 0.0) {
    return 0.0;
  }

  const double delta_t = coolant.return_temperature() - coolant.supply_temperature();
  if (delta_t <= 0.0) {
    return std::unexpected(core::InvalidArgumentError("coolant temperature rise", delta_t, "> 0 K"));
  }
  const double cp = (properties::liquid_water::specific_heat(coolant.supply_temperature()) +
                     properties::liquid_water::specific_heat(coolant.return_temperature())) /
                    2.0;
  return std::abs(heat_of_process) / kw_to_w / (cp * delta_t);
}

} // namespace psychro::process
