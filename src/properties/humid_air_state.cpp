#include "psychro/properties/humid_air_state.hpp"
#include "psychro/core/expected_utils.hpp"
#include "psychro/properties/humid_air.hpp"
#include "psychro/properties/limits.hpp"

namespace psychro::properties {

auto HumidAir::from_relative_humidity(double pressure, double temperature, double relative_humidity)
    -> std::expected<HumidAir, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));
  PSYCHRO_TRY_VOID(limits::require_saturation_temperature(temperature));
  PSYCHRO_TRY_VOID(limits::require_relative_humidity(relative_humidity));

  double ps = 0.0;
  double x = 0.0;
  PSYCHRO_TRY_ASSIGN(ps, humid_air::saturation_pressure(temperature));
  PSYCHRO_TRY_ASSIGN(x, humid_air::humidity_ratio(relative_humidity, ps, pressure));

  double tdp = 0.0;
  double h = 0.0;
  double rho = 0.0;
  PSYCHRO_TRY_ASSIGN(tdp, humid_air::dew_point_temperature(temperature, relative_humidity, pressure));
  PSYCHRO_TRY_ASSIGN(h, humid_air::specific_enthalpy(temperature, x, pressure));
  PSYCHRO_TRY_ASSIGN(rho, humid_air::density(temperature, x, pressure));

  return HumidAir(pressure, temperature, x, relative_humidity, ps, tdp, h, rho);
}

auto HumidAir::from_humidity_ratio(double pressure, double temperature, double humidity_ratio)
    -> std::expected<HumidAir, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));
  PSYCHRO_TRY_VOID(limits::require_saturation_temperature(temperature));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(humidity_ratio));

  double ps = 0.0;
  double rh = 0.0;
  PSYCHRO_TRY_ASSIGN(ps, humid_air::saturation_pressure(temperature));
  PSYCHRO_TRY_ASSIGN(rh, humid_air::relative_humidity(temperature, humidity_ratio, pressure));

  double tdp = 0.0;
  double h = 0.0;
  double rho = 0.0;
  PSYCHRO_TRY_ASSIGN(tdp, humid_air::dew_point_temperature(temperature, rh, pressure));
  PSYCHRO_TRY_ASSIGN(h, humid_air::specific_enthalpy(temperature, humidity_ratio, pressure));
  PSYCHRO_TRY_ASSIGN(rho, humid_air::density(temperature, humidity_ratio, pressure));

  return HumidAir(pressure, temperature, humidity_ratio, rh, ps, tdp, h, rho);
}

auto HumidAir::wet_bulb_temperature() const -> std::expected<double, core::CalculationError> {
  return humid_air::wet_bulb_temperature(temperature_, relative_humidity_, pressure_);
}

auto HumidAirFlow::of(const HumidAir& air, double dry_air_mass_flow)
    -> std::expected<HumidAirFlow, core::CalculationError> {
  PSYCHRO_TRY_VOID(limits::require_non_negative("dry air mass flow", dry_air_mass_flow));
  return HumidAirFlow(air, dry_air_mass_flow);
}

} // namespace psychro::properties
