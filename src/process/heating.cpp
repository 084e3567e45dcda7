#include "psychro/process/heating.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/core/expected_utils.hpp"
#include "psychro/properties/humid_air.hpp"
#include "psychro/properties/limits.hpp"

namespace psychro::process {

namespace humid_air = properties::humid_air;
namespace limits = properties::limits;
using constants::conversion::kw_to_w;

namespace {

auto unchanged(const HumidAirFlow& inlet, double power) -> HeatingResult {
  return HeatingResult{.inlet = inlet, .outlet = inlet, .heat_of_process = power};
}

// Heating at constant humidity ratio to a known outlet temperature
auto heat_to(const HumidAirFlow& inlet, double outlet_temperature)
    -> std::expected<HeatingResult, core::CalculationError> {
  const double mda = inlet.dry_air_mass_flow();
  const double x = inlet.humidity_ratio();
  const double p = inlet.pressure();

  double h_out = 0.0;
  PSYCHRO_TRY_ASSIGN(h_out, humid_air::specific_enthalpy(outlet_temperature, x, p));
  const double power = (mda * h_out - mda * inlet.specific_enthalpy()) * kw_to_w;

  auto outlet = make_flow(p, outlet_temperature, x, mda);
  if (!outlet) {
    return std::unexpected(outlet.error());
  }
  return HeatingResult{.inlet = inlet, .outlet = *outlet, .heat_of_process = power};
}

} // namespace

auto heating_from_power(const HumidAirFlow& inlet, double power)
    -> std::expected<HeatingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_finite("heating power", power));
  if (power < 0.0) {
    return std::unexpected(core::InvalidArgumentError("heating power", power, ">= 0 W"));
  }

  const double mda = inlet.dry_air_mass_flow();
  const double x = inlet.humidity_ratio();
  const double p = inlet.pressure();

  double t_boil = 0.0;
  double h_max = 0.0;
  PSYCHRO_TRY_ASSIGN(t_boil, humid_air::max_dry_bulb_temperature(p));
  PSYCHRO_TRY_ASSIGN(h_max, humid_air::specific_enthalpy(constants::limits::heating_temperature_margin * t_boil, x, p));

  const double power_limit = (h_max - inlet.specific_enthalpy()) * inlet.humid_air_mass_flow() * kw_to_w;
  if (power > power_limit) {
    return std::unexpected(
        core::InvalidArgumentError("heating power", power, std::format("<= {:.1f} W for this flow", power_limit)));
  }

  if (power == 0.0 || mda == 0.0) {
    return unchanged(inlet, power);
  }

  const double h_out = (mda * inlet.specific_enthalpy() + power / kw_to_w) / mda;

  double t_out = 0.0;
  PSYCHRO_TRY_ASSIGN(t_out, humid_air::dry_bulb_temperature_from_enthalpy(h_out, x, p));

  auto outlet = make_flow(p, t_out, x, mda);
  if (!outlet) {
    return std::unexpected(outlet.error());
  }
  return HeatingResult{.inlet = inlet, .outlet = *outlet, .heat_of_process = power};
}

auto heating_from_temperature(const HumidAirFlow& inlet, double target_temperature)
    -> std::expected<HeatingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_temperature(target_temperature, "target temperature"));
  if (target_temperature < inlet.temperature()) {
    return std::unexpected(core::InvalidArgumentError(
        "target temperature", target_temperature, std::format(">= inlet temperature ({})", inlet.temperature())));
  }

  if (target_temperature == inlet.temperature() || inlet.dry_air_mass_flow() == 0.0) {
    return unchanged(inlet, 0.0);
  }
  return heat_to(inlet, target_temperature);
}

auto heating_from_relative_humidity(const HumidAirFlow& inlet, double target_relative_humidity)
    -> std::expected<HeatingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_in_range("target relative humidity", target_relative_humidity, 0.0,
                                            constants::limits::max_process_relative_humidity));
  if (target_relative_humidity > inlet.relative_humidity()) {
    return std::unexpected(core::InvalidArgumentError(
        "target relative humidity", target_relative_humidity,
        std::format("<= inlet relative humidity ({}) for heating", inlet.relative_humidity())));
  }

  if (target_relative_humidity == inlet.relative_humidity() || inlet.dry_air_mass_flow() == 0.0) {
    return unchanged(inlet, 0.0);
  }

  double t_out = 0.0;
  PSYCHRO_TRY_ASSIGN(t_out, humid_air::dry_bulb_temperature_from_humidity_ratio(
                                inlet.humidity_ratio(), target_relative_humidity, inlet.pressure()));
  return heat_to(inlet, t_out);
}

} // namespace psychro::process
