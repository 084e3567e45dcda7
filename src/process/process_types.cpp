#include "psychro/process/process_types.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/core/expected_utils.hpp"
#include "psychro/properties/limits.hpp"

namespace psychro::process {

auto CoolantData::of(double supply_temperature, double return_temperature)
    -> std::expected<CoolantData, core::CalculationError> {

  using constants::limits::max_coolant_temperature;
  using constants::limits::min_coolant_temperature;

  PSYCHRO_TRY_VOID(properties::limits::require_in_range("coolant supply temperature", supply_temperature,
                                                        min_coolant_temperature, max_coolant_temperature));
  PSYCHRO_TRY_VOID(properties::limits::require_in_range("coolant return temperature", return_temperature,
                                                        min_coolant_temperature, max_coolant_temperature));
  if (supply_temperature > return_temperature) {
    return std::unexpected(core::InvalidArgumentError(
        "coolant supply temperature", supply_temperature,
        std::format("<= return temperature ({})", return_temperature)));
  }
  return CoolantData(supply_temperature, return_temperature);
}

auto make_flow(double pressure, double temperature, double humidity_ratio, double dry_air_mass_flow)
    -> std::expected<HumidAirFlow, core::CalculationError> {
  return HumidAir::from_humidity_ratio(pressure, temperature, humidity_ratio).and_then([&](const HumidAir& air) {
    return HumidAirFlow::of(air, dry_air_mass_flow);
  });
}

} // namespace psychro::process
