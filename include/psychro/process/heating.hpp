#pragma once
#include "psychro/process/process_types.hpp"
#include <expected>

namespace psychro::process {

/**
 * @brief Sensible heating with a given heater power
 *
 * @param inlet Inlet air flow
 * @param power Heater power [W], not negative and not above the power that would
 *              bring the air to 98 % of its boiling temperature
 * @return Outlet state at unchanged humidity ratio
 */
[[nodiscard]] auto heating_from_power(const HumidAirFlow& inlet, double power)
    -> std::expected<HeatingResult, core::CalculationError>;

/**
 * @brief Sensible heating to a target outlet temperature
 *
 * @param inlet Inlet air flow
 * @param target_temperature Outlet temperature [°C], not below the inlet temperature
 * @return Outlet state and the required power
 */
[[nodiscard]] auto heating_from_temperature(const HumidAirFlow& inlet, double target_temperature)
    -> std::expected<HeatingResult, core::CalculationError>;

/**
 * @brief Sensible heating down to a target relative humidity
 *
 * @param inlet Inlet air flow
 * @param target_relative_humidity Outlet RH [%] in [0, 98], not above the inlet RH
 * @return Outlet state and the required power
 */
[[nodiscard]] auto heating_from_relative_humidity(const HumidAirFlow& inlet, double target_relative_humidity)
    -> std::expected<HeatingResult, core::CalculationError>;

} // namespace psychro::process
