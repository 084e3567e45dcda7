#pragma once
#include "psychro/process/process_types.hpp"
#include "psychro/solver/solver_types.hpp"
#include <expected>

namespace psychro::process {

// ================================================================================================
// DRY COOLING (no condensation)
// ================================================================================================

/**
 * @brief Sensible cooling with a given cooler power
 *
 * @param inlet Inlet air flow
 * @param power Cooling power [W], not positive
 * @return Outlet state at unchanged humidity ratio
 */
[[nodiscard]] auto dry_cooling_from_power(const HumidAirFlow& inlet, double power)
    -> std::expected<DryCoolingResult, core::CalculationError>;

/**
 * @brief Sensible cooling to a target temperature between the inlet dew point and inlet temperature
 */
[[nodiscard]] auto dry_cooling_from_temperature(const HumidAirFlow& inlet, double target_temperature)
    -> std::expected<DryCoolingResult, core::CalculationError>;

// ================================================================================================
// REAL COOLING COIL (bypass factor model)
// ================================================================================================

/**
 * @brief Cooling coil outlet for a target outlet temperature
 *
 * Part (1 - BF) of the air touches the coil wall at the mean coolant temperature
 * and leaves saturated if the wall is below the inlet dew point; the rest
 * bypasses the coil unchanged. Closed form, no iteration.
 *
 * @param inlet Inlet air flow
 * @param coolant Coolant supply and return temperatures
 * @param target_temperature Outlet temperature [°C], at least 0 °C and not above the inlet
 */
[[nodiscard]] auto cooling_from_temperature(const HumidAirFlow& inlet, const CoolantData& coolant,
                                            double target_temperature)
    -> std::expected<RealCoolingResult, core::CalculationError>;

/**
 * @brief Cooling coil outlet for a target outlet relative humidity
 *
 * Iterates the outlet temperature between the inlet dry-bulb and dew point.
 *
 * @param target_relative_humidity Outlet RH [%] in [0, 98], not below the inlet RH
 */
[[nodiscard]] auto cooling_from_relative_humidity(const HumidAirFlow& inlet, const CoolantData& coolant,
                                                  double target_relative_humidity,
                                                  const solver::SolverConfig& config = {})
    -> std::expected<RealCoolingResult, core::CalculationError>;

/**
 * @brief Cooling coil outlet for a given cooling power
 *
 * Iterates the outlet temperature between the inlet temperature and the dry
 * cooling outlet for the same power.
 *
 * @param power Cooling power [W], not positive and not beyond cooling the air to 0 kJ/kg
 */
[[nodiscard]] auto cooling_from_power(const HumidAirFlow& inlet, const CoolantData& coolant, double power,
                                      const solver::SolverConfig& config = {})
    -> std::expected<RealCoolingResult, core::CalculationError>;

// ================================================================================================
// HELPERS
// ================================================================================================

/// (t_out - t_wall) / (t_in - t_wall)
[[nodiscard]] auto coil_bypass_factor(double wall_temperature, double inlet_temperature, double outlet_temperature)
    -> std::expected<double, core::CalculationError>;

/// Water removed from a dry air flow between two humidity ratios [kg/s]
[[nodiscard]] auto condensate_discharge(double dry_air_mass_flow, double inlet_humidity_ratio,
                                        double outlet_humidity_ratio)
    -> std::expected<double, core::CalculationError>;

/// Coolant mass flow [kg/s] carrying the given heat between supply and return temperature
[[nodiscard]] auto coolant_mass_flow(const CoolantData& coolant, double heat_of_process)
    -> std::expected<double, core::CalculationError>;

} // namespace psychro::process
