#pragma once
#include "psychro/core/exceptions.hpp"
#include <expected>

/**
 * @brief Humid air property functions and their inverters
 *
 * Units: temperatures in °C, pressures in Pa, relative humidity in %, humidity
 * ratio in kg/kg dry air, enthalpy in kJ/kg dry air. Every function validates
 * its inputs before building a residual; iterative ones propagate solver errors.
 */
namespace psychro::properties::humid_air {

using Result = std::expected<double, core::CalculationError>;

// ================================================================================================
// SATURATION AND MOISTURE CONTENT
// ================================================================================================

/**
 * @brief Water vapour saturation pressure over water (ta >= 0) or ice (ta < 0)
 *
 * Solves the Hyland-Wexler correlation, seeded by the Arden-Buck equation.
 */
[[nodiscard]] auto saturation_pressure(double ta) -> Result;

/// Saturation pressure implied by a humidity ratio and relative humidity
[[nodiscard]] auto saturation_pressure(double x, double rh, double pressure) -> Result;

[[nodiscard]] auto humidity_ratio(double rh, double saturation_pressure, double pressure) -> Result;

[[nodiscard]] auto max_humidity_ratio(double saturation_pressure, double pressure) -> Result;

/// Relative humidity from dew point and dry-bulb temperature (Arden-Buck)
[[nodiscard]] auto relative_humidity_from_dew_point(double tdp, double ta) -> Result;

/// Relative humidity from dry-bulb temperature and humidity ratio, capped at 100 %
[[nodiscard]] auto relative_humidity(double ta, double x, double pressure) -> Result;

/**
 * @brief Dew point temperature
 *
 * Returns ta at saturation and -infinity for perfectly dry air. The Arden-Buck
 * closed form is used from 25 % RH upward; below it the estimate seeds an
 * iteration on the saturation humidity ratio.
 */
[[nodiscard]] auto dew_point_temperature(double ta, double rh, double pressure) -> Result;

/**
 * @brief Thermodynamic wet-bulb temperature
 *
 * Energy balance of adiabatic saturation; the added water is ice at or below 0 °C.
 */
[[nodiscard]] auto wet_bulb_temperature(double ta, double rh, double pressure) -> Result;

// ================================================================================================
// TRANSPORT AND CALORIC PROPERTIES
// ================================================================================================

[[nodiscard]] auto dynamic_viscosity(double ta, double x) -> Result;

[[nodiscard]] auto kinematic_viscosity(double ta, double x, double pressure) -> Result;

[[nodiscard]] auto thermal_conductivity(double ta, double x) -> Result;

[[nodiscard]] auto specific_heat(double ta, double x) -> Result;

/**
 * @brief Specific enthalpy per kg of dry air
 *
 * Above the saturation humidity ratio the surplus water is counted as liquid
 * (above 0 °C) or ice fog (at or below 0 °C).
 */
[[nodiscard]] auto specific_enthalpy(double ta, double x, double pressure) -> Result;

[[nodiscard]] auto density(double ta, double x, double pressure) -> Result;

// ================================================================================================
// DRY-BULB TEMPERATURE INVERTERS
// ================================================================================================

/// +infinity for zero relative humidity
[[nodiscard]] auto dry_bulb_temperature_from_dew_point(double tdp, double rh, double pressure) -> Result;

[[nodiscard]] auto dry_bulb_temperature_from_humidity_ratio(double x, double rh, double pressure) -> Result;

[[nodiscard]] auto dry_bulb_temperature_from_enthalpy(double h, double x, double pressure) -> Result;

[[nodiscard]] auto dry_bulb_temperature_from_wet_bulb(double wbt, double rh, double pressure) -> Result;

/// Temperature at which the saturation pressure reaches the total pressure
[[nodiscard]] auto max_dry_bulb_temperature(double pressure) -> Result;

} // namespace psychro::properties::humid_air
