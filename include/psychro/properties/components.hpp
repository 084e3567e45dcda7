#pragma once

// Property correlations of the pure components of humid air.
// Temperatures in °C, pressures in Pa, enthalpies in kJ/kg, specific heats in kJ/(kg·K).

namespace psychro::properties {

namespace dry_air {
[[nodiscard]] auto dynamic_viscosity(double ta) noexcept -> double;
[[nodiscard]] auto kinematic_viscosity(double ta, double pressure) noexcept -> double;
[[nodiscard]] auto thermal_conductivity(double ta) noexcept -> double;
[[nodiscard]] auto specific_heat(double ta) noexcept -> double;
[[nodiscard]] auto specific_enthalpy(double ta) noexcept -> double;
[[nodiscard]] auto density(double ta, double pressure) noexcept -> double;
} // namespace dry_air

namespace water_vapour {
[[nodiscard]] auto dynamic_viscosity(double tv) noexcept -> double;
[[nodiscard]] auto kinematic_viscosity(double tv, double density) noexcept -> double;
[[nodiscard]] auto thermal_conductivity(double tv) noexcept -> double;
[[nodiscard]] auto specific_heat(double tv) noexcept -> double;
/// Includes the heat of vaporization at 0 °C
[[nodiscard]] auto specific_enthalpy(double tv) noexcept -> double;
/// Ideal gas density at vapour partial pressure
[[nodiscard]] auto density(double tv, double pressure) noexcept -> double;
} // namespace water_vapour

namespace liquid_water {
[[nodiscard]] auto specific_heat(double tw) noexcept -> double;
/// Zero below 0 °C
[[nodiscard]] auto specific_enthalpy(double tw) noexcept -> double;
[[nodiscard]] auto density(double tw) noexcept -> double;
} // namespace liquid_water

namespace ice {
[[nodiscard]] auto specific_heat(double ti) noexcept -> double;
/// Includes the heat of ice melt; zero above 0 °C
[[nodiscard]] auto specific_enthalpy(double ti) noexcept -> double;
[[nodiscard]] auto thermal_conductivity(double ti) noexcept -> double;
[[nodiscard]] auto density(double ti) noexcept -> double;
} // namespace ice

} // namespace psychro::properties
