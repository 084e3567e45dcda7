#pragma once
#include "psychro/process/process_types.hpp"
#include "psychro/solver/solver_types.hpp"
#include <expected>
#include <span>

namespace psychro::process {

/**
 * @brief Adiabatic mixing of two flows
 *
 * Humidity ratio and enthalpy are dry-air-mass weighted; the outlet keeps the
 * pressure of the first flow. A flow with zero dry air passes the other through.
 */
[[nodiscard]] auto mix_two(const HumidAirFlow& first, const HumidAirFlow& second)
    -> std::expected<MixingResult, core::CalculationError>;

/**
 * @brief Adiabatic mixing of any number of flows at the highest inlet pressure
 *
 * @param flows At least one flow; the dry air flows must not all be zero
 */
[[nodiscard]] auto mix_multiple(std::span<const HumidAirFlow> flows)
    -> std::expected<MixingResult, core::CalculationError>;

/**
 * @brief Split a target dry air flow between two air states to reach a target outlet temperature
 *
 * Each stream keeps at least its minimum (locked) flow. When the locked flows
 * already exceed the target flow, the locked-flow mix is returned. When the
 * target temperature lies at or beyond what either extreme split reaches, that
 * extreme mix is returned. Otherwise the first stream's flow is iterated over
 * [first_min_flow, target_flow].
 *
 * @param first First air state
 * @param first_min_flow Locked dry air flow of the first stream [kg/s]
 * @param second Second air state
 * @param second_min_flow Locked dry air flow of the second stream [kg/s]
 * @param target_flow Outlet dry air flow [kg/s]
 * @param target_temperature Outlet temperature [°C]
 * @return Mixing result with the flows actually used
 */
[[nodiscard]] auto mix_to_target_temperature(const HumidAir& first, double first_min_flow, const HumidAir& second,
                                             double second_min_flow, double target_flow, double target_temperature,
                                             const solver::SolverConfig& config = {})
    -> std::expected<MixingResult, core::CalculationError>;

} // namespace psychro::process
