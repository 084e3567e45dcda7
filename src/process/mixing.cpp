#include "psychro/process/mixing.hpp"
#include "psychro/core/expected_utils.hpp"
#include "psychro/properties/humid_air.hpp"
#include "psychro/properties/limits.hpp"
#include "psychro/solver/brent_solver.hpp"
#include <algorithm>
#include <vector>

namespace psychro::process {

namespace humid_air = properties::humid_air;
namespace limits = properties::limits;

namespace {

struct MixedState {
  double pressure;
  double temperature;
  double humidity_ratio;
  double dry_air_mass_flow;
};

// Mass balance of two states without building flow objects, so trial flows of
// the target temperature iteration are never rejected by flow validation
auto mix_states(const HumidAir& first, double first_flow, const HumidAir& second, double second_flow)
    -> std::expected<MixedState, core::CalculationError> {
  const double total = first_flow + second_flow;
  if (total == 0.0) {
    return std::unexpected(core::InvalidArgumentError("total dry air mass flow", total, "> 0 kg/s"));
  }

  const double x = (first_flow * first.humidity_ratio() + second_flow * second.humidity_ratio()) / total;
  const double h = (first_flow * first.specific_enthalpy() + second_flow * second.specific_enthalpy()) / total;

  double t = 0.0;
  PSYCHRO_TRY_ASSIGN(t, humid_air::dry_bulb_temperature_from_enthalpy(h, x, first.pressure()));
  return MixedState{.pressure = first.pressure(), .temperature = t, .humidity_ratio = x, .dry_air_mass_flow = total};
}

auto mix_at(const HumidAir& first, double first_flow, const HumidAir& second, double second_flow)
    -> std::expected<MixingResult, core::CalculationError> {
  auto first_stream = HumidAirFlow::of(first, first_flow);
  if (!first_stream) {
    return std::unexpected(first_stream.error());
  }
  auto second_stream = HumidAirFlow::of(second, second_flow);
  if (!second_stream) {
    return std::unexpected(second_stream.error());
  }
  return mix_two(*first_stream, *second_stream);
}

} // namespace

auto mix_two(const HumidAirFlow& first, const HumidAirFlow& second)
    -> std::expected<MixingResult, core::CalculationError> {

  const double m1 = first.dry_air_mass_flow();
  const double m2 = second.dry_air_mass_flow();

  if (m1 == 0.0) {
    return MixingResult{.inlets = {first, second}, .outlet = second};
  }
  if (m2 == 0.0 || m1 + m2 == 0.0) {
    return MixingResult{.inlets = {first, second}, .outlet = first};
  }

  auto mixed = mix_states(first.air(), m1, second.air(), m2);
  if (!mixed) {
    return std::unexpected(mixed.error());
  }
  auto outlet = make_flow(mixed->pressure, mixed->temperature, mixed->humidity_ratio, mixed->dry_air_mass_flow);
  if (!outlet) {
    return std::unexpected(outlet.error());
  }
  return MixingResult{.inlets = {first, second}, .outlet = *outlet};
}

auto mix_multiple(std::span<const HumidAirFlow> flows) -> std::expected<MixingResult, core::CalculationError> {

  if (flows.empty()) {
    return std::unexpected(core::InvalidArgumentError("at least one flow is required for mixing"));
  }

  double total = 0.0;
  double x_weighted = 0.0;
  double h_weighted = 0.0;
  double pressure = flows.front().pressure();
  for (const auto& flow : flows) {
    const double mda = flow.dry_air_mass_flow();
    total += mda;
    x_weighted += mda * flow.humidity_ratio();
    h_weighted += mda * flow.specific_enthalpy();
    pressure = std::max(pressure, flow.pressure());
  }

  if (total == 0.0) {
    return std::unexpected(core::InvalidArgumentError("sum of dry air mass flows", total, "> 0 kg/s"));
  }

  std::vector<HumidAirFlow> inlets(flows.begin(), flows.end());
  if (flows.size() == 1) {
    return MixingResult{.inlets = std::move(inlets), .outlet = flows.front()};
  }

  const double x = x_weighted / total;
  const double h = h_weighted / total;

  double t = 0.0;
  PSYCHRO_TRY_ASSIGN(t, humid_air::dry_bulb_temperature_from_enthalpy(h, x, pressure));

  auto outlet = make_flow(pressure, t, x, total);
  if (!outlet) {
    return std::unexpected(outlet.error());
  }
  return MixingResult{.inlets = std::move(inlets), .outlet = *outlet};
}

auto mix_to_target_temperature(const HumidAir& first, double first_min_flow, const HumidAir& second,
                               double second_min_flow, double target_flow, double target_temperature,
                               const solver::SolverConfig& config)
    -> std::expected<MixingResult, core::CalculationError> {

  PSYCHRO_TRY_VOID(limits::require_non_negative("first minimum dry air mass flow", first_min_flow));
  PSYCHRO_TRY_VOID(limits::require_non_negative("second minimum dry air mass flow", second_min_flow));
  PSYCHRO_TRY_VOID(limits::require_non_negative("target dry air mass flow", target_flow));
  PSYCHRO_TRY_VOID(limits::require_temperature(target_temperature, "target temperature"));

  const double min_sum = first_min_flow + second_min_flow;
  if (min_sum == 0.0 && target_flow == 0.0) {
    return std::unexpected(core::InvalidArgumentError("target dry air mass flow", target_flow, "> 0 kg/s"));
  }

  // Locked flows alone exceed the target
  if (min_sum > target_flow) {
    return mix_at(first, first_min_flow, second, second_min_flow);
  }

  // Extreme splits: one stream at its maximum, the other at its minimum
  auto first_extreme = mix_at(first, target_flow - second_min_flow, second, second_min_flow);
  if (!first_extreme) {
    return std::unexpected(first_extreme.error());
  }
  auto second_extreme = mix_at(first, first_min_flow, second, target_flow - first_min_flow);
  if (!second_extreme) {
    return std::unexpected(second_extreme.error());
  }

  const double t1 = first_extreme->outlet.temperature();
  const double t2 = second_extreme->outlet.temperature();
  if ((t1 <= t2 && target_temperature <= t1) || (t1 >= t2 && target_temperature >= t1)) {
    return first_extreme;
  }
  if ((t2 <= t1 && target_temperature <= t2) || (t2 >= t1 && target_temperature >= t2)) {
    return second_extreme;
  }

  auto residual = [&](double first_flow) -> std::expected<double, core::CalculationError> {
    auto mixed = mix_states(first, first_flow, second, target_flow - first_flow);
    if (!mixed) {
      return std::unexpected(mixed.error());
    }
    return target_temperature - mixed->temperature;
  };

  double first_flow = 0.0;
  PSYCHRO_TRY_ASSIGN(first_flow, solver::find_root(residual, first_min_flow, target_flow, config));
  first_flow = std::clamp(first_flow, first_min_flow, target_flow - second_min_flow);
  return mix_at(first, first_flow, second, target_flow - first_flow);
}

} // namespace psychro::process
