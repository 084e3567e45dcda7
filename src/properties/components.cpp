#include "psychro/properties/components.hpp"
#include "psychro/core/constants.hpp"
#include <cmath>

namespace psychro::properties {

namespace {

constexpr double to_kelvin(double t) noexcept { return t + constants::physical::celsius_to_kelvin; }

constexpr double interpolate(double x1, double y1, double x2, double y2, double x) noexcept {
  return y1 + ((x - x1) / (x2 - x1)) * (y2 - y1);
}

} // namespace

// ================================================================================================
// DRY AIR
// ================================================================================================

namespace dry_air {

auto dynamic_viscosity(double ta) noexcept -> double {
  const double tk = to_kelvin(ta);
  return (0.40401 + 0.074582 * tk - 5.7171e-5 * std::pow(tk, 2) + 2.9928e-8 * std::pow(tk, 3) -
          6.2524e-12 * std::pow(tk, 4)) *
         1e-6;
}

auto kinematic_viscosity(double ta, double pressure) noexcept -> double {
  return dynamic_viscosity(ta) / density(ta, pressure);
}

auto thermal_conductivity(double ta) noexcept -> double {
  return 2.43714e-2 + 7.83035e-5 * ta - 1.94021e-8 * std::pow(ta, 2) + 2.85943e-12 * std::pow(ta, 3) -
         2.61420e-14 * std::pow(ta, 4);
}

// Piecewise fit of tabulated cp(T)
auto specific_heat(double ta) noexcept -> double {
  if (ta <= -73.15) {
    return 1.002;
  }
  if (ta <= -53.15) {
    return interpolate(-73.15, 1.002, -53.15, 1.003, ta);
  }
  if (ta <= -13.15) {
    return 1.003;
  }

  double a, b, c, d, e;
  if (ta <= 86.85) {
    a = 1.0036104793123004;
    b = 5.2562229415778261e-05;
    c = 2.9091167529181888e-07;
    d = -1.3405671294850166e-08;
    e = 1.3020833332371173e-10;
  } else {
    a = 1.0065876262557212;
    b = -2.9062712816134989e-05;
    c = 7.4445335877306371e-07;
    d = -8.4171864437938596e-10;
    e = 3.0582028042912701e-13;
  }
  return e * std::pow(ta, 4) + d * std::pow(ta, 3) + c * std::pow(ta, 2) + b * ta + a;
}

auto specific_enthalpy(double ta) noexcept -> double { return specific_heat(ta) * ta; }

auto density(double ta, double pressure) noexcept -> double {
  return pressure / (constants::physical::dry_air_gas_constant * to_kelvin(ta));
}

} // namespace dry_air

// ================================================================================================
// WATER VAPOUR
// ================================================================================================

namespace water_vapour {

auto dynamic_viscosity(double tv) noexcept -> double {
  const double tk = to_kelvin(tv);
  const double numerator = std::sqrt(tk / 647.27);
  const double reduced = 647.27 / tk;
  const double denominator =
      0.0181583 + 0.0177624 * reduced + 0.0105287 * std::pow(reduced, 2) - 0.0036744 * std::pow(reduced, 3);
  return (numerator / denominator) * 1e-6;
}

auto kinematic_viscosity(double tv, double density) noexcept -> double { return dynamic_viscosity(tv) / density; }

auto thermal_conductivity(double tv) noexcept -> double {
  return 1.74822e-2 + 7.69127e-5 * tv - 3.23464e-7 * std::pow(tv, 2) + 2.59524e-9 * std::pow(tv, 3) -
         3.1765e-12 * std::pow(tv, 4);
}

auto specific_heat(double tv) noexcept -> double {
  const double tk = to_kelvin(tv);
  if (tv <= -48.15) {
    return 1.8429999999889115 + 4.0000000111904223e-05 * tk - 2.7939677238430251e-16 * tk * tk;
  }
  constexpr double c0 = 1.9295247225621268;
  constexpr double c1 = -9.1586611999057584e-04;
  constexpr double c2 = 3.1728684251752865e-06;
  constexpr double c3 = -3.3653682733422277e-09;
  constexpr double c4 = 2.0703915723982299e-12;
  constexpr double c5 = -7.0213425618115390e-16;
  constexpr double c6 = 9.8631583006961855e-20;
  return c0 + tk * (c1 + tk * (c2 + tk * (c3 + tk * (c4 + tk * (c5 + tk * c6)))));
}

auto specific_enthalpy(double tv) noexcept -> double {
  return specific_heat(tv) * tv + constants::physical::heat_of_vaporization;
}

auto density(double tv, double pressure) noexcept -> double {
  return pressure / (constants::physical::water_vapour_gas_constant * to_kelvin(tv));
}

} // namespace water_vapour

// ================================================================================================
// LIQUID WATER
// ================================================================================================

namespace liquid_water {

auto specific_heat(double tw) noexcept -> double {
  if (tw > 0.0 && tw <= 100.0) {
    return 3.93240161e-13 * std::pow(tw, 6) - 1.525847751e-10 * std::pow(tw, 5) + 2.479227180e-8 * std::pow(tw, 4) -
           2.166932275e-6 * std::pow(tw, 3) + 1.156152199e-4 * std::pow(tw, 2) - 3.400567477e-3 * tw + 4.219924305;
  }
  return 2.588246403e-15 * std::pow(tw, 7) - 3.604612987e-12 * std::pow(tw, 6) + 2.112059173e-9 * std::pow(tw, 5) -
         6.727469888e-7 * std::pow(tw, 4) + 1.255841880e-4 * std::pow(tw, 3) - 1.370455849e-2 * std::pow(tw, 2) +
         8.093157187e-1 * tw - 15.75651097;
}

auto specific_enthalpy(double tw) noexcept -> double { return tw < 0.0 ? 0.0 : tw * specific_heat(tw); }

auto density(double tw) noexcept -> double {
  return (999.83952 + 16.945176 * tw - 7.9870401e-3 * std::pow(tw, 2) - 46.170461e-6 * std::pow(tw, 3) +
          105.56302e-9 * std::pow(tw, 4) - 280.54253e-12 * std::pow(tw, 5)) /
         (1.0 + 16.89785e-3 * tw);
}

} // namespace liquid_water

// ================================================================================================
// ICE
// ================================================================================================

namespace ice {

auto specific_heat(double ti) noexcept -> double {
  return 2.0509727263 + 0.0048764802 * ti - 0.0000277225 * std::pow(ti, 2) - 0.0000001031 * std::pow(ti, 3);
}

auto specific_enthalpy(double ti) noexcept -> double {
  return ti > 0.0 ? 0.0 : ti * specific_heat(ti) - constants::physical::heat_of_ice_melt;
}

auto thermal_conductivity(double ti) noexcept -> double {
  return 2.2173524402158 - 0.0069168602852 * ti + 0.0001016721167 * std::pow(ti, 2) +
         0.0000004456743 * std::pow(ti, 3);
}

auto density(double ti) noexcept -> double {
  return 916.1204382651714 - 0.42803436487679 * ti - 0.02237994685111 * std::pow(ti, 2) -
         0.00061508830263 * std::pow(ti, 3) - 0.00000784399543 * std::pow(ti, 4) -
         0.00000003790984 * std::pow(ti, 5) + 0.00000000005916 * std::pow(ti, 6) +
         0.00000000000078 * std::pow(ti, 7);
}

} // namespace ice

} // namespace psychro::properties
