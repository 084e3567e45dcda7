#include "psychro/properties/humid_air.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/core/expected_utils.hpp"
#include "psychro/properties/components.hpp"
#include "psychro/properties/limits.hpp"
#include "psychro/solver/brent_solver.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace psychro::properties::humid_air {

namespace {

namespace phys = constants::physical;
using constants::solver::seed_lower_factor;
using constants::solver::seed_upper_factor;

constexpr double wg_ratio = phys::molecular_mass_ratio;

// Bracket evaluator settings shared by the seeded inverters
const solver::SolverConfig inverter_config{.p2_divisor = constants::solver::p2_divisor,
                                           .p3_divisor = constants::solver::inverter_p3_divisor};

// Arden-Buck exponent
auto alfa_t(double ta) noexcept -> double {
  double b, c, d;
  if (ta > 0.0) {
    b = constants::arden_buck::water::b;
    c = constants::arden_buck::water::c;
    d = constants::arden_buck::water::d;
  } else {
    b = constants::arden_buck::ice::b;
    c = constants::arden_buck::ice::c;
    d = constants::arden_buck::ice::d;
  }
  return (b - ta / d) * (ta / (c + ta));
}

auto humidity_ratio_of(double rh, double ps, double pressure) noexcept -> double {
  const double pv = rh / 100.0 * ps;
  return wg_ratio * pv / (pressure - pv);
}

} // namespace

auto saturation_pressure(double ta) -> Result {
  PSYCHRO_TRY_VOID(limits::require_saturation_temperature(ta));

  namespace hw = constants::hyland_wexler;
  const double tk = ta + phys::celsius_to_kelvin;

  double a;
  solver::ResidualFunction residual;
  if (ta < 0.0) {
    a = constants::arden_buck::ice::a;
    residual = [tk](double ps) {
      return std::log(ps) - hw::c1 / tk - hw::c2 - hw::c3 * tk - hw::c4 * tk * tk - hw::c5 * tk * tk * tk -
             hw::c6 * tk * tk * tk * tk - hw::c7 * std::log(tk);
    };
  } else {
    a = constants::arden_buck::water::a;
    residual = [tk](double ps) {
      return std::log(ps) - hw::c8 / tk - hw::c9 - hw::c10 * tk - hw::c11 * tk * tk - hw::c12 * tk * tk * tk -
             hw::c13 * std::log(tk);
    };
  }

  const double n = ta > hw::high_temperature_threshold ? hw::high_temperature_factor : 1.0;
  const double estimate = a * std::exp(alfa_t(ta)) * 100.0;

  return solver::find_root(residual, estimate * seed_lower_factor, estimate * seed_upper_factor * n,
                           inverter_config);
}

auto saturation_pressure(double x, double rh, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(x));
  PSYCHRO_TRY_VOID(limits::require_relative_humidity(rh));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));
  if (rh == 0.0) {
    return std::unexpected(core::InvalidArgumentError("relative humidity", rh, "> 0"));
  }
  return x * pressure / ((wg_ratio * rh / 100.0) + x * rh / 100.0);
}

auto humidity_ratio(double rh, double saturation_pressure, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_relative_humidity(rh));
  PSYCHRO_TRY_VOID(limits::require_non_negative("saturation pressure", saturation_pressure));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  const double pv = rh / 100.0 * saturation_pressure;
  if (pv >= pressure) {
    return std::unexpected(core::InvalidArgumentError("vapour partial pressure", pv, "< total pressure"));
  }
  return humidity_ratio_of(rh, saturation_pressure, pressure);
}

auto max_humidity_ratio(double saturation_pressure, double pressure) -> Result {
  return humidity_ratio(100.0, saturation_pressure, pressure);
}

auto relative_humidity_from_dew_point(double tdp, double ta) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(tdp, "dew point temperature"));
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  return std::exp(alfa_t(tdp) - alfa_t(ta)) * 100.0;
}

auto relative_humidity(double ta, double x, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(x));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));
  if (x == 0.0) {
    return 0.0;
  }

  double ps = 0.0;
  PSYCHRO_TRY_ASSIGN(ps, saturation_pressure(ta));
  const double rh = x * pressure / (wg_ratio * ps + x * ps);
  return rh > 1.0 ? 100.0 : rh * 100.0;
}

auto dew_point_temperature(double ta, double rh, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  PSYCHRO_TRY_VOID(limits::require_relative_humidity(rh));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  if (rh >= 100.0) {
    return ta;
  }
  if (rh == 0.0) {
    return -std::numeric_limits<double>::infinity();
  }

  double b, c, d;
  if (ta > 0.0) {
    b = constants::arden_buck::water::b;
    c = constants::arden_buck::water::c;
    d = constants::arden_buck::water::d;
  } else {
    b = constants::arden_buck::ice::b;
    c = constants::arden_buck::ice::c;
    d = constants::arden_buck::ice::d;
  }
  const double a = 2.0 / d;
  const double beta = std::log(rh / 100.0) + alfa_t(ta);
  const double b_trh = b - beta;
  const double c_trh = -c * beta;
  const double estimate = 1.0 / a * (b_trh - std::sqrt(b_trh * b_trh + 2.0 * a * c_trh));

  if (rh >= 25.0) {
    return estimate;
  }

  double ps = 0.0;
  double x = 0.0;
  PSYCHRO_TRY_ASSIGN(ps, saturation_pressure(ta));
  PSYCHRO_TRY_ASSIGN(x, humidity_ratio(rh, ps, pressure));

  auto config = inverter_config;
  if (rh < 1.0) {
    config.tolerance = constants::solver::fine_tolerance;
  }

  auto residual = [x, pressure](double t) -> Result {
    double ps_t = 0.0;
    double x_max = 0.0;
    PSYCHRO_TRY_ASSIGN(ps_t, saturation_pressure(t));
    PSYCHRO_TRY_ASSIGN(x_max, max_humidity_ratio(ps_t, pressure));
    return x_max - x;
  };

  return solver::find_root(residual, estimate * seed_lower_factor, estimate * seed_upper_factor, config);
}

auto wet_bulb_temperature(double ta, double rh, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  PSYCHRO_TRY_VOID(limits::require_relative_humidity(rh));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  if (rh >= 100.0) {
    return ta;
  }

  // Empirical fit (Stull, 2011) used as seed
  const double estimate = ta * std::atan(0.151977 * std::sqrt(rh + 8.313659)) + std::atan(ta + rh) -
                          std::atan(rh - 1.676331) + 0.00391838 * std::pow(rh, 1.5) * std::atan(0.023101 * rh) -
                          4.686035;

  double ps = 0.0;
  double x = 0.0;
  double h = 0.0;
  PSYCHRO_TRY_ASSIGN(ps, saturation_pressure(ta));
  PSYCHRO_TRY_ASSIGN(x, humidity_ratio(rh, ps, pressure));
  PSYCHRO_TRY_ASSIGN(h, specific_enthalpy(ta, x, pressure));

  auto residual = [x, h, pressure](double t) -> Result {
    double ps_t = 0.0;
    double x_sat = 0.0;
    double h_sat = 0.0;
    PSYCHRO_TRY_ASSIGN(ps_t, saturation_pressure(t));
    PSYCHRO_TRY_ASSIGN(x_sat, max_humidity_ratio(ps_t, pressure));
    PSYCHRO_TRY_ASSIGN(h_sat, specific_enthalpy(t, x_sat, pressure));
    const double h_water = t <= 0.0 ? ice::specific_enthalpy(t) : liquid_water::specific_enthalpy(t);
    return h + (x_sat - x) * h_water - h_sat;
  };

  double lower = estimate * seed_lower_factor;
  double upper = estimate * seed_upper_factor;
  double f_lower = 0.0;
  double f_upper = 0.0;
  PSYCHRO_TRY_ASSIGN(f_lower, solver::evaluate(residual, lower));
  PSYCHRO_TRY_ASSIGN(f_upper, solver::evaluate(residual, upper));

  // Near 0 degC the relative seed bracket collapses; fall back to tdp <= twb <= ta.
  // The residual is positive below the dew point and negative at the dry bulb.
  if (f_lower * f_upper > 0.0) {
    lower = constants::limits::min_saturation_temperature;
    if (rh > 0.0) {
      double tdp = 0.0;
      PSYCHRO_TRY_ASSIGN(tdp, dew_point_temperature(ta, rh, pressure));
      lower = std::max(tdp - 1.0, lower);
    }
    upper = ta;
  }

  return solver::find_root(residual, lower, upper, inverter_config);
}

auto dynamic_viscosity(double ta, double x) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(x));

  const double mu_da = dry_air::dynamic_viscosity(ta);
  if (x == 0.0) {
    return mu_da;
  }

  // Wilke mixing rule
  const double xm = x * 1.61;
  const double mu_wv = water_vapour::dynamic_viscosity(ta);
  const double m_da = phys::dry_air_molecular_mass;
  const double m_wv = phys::water_vapour_molecular_mass;
  const double fi_av = std::pow(1.0 + std::sqrt(mu_da / mu_wv) * std::pow(m_wv / m_da, 0.25), 2) /
                       (2.0 * std::sqrt(2.0) * std::sqrt(1.0 + m_da / m_wv));
  const double fi_va = std::pow(1.0 + std::sqrt(mu_wv / mu_da) * std::pow(m_da / m_wv, 0.25), 2) /
                       (2.0 * std::sqrt(2.0) * std::sqrt(1.0 + m_wv / m_da));

  return mu_da / (1.0 + fi_av * xm) + mu_wv / (1.0 + fi_va / xm);
}

auto kinematic_viscosity(double ta, double x, double pressure) -> Result {
  double mu = 0.0;
  double rho = 0.0;
  PSYCHRO_TRY_ASSIGN(mu, dynamic_viscosity(ta, x));
  PSYCHRO_TRY_ASSIGN(rho, density(ta, x, pressure));
  return mu / rho;
}

auto thermal_conductivity(double ta, double x) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(x));

  const double k_da = dry_air::thermal_conductivity(ta);
  if (x == 0.0) {
    return k_da;
  }

  const double mu_da = dry_air::dynamic_viscosity(ta);
  const double mu_wv = water_vapour::dynamic_viscosity(ta);
  const double k_wv = water_vapour::thermal_conductivity(ta);
  const double s_da = phys::dry_air_sutherland_constant;
  const double s_wv = phys::water_vapour_sutherland_constant;
  const double s_av = 0.733 * std::sqrt(s_da * s_wv);
  const double tk = ta + phys::celsius_to_kelvin;
  const double xm = 1.61 * x;

  // Mason-Saxena mixing rule
  const double alfa_av = (mu_da / mu_wv) * std::pow(wg_ratio, 0.75) * ((1.0 + s_da / tk) / (1.0 + s_wv / tk));
  const double alfa_va = (mu_wv / mu_da) * std::pow(wg_ratio, 0.75) * ((1.0 + s_wv / tk) / (1.0 + s_da / tk));
  const double beta_av = (1.0 + s_av / tk) / (1.0 + s_da / tk);
  const double beta_va = (1.0 + s_av / tk) / (1.0 + s_wv / tk);
  const double a_av = 0.25 * std::pow(1.0 + alfa_av, 2.0) * beta_av;
  const double a_va = 0.25 * std::pow(1.0 + alfa_va, 2.0) * beta_va;

  return k_da / (1.0 + a_av * xm) + k_wv / (1.0 + a_va / xm);
}

auto specific_heat(double ta, double x) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(x));
  return dry_air::specific_heat(ta) + x * water_vapour::specific_heat(ta);
}

auto specific_enthalpy(double ta, double x, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(x));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  const double h_da = dry_air::specific_enthalpy(ta);
  if (x == 0.0) {
    return h_da;
  }

  double ps = 0.0;
  PSYCHRO_TRY_ASSIGN(ps, saturation_pressure(ta));
  const double h_wv = water_vapour::specific_enthalpy(ta);

  // At or above the boiling point all moisture stays vapour
  if (ps >= pressure) {
    return h_da + h_wv * x;
  }

  const double x_max = humidity_ratio_of(100.0, ps, pressure);
  if (x <= x_max) {
    return h_da + h_wv * x;
  }

  const double surplus = x - x_max;
  return h_da + h_wv * x_max + liquid_water::specific_enthalpy(ta) * surplus + ice::specific_enthalpy(ta) * surplus;
}

auto density(double ta, double x, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(ta));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(x));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  if (x == 0.0) {
    return dry_air::density(ta, pressure);
  }
  const double tk = ta + phys::celsius_to_kelvin;
  return 1.0 / ((0.2871 * tk * (1.0 + 1.6078 * x)) / (pressure * constants::conversion::pa_to_kpa));
}

auto dry_bulb_temperature_from_dew_point(double tdp, double rh, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(tdp, "dew point temperature"));
  PSYCHRO_TRY_VOID(limits::require_relative_humidity(rh));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  if (rh == 0.0) {
    return std::numeric_limits<double>::infinity();
  }

  const double root8 = std::pow(rh / 100.0, 1.0 / 8.0);
  const double estimate = (tdp - 112.0 * root8 + 112.0) / (0.9 * root8 + 0.1);

  auto residual = [tdp, rh, pressure](double t) -> Result {
    double tdp_t = 0.0;
    PSYCHRO_TRY_ASSIGN(tdp_t, dew_point_temperature(t, rh, pressure));
    return tdp - tdp_t;
  };

  return solver::find_root(residual, estimate * seed_lower_factor, estimate * seed_upper_factor);
}

auto dry_bulb_temperature_from_humidity_ratio(double x, double rh, double pressure) -> Result {
  double ps_target = 0.0;
  PSYCHRO_TRY_ASSIGN(ps_target, saturation_pressure(x, rh, pressure));

  auto residual = [ps_target](double t) -> Result {
    double ps_t = 0.0;
    PSYCHRO_TRY_ASSIGN(ps_t, saturation_pressure(t));
    return ps_target - ps_t;
  };

  return solver::find_root(residual, constants::solver::default_point_a, constants::solver::default_point_b,
                           inverter_config);
}

auto dry_bulb_temperature_from_enthalpy(double h, double x, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_finite("specific enthalpy", h));
  PSYCHRO_TRY_VOID(limits::require_humidity_ratio(x));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  auto config = inverter_config;
  config.eval_cycles = constants::solver::enthalpy_eval_cycles;

  auto residual = [h, x, pressure](double t) -> Result {
    double h_t = 0.0;
    PSYCHRO_TRY_ASSIGN(h_t, specific_enthalpy(t, x, pressure));
    return h - h_t;
  };

  return solver::find_root(residual, constants::solver::default_point_a, constants::solver::default_point_b, config);
}

auto dry_bulb_temperature_from_wet_bulb(double wbt, double rh, double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_temperature(wbt, "wet bulb temperature"));
  PSYCHRO_TRY_VOID(limits::require_relative_humidity(rh));
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  auto residual = [wbt, rh, pressure](double t) -> Result {
    double wbt_t = 0.0;
    PSYCHRO_TRY_ASSIGN(wbt_t, wet_bulb_temperature(t, rh, pressure));
    return wbt - wbt_t;
  };

  return solver::find_root(residual, constants::solver::default_point_a, constants::solver::default_point_b);
}

auto max_dry_bulb_temperature(double pressure) -> Result {
  PSYCHRO_TRY_VOID(limits::require_pressure(pressure));

  const double log_p = std::log(0.001638 * pressure);
  const double estimate = -237300.0 * log_p / (1000.0 * log_p - 17269.0);

  auto residual = [pressure](double t) -> Result {
    double ps_t = 0.0;
    PSYCHRO_TRY_ASSIGN(ps_t, saturation_pressure(t));
    return pressure - ps_t;
  };

  return solver::find_root(residual, estimate * seed_lower_factor, estimate * seed_upper_factor * 1.5);
}

} // namespace psychro::properties::humid_air
