#pragma once

#include <cstddef>

namespace psychro::constants {

// ================================================================================================
// FUNDAMENTAL PHYSICAL CONSTANTS
// ================================================================================================

namespace physical {
/// Offset between Celsius and Kelvin scales [K]
inline constexpr double celsius_to_kelvin = 273.15;

/// Dry air molecular mass [kg/kmol]
inline constexpr double dry_air_molecular_mass = 28.96546;

/// Dry air specific gas constant [J/(kg·K)]
inline constexpr double dry_air_gas_constant = 287.055;

/// Dry air Sutherland constant [K]
inline constexpr double dry_air_sutherland_constant = 111.0;

/// Water vapour molecular mass [kg/kmol]
inline constexpr double water_vapour_molecular_mass = 18.01528;

/// Water vapour specific gas constant [J/(kg·K)]
inline constexpr double water_vapour_gas_constant = 461.52;

/// Water vapour Sutherland constant [K]
inline constexpr double water_vapour_sutherland_constant = 961.0;

/// Ratio of water vapour to dry air molecular mass [-]
inline constexpr double molecular_mass_ratio = water_vapour_molecular_mass / dry_air_molecular_mass;

/// Heat of water vaporization at 0 °C [kJ/kg]
inline constexpr double heat_of_vaporization = 2500.9;

/// Heat of ice melt [kJ/kg]
inline constexpr double heat_of_ice_melt = 334.1;
}  // namespace physical

// ================================================================================================
// PHYSICAL LIMITS OF INPUT QUANTITIES
// ================================================================================================

namespace limits {
/// Lowest accepted absolute pressure [Pa]
inline constexpr double min_pressure = 50000.0;

/// Lowest accepted temperature [°C]
inline constexpr double min_temperature = -260.0;

/// Lowest temperature for the saturation pressure correlation [°C]
inline constexpr double min_saturation_temperature = -130.0;

/// Relative humidity bounds [%]
inline constexpr double min_relative_humidity = 0.0;
inline constexpr double max_relative_humidity = 100.0;

/// Highest relative humidity reachable by a coil or heater target [%]
inline constexpr double max_process_relative_humidity = 98.0;

/// Coolant temperature bounds [°C]
inline constexpr double min_coolant_temperature = 0.0;
inline constexpr double max_coolant_temperature = 90.0;

/// Fraction of the boiling temperature used as heating outlet limit [-]
inline constexpr double heating_temperature_margin = 0.98;
}  // namespace limits

// ================================================================================================
// ROOT SOLVER DEFAULTS
// ================================================================================================

namespace solver {
/// Default bracket endpoints
inline constexpr double default_point_a = -50.0;
inline constexpr double default_point_b = 50.0;

/// Default absolute tolerance
inline constexpr double tolerance = 1e-5;

/// Tolerance for dew point iterations at very low humidity
inline constexpr double fine_tolerance = 1e-7;

/// Default iteration limit
inline constexpr int max_iterations = 100;

/// Default number of bracket evaluation cycles
inline constexpr int eval_cycles = 2;

/// Default second point and target divisors of the bracket evaluator
inline constexpr int p2_divisor = 2;
inline constexpr int p3_divisor = 2;

/// Divisors used by the property inverters
inline constexpr int inverter_p3_divisor = 5;

/// Evaluation cycles for the enthalpy inverter
inline constexpr int enthalpy_eval_cycles = 30;

/// Multipliers applied to a seed estimate to build a bracket
inline constexpr double seed_lower_factor = 0.8;
inline constexpr double seed_upper_factor = 1.01;
}  // namespace solver

// ================================================================================================
// EMPIRICAL CORRELATION COEFFICIENTS
// ================================================================================================

namespace arden_buck {
/// Coefficients above 0 °C
namespace water {
inline constexpr double b = 18.678;
inline constexpr double c = 257.14;
inline constexpr double d = 234.50;
inline constexpr double a = 6.1121;
}  // namespace water

/// Coefficients at or below 0 °C
namespace ice {
inline constexpr double b = 23.036;
inline constexpr double c = 279.82;
inline constexpr double d = 333.70;
inline constexpr double a = 6.1115;
}  // namespace ice
}  // namespace arden_buck

/// ASHRAE saturation pressure correlation (Hyland-Wexler)
namespace hyland_wexler {
inline constexpr double c1 = -5.6745359E+03;
inline constexpr double c2 = 6.3925247E+00;
inline constexpr double c3 = -9.6778430E-03;
inline constexpr double c4 = 6.2215701E-07;
inline constexpr double c5 = 2.0747825E-09;
inline constexpr double c6 = -9.4840240E-13;
inline constexpr double c7 = 4.1635019E+00;
inline constexpr double c8 = -5.8002206E+03;
inline constexpr double c9 = 1.3914993E+00;
inline constexpr double c10 = -4.8640239E-02;
inline constexpr double c11 = 4.1764768E-05;
inline constexpr double c12 = -1.4452093E-08;
inline constexpr double c13 = 6.5459673E+00;

/// Upper bracket widening above 50 °C
inline constexpr double high_temperature_threshold = 50.0;
inline constexpr double high_temperature_factor = 1.1;
}  // namespace hyland_wexler

// ================================================================================================
// DEFAULT CASE PARAMETERS
// ================================================================================================

namespace defaults {
/// Default absolute pressure of a case [Pa]
inline constexpr double pressure = 101325.0;

/// Default chart grid
namespace chart {
inline constexpr double temperature_min = -20.0;
inline constexpr double temperature_max = 50.0;
inline constexpr int temperature_points = 71;
}  // namespace chart
}  // namespace defaults

// ================================================================================================
// FILE I/O AND FORMATTING CONSTANTS
// ================================================================================================

namespace io {
/// HDF5 default compression level (0-9, higher = better compression)
inline constexpr int default_hdf5_compression = 6;

/// Default HDF5 chunk size for datasets
inline constexpr std::size_t default_hdf5_chunk_size = 1024;

/// Bytes to KB conversion factor
inline constexpr double bytes_to_kb = 1024.0;

/// Invalid HDF5 handle value
inline constexpr int invalid_hdf5_handle = -1;

/// Default version string written to result files
inline constexpr const char* default_psychro_version = "1.0.0";
}  // namespace io

// ================================================================================================
// STRING PROCESSING CONSTANTS
// ================================================================================================

namespace string_processing {
/// Format precision for floating point display
inline constexpr int float_precision_2 = 2;
inline constexpr int float_precision_3 = 3;
inline constexpr int float_precision_6 = 6;

/// Field widths for tabular output
inline constexpr int wide_field_width = 12;
inline constexpr int separator_width = 60;

/// ANSI terminal colors
namespace colors {
inline constexpr const char* green = "\033[32m";
inline constexpr const char* yellow = "\033[33m";
inline constexpr const char* red = "\033[31m";
inline constexpr const char* cyan = "\033[36m";
inline constexpr const char* reset = "\033[0m";
}  // namespace colors
}  // namespace string_processing

// ================================================================================================
// UNIT CONVERSION FACTORS
// ================================================================================================

namespace conversion {
/// Kilowatts to watts
inline constexpr double kw_to_w = 1000.0;

/// Pascals to kilopascals
inline constexpr double pa_to_kpa = 1.0 / 1000.0;
}  // namespace conversion

// ================================================================================================
// APPLICATION CONSTANTS
// ================================================================================================

namespace application {
inline constexpr int exit_success = 0;
inline constexpr int exit_failure = 1;

/// Minimum argc: program name and configuration file
inline constexpr int min_required_args = 2;
inline constexpr int config_file_arg_index = 1;
inline constexpr int output_name_arg_index = 2;
}  // namespace application

}  // namespace psychro::constants
