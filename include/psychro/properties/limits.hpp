#pragma once
#include "psychro/core/exceptions.hpp"
#include <expected>
#include <string_view>

namespace psychro::properties::limits {

// Validators run before any residual is built; they only reject physically
// meaningless inputs.

[[nodiscard]] auto require_finite(std::string_view quantity, double value)
    -> std::expected<void, core::CalculationError>;

[[nodiscard]] auto require_non_negative(std::string_view quantity, double value)
    -> std::expected<void, core::CalculationError>;

[[nodiscard]] auto require_in_range(std::string_view quantity, double value, double min, double max)
    -> std::expected<void, core::CalculationError>;

/// Absolute pressure not below 50 kPa
[[nodiscard]] auto require_pressure(double pressure) -> std::expected<void, core::CalculationError>;

/// Finite temperature not below -260 °C
[[nodiscard]] auto require_temperature(double temperature, std::string_view quantity = "temperature")
    -> std::expected<void, core::CalculationError>;

/// Temperature inside the validity range of the saturation pressure correlation
[[nodiscard]] auto require_saturation_temperature(double temperature) -> std::expected<void, core::CalculationError>;

[[nodiscard]] auto require_relative_humidity(double relative_humidity) -> std::expected<void, core::CalculationError>;

[[nodiscard]] auto require_humidity_ratio(double humidity_ratio) -> std::expected<void, core::CalculationError>;

} // namespace psychro::properties::limits
