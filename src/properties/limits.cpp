#include "psychro/properties/limits.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/core/expected_utils.hpp"
#include <cmath>
#include <format>

namespace psychro::properties::limits {

auto require_finite(std::string_view quantity, double value) -> std::expected<void, core::CalculationError> {
  if (!std::isfinite(value)) {
    return std::unexpected(core::InvalidArgumentError(quantity, value, "finite value"));
  }
  return {};
}

auto require_non_negative(std::string_view quantity, double value) -> std::expected<void, core::CalculationError> {
  PSYCHRO_TRY_VOID(require_finite(quantity, value));
  if (value < 0.0) {
    return std::unexpected(core::InvalidArgumentError(quantity, value, ">= 0"));
  }
  return {};
}

auto require_in_range(std::string_view quantity, double value, double min, double max)
    -> std::expected<void, core::CalculationError> {
  PSYCHRO_TRY_VOID(require_finite(quantity, value));
  if (value < min || value > max) {
    return std::unexpected(core::InvalidArgumentError(quantity, value, std::format("[{}, {}]", min, max)));
  }
  return {};
}

auto require_pressure(double pressure) -> std::expected<void, core::CalculationError> {
  PSYCHRO_TRY_VOID(require_finite("pressure", pressure));
  if (pressure < constants::limits::min_pressure) {
    return std::unexpected(
        core::InvalidArgumentError("pressure", pressure, std::format(">= {} Pa", constants::limits::min_pressure)));
  }
  return {};
}

auto require_temperature(double temperature, std::string_view quantity)
    -> std::expected<void, core::CalculationError> {
  PSYCHRO_TRY_VOID(require_finite(quantity, temperature));
  if (temperature < constants::limits::min_temperature) {
    return std::unexpected(core::InvalidArgumentError(
        quantity, temperature, std::format(">= {} °C", constants::limits::min_temperature)));
  }
  return {};
}

auto require_saturation_temperature(double temperature) -> std::expected<void, core::CalculationError> {
  PSYCHRO_TRY_VOID(require_finite("temperature", temperature));
  if (temperature < constants::limits::min_saturation_temperature) {
    return std::unexpected(core::InvalidArgumentError(
        "temperature", temperature,
        std::format(">= {} °C for saturation pressure", constants::limits::min_saturation_temperature)));
  }
  return {};
}

auto require_relative_humidity(double relative_humidity) -> std::expected<void, core::CalculationError> {
  return require_in_range("relative humidity", relative_humidity, constants::limits::min_relative_humidity,
                          constants::limits::max_relative_humidity);
}

auto require_humidity_ratio(double humidity_ratio) -> std::expected<void, core::CalculationError> {
  return require_non_negative("humidity ratio", humidity_ratio);
}

} // namespace psychro::properties::limits
