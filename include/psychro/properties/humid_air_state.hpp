#pragma once
#include "psychro/core/exceptions.hpp"
#include <expected>

namespace psychro::properties {

/**
 * @brief Immutable thermodynamic state of humid air
 *
 * Only the validating factories create instances; every derived property is
 * computed once at construction.
 */
class HumidAir {
private:
  double pressure_;
  double temperature_;
  double humidity_ratio_;
  double relative_humidity_;
  double saturation_pressure_;
  double dew_point_temperature_;
  double specific_enthalpy_;
  double density_;

  HumidAir(double pressure, double temperature, double humidity_ratio, double relative_humidity,
           double saturation_pressure, double dew_point_temperature, double specific_enthalpy, double density) noexcept
      : pressure_(pressure), temperature_(temperature), humidity_ratio_(humidity_ratio),
        relative_humidity_(relative_humidity), saturation_pressure_(saturation_pressure),
        dew_point_temperature_(dew_point_temperature), specific_enthalpy_(specific_enthalpy), density_(density) {}

public:
  [[nodiscard]] static auto from_relative_humidity(double pressure, double temperature, double relative_humidity)
      -> std::expected<HumidAir, core::CalculationError>;

  [[nodiscard]] static auto from_humidity_ratio(double pressure, double temperature, double humidity_ratio)
      -> std::expected<HumidAir, core::CalculationError>;

  [[nodiscard]] auto pressure() const noexcept -> double { return pressure_; }
  [[nodiscard]] auto temperature() const noexcept -> double { return temperature_; }
  [[nodiscard]] auto humidity_ratio() const noexcept -> double { return humidity_ratio_; }
  [[nodiscard]] auto relative_humidity() const noexcept -> double { return relative_humidity_; }
  [[nodiscard]] auto saturation_pressure() const noexcept -> double { return saturation_pressure_; }
  [[nodiscard]] auto dew_point_temperature() const noexcept -> double { return dew_point_temperature_; }
  [[nodiscard]] auto specific_enthalpy() const noexcept -> double { return specific_enthalpy_; }
  [[nodiscard]] auto density() const noexcept -> double { return density_; }

  /// Iterative, so computed on request
  [[nodiscard]] auto wet_bulb_temperature() const -> std::expected<double, core::CalculationError>;
};

/**
 * @brief Humid air state moving at a given dry-air mass flow [kg/s]
 */
class HumidAirFlow {
private:
  HumidAir air_;
  double dry_air_mass_flow_;

  HumidAirFlow(HumidAir air, double dry_air_mass_flow) noexcept : air_(air), dry_air_mass_flow_(dry_air_mass_flow) {}

public:
  [[nodiscard]] static auto of(const HumidAir& air, double dry_air_mass_flow)
      -> std::expected<HumidAirFlow, core::CalculationError>;

  [[nodiscard]] auto air() const noexcept -> const HumidAir& { return air_; }
  [[nodiscard]] auto dry_air_mass_flow() const noexcept -> double { return dry_air_mass_flow_; }

  /// Dry air plus the moisture it carries
  [[nodiscard]] auto humid_air_mass_flow() const noexcept -> double {
    return dry_air_mass_flow_ * (1.0 + air_.humidity_ratio());
  }

  /// [m³/s]
  [[nodiscard]] auto volumetric_flow() const noexcept -> double { return humid_air_mass_flow() / air_.density(); }

  [[nodiscard]] auto pressure() const noexcept -> double { return air_.pressure(); }
  [[nodiscard]] auto temperature() const noexcept -> double { return air_.temperature(); }
  [[nodiscard]] auto humidity_ratio() const noexcept -> double { return air_.humidity_ratio(); }
  [[nodiscard]] auto relative_humidity() const noexcept -> double { return air_.relative_humidity(); }
  [[nodiscard]] auto specific_enthalpy() const noexcept -> double { return air_.specific_enthalpy(); }
};

} // namespace psychro::properties
