#pragma once

#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include "output/output_types.hpp"
#include <expected>
#include <filesystem>
#include <vector>

namespace psychro::io {

/**
 * @brief Psychrometric chart tables over a temperature x relative humidity grid at one pressure
 */
class ChartGenerator {
public:
  struct Result {
    double pressure = 0.0;
    std::vector<double> temperatures;
    std::vector<double> relative_humidities;
    std::vector<double> saturation_pressures;      // [n_temperatures]
    std::vector<double> saturation_humidity_ratios; // [n_temperatures]
    core::Matrix<double> humidity_ratios;           // [n_rh x n_temperatures]
    core::Matrix<double> specific_enthalpies;       // [n_rh x n_temperatures]
    core::Matrix<double> dew_point_temperatures;    // [n_rh x n_temperatures]
    core::Matrix<double> wet_bulb_temperatures;     // [n_rh x n_temperatures]
  };

  explicit ChartGenerator(const ChartConfig& config) : config_(config) {}

  [[nodiscard]] auto generate() const -> std::expected<Result, core::CalculationError>;

  [[nodiscard]] auto save_results(const Result& results, const std::filesystem::path& output_path) const
      -> std::expected<void, output::OutputError>;

private:
  const ChartConfig& config_;

  [[nodiscard]] auto temperature_grid() const -> std::vector<double>;
};

} // namespace psychro::io
