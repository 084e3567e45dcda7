#include "psychro/io/chart_generator.hpp"
#include "psychro/core/expected_utils.hpp"
#include "psychro/io/output/hdf5_writer.hpp"
#include "psychro/properties/humid_air.hpp"
#include "psychro/properties/limits.hpp"

namespace psychro::io {

namespace humid_air = properties::humid_air;

auto ChartGenerator::temperature_grid() const -> std::vector<double> {
  const int n = config_.temperature_points;
  std::vector<double> temperatures(n);
  const double step = (config_.temperature_max - config_.temperature_min) / (n - 1);
  for (int i = 0; i < n; ++i) {
    temperatures[i] = config_.temperature_min + i * step;
  }
  return temperatures;
}

auto ChartGenerator::generate() const -> std::expected<Result, core::CalculationError> {

  PSYCHRO_TRY_VOID(properties::limits::require_pressure(config_.pressure));

  Result result;
  result.pressure = config_.pressure;
  result.temperatures = temperature_grid();
  result.relative_humidities = config_.relative_humidities;

  const double p = config_.pressure;
  const std::size_t n_t = result.temperatures.size();
  const std::size_t n_rh = result.relative_humidities.size();

  std::vector<std::expected<double, core::CalculationError>> saturation;
  saturation.reserve(n_t);
  for (const double t : result.temperatures) {
    saturation.push_back(humid_air::saturation_pressure(t));
  }
  PSYCHRO_TRY_ASSIGN(result.saturation_pressures, core::expected_utils::collect_all(std::move(saturation)));

  std::vector<std::expected<double, core::CalculationError>> saturation_x;
  saturation_x.reserve(n_t);
  for (const double ps : result.saturation_pressures) {
    saturation_x.push_back(humid_air::max_humidity_ratio(ps, p));
  }
  PSYCHRO_TRY_ASSIGN(result.saturation_humidity_ratios, core::expected_utils::collect_all(std::move(saturation_x)));

  result.humidity_ratios = core::Matrix<double>(n_rh, n_t);
  result.specific_enthalpies = core::Matrix<double>(n_rh, n_t);
  result.dew_point_temperatures = core::Matrix<double>(n_rh, n_t);
  result.wet_bulb_temperatures = core::Matrix<double>(n_rh, n_t);

  for (std::size_t i = 0; i < n_rh; ++i) {
    const double rh = result.relative_humidities[i];
    for (std::size_t j = 0; j < n_t; ++j) {
      const double t = result.temperatures[j];
      const auto context = std::format("chart point t = {} degC, RH = {} %", t, rh);

      double x = 0.0;
      PSYCHRO_TRY_ASSIGN(x, core::expected_utils::with_context(
                                humid_air::humidity_ratio(rh, result.saturation_pressures[j], p), context));
      result.humidity_ratios(i, j) = x;

      PSYCHRO_TRY_ASSIGN(result.specific_enthalpies(i, j),
                         core::expected_utils::with_context(humid_air::specific_enthalpy(t, x, p), context));
      PSYCHRO_TRY_ASSIGN(result.dew_point_temperatures(i, j),
                         core::expected_utils::with_context(humid_air::dew_point_temperature(t, rh, p), context));
      PSYCHRO_TRY_ASSIGN(result.wet_bulb_temperatures(i, j),
                         core::expected_utils::with_context(humid_air::wet_bulb_temperature(t, rh, p), context));
    }
  }

  return result;
}

auto ChartGenerator::save_results(const Result& results, const std::filesystem::path& output_path) const
    -> std::expected<void, output::OutputError> {

  try {
    if (output_path.has_parent_path()) {
      std::filesystem::create_directories(output_path.parent_path());
    }

    output::HDF5Writer writer;

    auto file_result = writer.create_file(output_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    auto group_result = writer.create_group(file, "chart");
    if (!group_result) {
      return std::unexpected(group_result.error());
    }
    auto group = std::move(group_result.value());

    if (auto r = writer.write_scalar(group, "pressure", results.pressure, "Pa"); !r)
      return std::unexpected(r.error());
    if (auto r = writer.write_vector(group, "temperatures", results.temperatures, "degC", "Dry-bulb temperature grid");
        !r)
      return std::unexpected(r.error());
    if (auto r = writer.write_vector(group, "relative_humidities", results.relative_humidities, "%"); !r)
      return std::unexpected(r.error());
    if (auto r = writer.write_vector(group, "saturation_pressures", results.saturation_pressures, "Pa"); !r)
      return std::unexpected(r.error());
    if (auto r = writer.write_vector(group, "saturation_humidity_ratios", results.saturation_humidity_ratios,
                                     "kg/kg");
        !r)
      return std::unexpected(r.error());
    if (auto r = writer.write_matrix(group, "humidity_ratios", results.humidity_ratios, "kg/kg",
                                     "Rows: relative humidity, columns: temperature");
        !r)
      return std::unexpected(r.error());
    if (auto r = writer.write_matrix(group, "specific_enthalpies", results.specific_enthalpies, "kJ/kg"); !r)
      return std::unexpected(r.error());
    if (auto r = writer.write_matrix(group, "dew_point_temperatures", results.dew_point_temperatures, "degC"); !r)
      return std::unexpected(r.error());
    if (auto r = writer.write_matrix(group, "wet_bulb_temperatures", results.wet_bulb_temperatures, "degC"); !r)
      return std::unexpected(r.error());

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(output::OutputError(std::format("Chart save failed: {}", e.what())));
  }
}

} // namespace psychro::io
