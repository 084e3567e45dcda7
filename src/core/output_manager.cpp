#include "psychro/core/output_manager.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/io/output/hdf5_writer.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

namespace psychro::core {

auto OutputManager::initialize_output_system(const io::Configuration& config, const std::string& output_name)
    -> std::expected<void, ApplicationError> {

  std::cout << "\nInitializing output system..." << std::endl;

  if (auto hdf5_init = initialize_hdf5(); !hdf5_init) {
    return std::unexpected(hdf5_init.error());
  }

  output_config_ = config.output;
  if (!output_name.empty()) {
    output_config_.case_name = output_name;
  }
  output_writer_ = std::make_unique<io::output::OutputWriter>(output_config_);

  std::cout << constants::string_processing::colors::green << "✓ Output system configured ("
            << output_config_.directory << "/" << output_config_.case_name << "_*)"
            << constants::string_processing::colors::reset << std::endl;

  return {};
}

auto OutputManager::write_case_results(const std::vector<io::output::CaseRecord>& records,
                                       const io::Configuration& config, const std::filesystem::path& config_file,
                                       PerformanceMetrics& metrics)
    -> std::expected<std::vector<std::filesystem::path>, ApplicationError> {

  std::cout << "\n=== WRITING OUTPUT FILES ===" << std::endl;

  if (!output_writer_) {
    return std::unexpected(
        ApplicationError{"Output system is not initialized", constants::application::exit_failure});
  }

  io::output::OutputDataset dataset;
  dataset.metadata.case_file = config_file.string();
  dataset.metadata.solver = config.solver;
  dataset.cases = records;

  auto output_start = std::chrono::high_resolution_clock::now();
  auto output_result = output_writer_->write(dataset);
  auto output_end = std::chrono::high_resolution_clock::now();

  metrics.output_time += std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);

  if (!output_result) {
    return std::unexpected(ApplicationError{"Output writing failed: " + output_result.error().message(),
                                            constants::application::exit_failure});
  }

  for (const auto& path : output_result.value()) {
    std::cout << "✓ Wrote " << path.string() << std::endl;
    metrics.output_files.push_back(path);
  }

  return std::move(output_result.value());
}

auto OutputManager::write_chart(const io::ChartConfig& chart_config, const io::ChartGenerator::Result& chart,
                                PerformanceMetrics& metrics) -> std::expected<std::filesystem::path, ApplicationError> {

  const auto path = std::filesystem::path(output_config_.directory) / (output_config_.case_name + "_chart.h5");

  io::ChartGenerator generator(chart_config);

  auto output_start = std::chrono::high_resolution_clock::now();
  auto save_result = generator.save_results(chart, path);
  auto output_end = std::chrono::high_resolution_clock::now();

  metrics.output_time += std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);

  if (!save_result) {
    return std::unexpected(ApplicationError{"Failed to save chart: " + save_result.error().message(),
                                            constants::application::exit_failure});
  }

  std::cout << "✓ Wrote " << path.string() << std::endl;
  metrics.output_files.push_back(path);
  return path;
}

auto OutputManager::display_output_files(const PerformanceMetrics& metrics) const -> void {
  if (metrics.output_files.empty()) {
    return;
  }

  std::cout << "\nOutput files:" << std::endl;
  for (const auto& file : metrics.output_files) {
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(file, ec);
    std::cout << "  " << file.filename().string();
    if (!ec) {
      std::cout << " (" << std::setprecision(constants::string_processing::float_precision_2) << std::fixed
                << (file_size / constants::io::bytes_to_kb) << " KB)" << std::defaultfloat;
    }
    std::cout << std::endl;
  }
}

auto OutputManager::initialize_hdf5() -> std::expected<void, ApplicationError> {
  if (auto init = io::output::hdf5::initialize(); !init) {
    return std::unexpected(ApplicationError{"HDF5 initialization failed: " + init.error().message(),
                                            constants::application::exit_failure});
  }
  return {};
}

} // namespace psychro::core
