#pragma once
#include "../io/chart_generator.hpp"
#include "../io/config_types.hpp"
#include "../io/output/output_writer.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace psychro::core {

class OutputManager {
public:
  // Initialize output system; a non-empty output name replaces the configured case name
  [[nodiscard]] auto initialize_output_system(const io::Configuration& config, const std::string& output_name)
      -> std::expected<void, ApplicationError>;

  // Write case records in every configured format
  [[nodiscard]] auto write_case_results(const std::vector<io::output::CaseRecord>& records,
                                        const io::Configuration& config, const std::filesystem::path& config_file,
                                        PerformanceMetrics& metrics)
      -> std::expected<std::vector<std::filesystem::path>, ApplicationError>;

  // Write chart tables to <directory>/<case_name>_chart.h5
  [[nodiscard]] auto write_chart(const io::ChartConfig& chart_config, const io::ChartGenerator::Result& chart,
                                 PerformanceMetrics& metrics) -> std::expected<std::filesystem::path, ApplicationError>;

  // Display written files with their sizes
  auto display_output_files(const PerformanceMetrics& metrics) const -> void;

private:
  io::OutputConfig output_config_;
  std::unique_ptr<io::output::OutputWriter> output_writer_;

  // Initialize HDF5 system
  [[nodiscard]] auto initialize_hdf5() -> std::expected<void, ApplicationError>;
};

} // namespace psychro::core
