#pragma once
#include "../../core/constants.hpp"
#include "../../core/exceptions.hpp"
#include "../../properties/humid_air_state.hpp"
#include "../config_types.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace psychro::io::output {

// State and flow of one stream as written to result files
struct StreamRecord {
  double pressure = 0.0;
  double temperature = 0.0;
  double humidity_ratio = 0.0;
  double relative_humidity = 0.0;
  double specific_enthalpy = 0.0;
  double dew_point_temperature = 0.0;
  double dry_air_mass_flow = 0.0;
  double humid_air_mass_flow = 0.0;
  double volumetric_flow = 0.0;
};

[[nodiscard]] auto to_stream_record(const properties::HumidAirFlow& flow) noexcept -> StreamRecord;

// Result of one process case
struct CaseRecord {
  std::string name;
  CaseConfig::Type type = CaseConfig::Type::HeatingTemperature;
  std::vector<StreamRecord> inlets;
  StreamRecord outlet;
  double heat_of_process = 0.0; // [W]

  // Cooling coil only
  std::optional<double> condensate_mass_flow;
  std::optional<double> condensate_temperature;
  std::optional<double> bypass_factor;
  std::optional<double> coolant_mass_flow;
};

struct ResultMetadata {
  std::string psychro_version = constants::io::default_psychro_version;
  std::chrono::system_clock::time_point creation_time = std::chrono::system_clock::now();
  std::string case_file;
  SolverSettings solver;
};

struct OutputDataset {
  ResultMetadata metadata;
  std::vector<CaseRecord> cases;
};

// Output error types
class OutputError : public core::PsychroException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : PsychroException(std::format("Output Error: {}", message), location) {}
};

class FileWriteError : public OutputError {
private:
  std::filesystem::path file_path_;

public:
  explicit FileWriteError(const std::filesystem::path& path, std::string_view message,
                          std::source_location location = std::source_location::current())
      : OutputError(std::format("File '{}': {}", path.string(), message), location), file_path_(path) {}

  [[nodiscard]] auto file_path() const noexcept -> const std::filesystem::path& { return file_path_; }
};

// Abstract base class for format-specific writers
class FormatWriter {
public:
  virtual ~FormatWriter() = default;

  [[nodiscard]] virtual auto write(const std::filesystem::path& file_path,
                                   const OutputDataset& dataset) const -> std::expected<void, OutputError> = 0;

  [[nodiscard]] virtual auto get_extension() const noexcept -> std::string_view = 0;
};

} // namespace psychro::io::output
