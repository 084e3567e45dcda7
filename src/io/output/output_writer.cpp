#include "psychro/io/output/output_writer.hpp"
#include "psychro/io/output/csv_writer.hpp"
#include "psychro/io/output/hdf5_writer.hpp"
#include <iomanip>
#include <sstream>

namespace psychro::io::output {

auto to_stream_record(const properties::HumidAirFlow& flow) noexcept -> StreamRecord {
  return StreamRecord{.pressure = flow.pressure(),
                      .temperature = flow.temperature(),
                      .humidity_ratio = flow.humidity_ratio(),
                      .relative_humidity = flow.relative_humidity(),
                      .specific_enthalpy = flow.specific_enthalpy(),
                      .dew_point_temperature = flow.air().dew_point_temperature(),
                      .dry_air_mass_flow = flow.dry_air_mass_flow(),
                      .humid_air_mass_flow = flow.humid_air_mass_flow(),
                      .volumetric_flow = flow.volumetric_flow()};
}

auto WriterFactory::create_writer(OutputConfig::Format format) -> std::unique_ptr<FormatWriter> {
  switch (format) {
  case OutputConfig::Format::CSV:
    return std::make_unique<CSVWriter>();
  case OutputConfig::Format::HDF5:
    return std::make_unique<HDF5Writer>();
  }
  return nullptr;
}

OutputWriter::OutputWriter(OutputConfig config) : config_(std::move(config)) {
  for (auto format : config_.formats) {
    if (auto writer = WriterFactory::create_writer(format)) {
      writers_.push_back(std::move(writer));
    }
  }
}

auto OutputWriter::write(const OutputDataset& dataset)
    -> std::expected<std::vector<std::filesystem::path>, OutputError> {

  auto file_paths = generate_file_paths(dataset.metadata.creation_time);

  try {
    std::filesystem::create_directories(config_.directory);
  } catch (const std::filesystem::filesystem_error& e) {
    return std::unexpected(FileWriteError(config_.directory, std::format("cannot create directory: {}", e.what())));
  }

  std::vector<std::filesystem::path> written_files;
  written_files.reserve(writers_.size());

  for (std::size_t i = 0; i < writers_.size(); ++i) {
    if (auto result = writers_[i]->write(file_paths[i], dataset); !result) {
      return std::unexpected(result.error());
    }
    written_files.push_back(file_paths[i]);
  }

  return written_files;
}

auto OutputWriter::generate_file_paths(const std::chrono::system_clock::time_point& timestamp) const
    -> std::vector<std::filesystem::path> {

  std::vector<std::filesystem::path> paths;
  paths.reserve(writers_.size());

  auto time_t = std::chrono::system_clock::to_time_t(timestamp);
  auto tm = *std::localtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
  const auto timestamp_str = "_" + oss.str();

  for (const auto& writer : writers_) {
    auto filename = config_.case_name + timestamp_str + std::string(writer->get_extension());
    paths.push_back(std::filesystem::path(config_.directory) / filename);
  }

  return paths;
}

} // namespace psychro::io::output
