#pragma once
#include "output_types.hpp"
#include <expected>
#include <memory>

namespace psychro::io::output {

// Factory for creating format-specific writers
class WriterFactory {
public:
  [[nodiscard]] static auto create_writer(OutputConfig::Format format) -> std::unique_ptr<FormatWriter>;
};

/**
 * @brief Writes one dataset in every format selected in the output configuration
 *
 * Files are named <directory>/<case_name>_<timestamp><extension>.
 */
class OutputWriter {
private:
  OutputConfig config_;
  std::vector<std::unique_ptr<FormatWriter>> writers_;

  [[nodiscard]] auto generate_file_paths(const std::chrono::system_clock::time_point& timestamp) const
      -> std::vector<std::filesystem::path>;

public:
  explicit OutputWriter(OutputConfig config);

  [[nodiscard]] auto write(const OutputDataset& dataset) -> std::expected<std::vector<std::filesystem::path>, OutputError>;
};

} // namespace psychro::io::output
