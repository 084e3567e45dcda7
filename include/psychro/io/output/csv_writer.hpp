#pragma once
#include "output_types.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace psychro::io::output {

// CSV-specific configuration
struct CSVConfig {
  char delimiter = ',';
  int precision = 6;
  bool include_headers = true;
  bool scientific_notation = false;
  std::string line_ending = "\n";
};

/**
 * @brief One row per case: first and second inlet, outlet, heat and coil data
 *
 * Coil-only columns stay empty for heating and mixing cases.
 */
class CSVWriter : public FormatWriter {
private:
  CSVConfig csv_config_;

  [[nodiscard]] auto format_value(double value) const -> std::string;
  [[nodiscard]] auto format_optional(const std::optional<double>& value) const -> std::string;

public:
  explicit CSVWriter(CSVConfig config = {}) : csv_config_(std::move(config)) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path,
                           const OutputDataset& dataset) const -> std::expected<void, OutputError> override;

  /// Write the table to any stream
  auto write_table(std::ostream& out, const std::vector<CaseRecord>& cases) const -> void;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".csv"; }

  [[nodiscard]] static auto header() -> std::vector<std::string>;

  [[nodiscard]] auto get_csv_config() const noexcept -> const CSVConfig& { return csv_config_; }
};

} // namespace psychro::io::output
