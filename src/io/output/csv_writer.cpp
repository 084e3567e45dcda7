#include "psychro/io/output/csv_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace psychro::io::output {

auto CSVWriter::header() -> std::vector<std::string> {
  return {"name",
          "type",
          "inlet_temperature",
          "inlet_humidity_ratio",
          "inlet_relative_humidity",
          "inlet_specific_enthalpy",
          "inlet_dry_air_mass_flow",
          "second_temperature",
          "second_humidity_ratio",
          "second_dry_air_mass_flow",
          "outlet_temperature",
          "outlet_humidity_ratio",
          "outlet_relative_humidity",
          "outlet_specific_enthalpy",
          "outlet_dry_air_mass_flow",
          "heat_of_process",
          "condensate_mass_flow",
          "condensate_temperature",
          "bypass_factor",
          "coolant_mass_flow"};
}

auto CSVWriter::write(const std::filesystem::path& file_path,
                      const OutputDataset& dataset) const -> std::expected<void, OutputError> {

  try {
    if (file_path.has_parent_path()) {
      std::filesystem::create_directories(file_path.parent_path());
    }

    std::ofstream file(file_path);
    if (!file.is_open()) {
      return std::unexpected(FileWriteError(file_path, "Cannot open file for writing"));
    }

    if (csv_config_.include_headers) {
      file << "# psychro " << dataset.metadata.psychro_version << csv_config_.line_ending;
      if (!dataset.metadata.case_file.empty()) {
        file << "# case file: " << dataset.metadata.case_file << csv_config_.line_ending;
      }
    }

    write_table(file, dataset.cases);

    if (!file) {
      return std::unexpected(FileWriteError(file_path, "Write failed"));
    }
    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("CSV write failed: {}", e.what())));
  }
}

auto CSVWriter::write_table(std::ostream& out, const std::vector<CaseRecord>& cases) const -> void {

  if (csv_config_.include_headers) {
    const auto headers = header();
    for (std::size_t i = 0; i < headers.size(); ++i) {
      if (i > 0)
        out << csv_config_.delimiter;
      out << headers[i];
    }
    out << csv_config_.line_ending;
  }

  const char d = csv_config_.delimiter;
  for (const auto& record : cases) {
    out << record.name << d << to_string(record.type);

    if (!record.inlets.empty()) {
      const auto& inlet = record.inlets.front();
      out << d << format_value(inlet.temperature) << d << format_value(inlet.humidity_ratio) << d
          << format_value(inlet.relative_humidity) << d << format_value(inlet.specific_enthalpy) << d
          << format_value(inlet.dry_air_mass_flow);
    } else {
      out << d << d << d << d << d;
    }

    if (record.inlets.size() > 1) {
      const auto& second = record.inlets[1];
      out << d << format_value(second.temperature) << d << format_value(second.humidity_ratio) << d
          << format_value(second.dry_air_mass_flow);
    } else {
      out << d << d << d;
    }

    const auto& outlet = record.outlet;
    out << d << format_value(outlet.temperature) << d << format_value(outlet.humidity_ratio) << d
        << format_value(outlet.relative_humidity) << d << format_value(outlet.specific_enthalpy) << d
        << format_value(outlet.dry_air_mass_flow);

    out << d << format_value(record.heat_of_process) << d << format_optional(record.condensate_mass_flow) << d
        << format_optional(record.condensate_temperature) << d << format_optional(record.bypass_factor) << d
        << format_optional(record.coolant_mass_flow);

    out << csv_config_.line_ending;
  }
}

auto CSVWriter::format_value(double value) const -> std::string {
  std::ostringstream oss;
  if (csv_config_.scientific_notation) {
    oss << std::scientific;
  } else {
    oss << std::fixed;
  }
  oss << std::setprecision(csv_config_.precision) << value;
  return oss.str();
}

auto CSVWriter::format_optional(const std::optional<double>& value) const -> std::string {
  return value ? format_value(*value) : std::string{};
}

} // namespace psychro::io::output
