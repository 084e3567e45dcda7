#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <concepts>
#include <expected>
#include <format>
#include <string>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace psychro::io {

class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  template <typename T>
  [[nodiscard]] auto extract_optional(const YAML::Node& node, std::string_view key,
                                      T fallback) const -> std::expected<T, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_solver_config(const YAML::Node& node) const -> std::expected<SolverSettings, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_output_config(const YAML::Node& node) const -> std::expected<OutputConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_case_config(const YAML::Node& node) const -> std::expected<CaseConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_flow_config(const YAML::Node& node) const -> std::expected<FlowConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_coolant_config(const YAML::Node& node) const -> std::expected<CoolantConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_chart_config(const YAML::Node& node) const -> std::expected<ChartConfig, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  /// Parse YAML text directly instead of a file
  [[nodiscard]] auto load_from_string(std::string_view content) -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<Configuration, core::ConfigurationError>;
};

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(std::format("Required field '{}' is missing", key)));
    }

    if constexpr (std::same_as<T, std::vector<double>>) {
      auto sequence = node[std::string(key)];
      std::vector<double> result;
      result.reserve(sequence.size());

      for (const auto& item : sequence) {
        result.push_back(item.as<double>());
      }
      return result;
    } else {
      return node[std::string(key)].as<T>();
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename T>
auto YamlParser::extract_optional(const YAML::Node& node, std::string_view key,
                                  T fallback) const -> std::expected<T, core::ConfigurationError> {
  if (!node || !node[std::string(key)]) {
    return fallback;
  }
  return extract_value<T>(node, key);
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }

  auto str_value = str_result.value();
  std::ranges::transform(str_value, str_value.begin(), ::tolower);

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::string valid_options;
    for (const auto& [option, _] : mapping) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", str_value, key, valid_options)));
  }

  return it->second;
}

// Enum mappings
namespace enum_mappings {

inline const std::unordered_map<std::string, CaseConfig::Type> case_types = {
    {"heating_power", CaseConfig::Type::HeatingPower},
    {"heating_temperature", CaseConfig::Type::HeatingTemperature},
    {"heating_rh", CaseConfig::Type::HeatingRelativeHumidity},
    {"heating_relative_humidity", CaseConfig::Type::HeatingRelativeHumidity},
    {"dry_cooling_power", CaseConfig::Type::DryCoolingPower},
    {"dry_cooling_temperature", CaseConfig::Type::DryCoolingTemperature},
    {"cooling_temperature", CaseConfig::Type::CoolingTemperature},
    {"cooling_rh", CaseConfig::Type::CoolingRelativeHumidity},
    {"cooling_relative_humidity", CaseConfig::Type::CoolingRelativeHumidity},
    {"cooling_power", CaseConfig::Type::CoolingPower},
    {"mixing", CaseConfig::Type::Mixing},
    {"mixing_target", CaseConfig::Type::MixingTarget},
    {"mixing_target_temperature", CaseConfig::Type::MixingTarget}};

inline const std::unordered_map<std::string, OutputConfig::Format> output_formats = {
    {"csv", OutputConfig::Format::CSV},
    {"hdf5", OutputConfig::Format::HDF5},
    {"h5", OutputConfig::Format::HDF5}};

} // namespace enum_mappings

} // namespace psychro::io
