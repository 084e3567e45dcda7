#include "psychro/io/yaml_parser.hpp"
#include "psychro/core/constants.hpp"
#include "psychro/core/exceptions.hpp"

#include <algorithm>
#include <cmath>

namespace psychro::io {

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::load_from_string(std::string_view content) -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::Load(std::string(content));
    return {};
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  try {
    if (!root_ || root_.IsNull()) {
      return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
    }

    Configuration config;

    auto verbose_result = extract_optional<bool>(root_, "verbose", false);
    if (!verbose_result) {
      return std::unexpected(verbose_result.error());
    }
    config.verbose = verbose_result.value();

    auto solver_result = parse_solver_config(root_["solver"]);
    if (!solver_result) {
      return std::unexpected(solver_result.error());
    }
    config.solver = solver_result.value();

    auto output_result = parse_output_config(root_["output"]);
    if (!output_result) {
      return std::unexpected(output_result.error());
    }
    config.output = std::move(output_result.value());

    auto chart_result = parse_chart_config(root_["chart"]);
    if (!chart_result) {
      return std::unexpected(chart_result.error());
    }
    config.chart = std::move(chart_result.value());

    const auto cases_node = root_["cases"];
    if (!cases_node || !cases_node.IsSequence()) {
      if (!config.chart.enabled) {
        return std::unexpected(
            core::ConfigurationError("Missing required 'cases' list (or an enabled 'chart' section)."));
      }
      return config;
    }

    config.cases.reserve(cases_node.size());
    for (std::size_t i = 0; i < cases_node.size(); ++i) {
      auto case_result = parse_case_config(cases_node[i]);
      if (!case_result) {
        return std::unexpected(
            core::ConfigurationError(std::format("In 'cases[{}]': {}", i, case_result.error().message())));
      }
      config.cases.push_back(std::move(case_result.value()));
    }

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("YAML structure error: {}", e.what())));
  }
}

auto YamlParser::parse_solver_config(const YAML::Node& node) const
    -> std::expected<SolverSettings, core::ConfigurationError> {

  SolverSettings config;

  // Absent section keeps the defaults
  if (!node) {
    return config;
  }

  auto tolerance_result = extract_optional<double>(node, "tolerance", config.tolerance);
  if (!tolerance_result)
    return std::unexpected(core::ConfigurationError(std::format("In 'solver' section: {}", tolerance_result.error().message())));
  config.tolerance = tolerance_result.value();

  auto max_iter_result = extract_optional<int>(node, "max_iterations", config.max_iterations);
  if (!max_iter_result)
    return std::unexpected(core::ConfigurationError(std::format("In 'solver' section: {}", max_iter_result.error().message())));
  config.max_iterations = max_iter_result.value();

  auto strict_result = extract_optional<bool>(node, "strict_convergence", config.strict_convergence);
  if (!strict_result)
    return std::unexpected(core::ConfigurationError(std::format("In 'solver' section: {}", strict_result.error().message())));
  config.strict_convergence = strict_result.value();

  if (!(config.tolerance > 0.0)) {
    return std::unexpected(core::ValidationError("solver.tolerance", "must be positive"));
  }
  if (config.max_iterations < 1) {
    return std::unexpected(core::ValidationError("solver.max_iterations", "must be at least 1"));
  }

  return config;
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {

  OutputConfig config;

  if (!node) {
    return config;
  }

  auto directory_result = extract_optional<std::string>(node, "directory", config.directory);
  if (!directory_result)
    return std::unexpected(core::ConfigurationError(std::format("In 'output' section: {}", directory_result.error().message())));
  config.directory = directory_result.value();

  auto name_result = extract_optional<std::string>(node, "case_name", config.case_name);
  if (!name_result)
    return std::unexpected(core::ConfigurationError(std::format("In 'output' section: {}", name_result.error().message())));
  config.case_name = name_result.value();

  if (node["formats"]) {
    auto formats_node = node["formats"];
    if (!formats_node.IsSequence()) {
      return std::unexpected(core::ValidationError("output.formats", "must be a list such as [csv, hdf5]"));
    }

    config.formats.clear();
    for (const auto& item : formats_node) {
      auto name = item.as<std::string>();
      std::ranges::transform(name, name.begin(), ::tolower);
      auto it = enum_mappings::output_formats.find(name);
      if (it == enum_mappings::output_formats.end()) {
        return std::unexpected(core::ValidationError("output.formats", std::format("unknown format '{}'", name)));
      }
      if (std::ranges::find(config.formats, it->second) == config.formats.end()) {
        config.formats.push_back(it->second);
      }
    }
  }

  return config;
}

auto YamlParser::parse_flow_config(const YAML::Node& node) const
    -> std::expected<FlowConfig, core::ConfigurationError> {

  FlowConfig config;

  auto pressure_result = extract_optional<double>(node, "pressure", config.pressure);
  if (!pressure_result)
    return std::unexpected(pressure_result.error());
  config.pressure = pressure_result.value();

  auto temperature_result = extract_value<double>(node, "temperature");
  if (!temperature_result)
    return std::unexpected(temperature_result.error());
  config.temperature = temperature_result.value();

  if (node["relative_humidity"]) {
    auto rh_result = extract_value<double>(node, "relative_humidity");
    if (!rh_result)
      return std::unexpected(rh_result.error());
    config.relative_humidity = rh_result.value();
  }

  if (node["humidity_ratio"]) {
    auto x_result = extract_value<double>(node, "humidity_ratio");
    if (!x_result)
      return std::unexpected(x_result.error());
    config.humidity_ratio = x_result.value();
  }

  if (config.relative_humidity.has_value() == config.humidity_ratio.has_value()) {
    return std::unexpected(
        core::ValidationError("relative_humidity/humidity_ratio", "exactly one of the two must be given"));
  }

  auto flow_result = extract_optional<double>(node, "dry_air_mass_flow", config.dry_air_mass_flow);
  if (!flow_result)
    return std::unexpected(flow_result.error());
  config.dry_air_mass_flow = flow_result.value();

  auto min_flow_result = extract_optional<double>(node, "minimum_flow", config.minimum_flow);
  if (!min_flow_result)
    return std::unexpected(min_flow_result.error());
  config.minimum_flow = min_flow_result.value();

  if (config.dry_air_mass_flow < 0.0) {
    return std::unexpected(core::ValidationError("dry_air_mass_flow", "must not be negative"));
  }
  if (config.minimum_flow < 0.0) {
    return std::unexpected(core::ValidationError("minimum_flow", "must not be negative"));
  }

  return config;
}

auto YamlParser::parse_coolant_config(const YAML::Node& node) const
    -> std::expected<CoolantConfig, core::ConfigurationError> {

  CoolantConfig config;

  auto supply_result = extract_value<double>(node, "supply");
  if (!supply_result)
    return std::unexpected(supply_result.error());
  config.supply_temperature = supply_result.value();

  auto return_result = extract_value<double>(node, "return");
  if (!return_result)
    return std::unexpected(return_result.error());
  config.return_temperature = return_result.value();

  if (config.supply_temperature > config.return_temperature) {
    return std::unexpected(core::ValidationError("coolant.supply", "must not exceed the return temperature"));
  }

  return config;
}

auto YamlParser::parse_case_config(const YAML::Node& node) const
    -> std::expected<CaseConfig, core::ConfigurationError> {

  CaseConfig config;

  auto name_result = extract_value<std::string>(node, "name");
  if (!name_result)
    return std::unexpected(name_result.error());
  config.name = name_result.value();

  auto type_result = extract_enum(node, "type", enum_mappings::case_types);
  if (!type_result)
    return std::unexpected(type_result.error());
  config.type = type_result.value();

  if (!node["inlet"]) {
    return std::unexpected(core::ConfigurationError("Required section 'inlet' is missing"));
  }
  auto inlet_result = parse_flow_config(node["inlet"]);
  if (!inlet_result) {
    return std::unexpected(core::ConfigurationError(std::format("In 'inlet' section: {}", inlet_result.error().message())));
  }
  config.inlet = inlet_result.value();

  if (node["second"]) {
    auto second_result = parse_flow_config(node["second"]);
    if (!second_result) {
      return std::unexpected(
          core::ConfigurationError(std::format("In 'second' section: {}", second_result.error().message())));
    }
    config.second = second_result.value();
  } else if (requires_second_flow(config.type)) {
    return std::unexpected(core::ConfigurationError(
        std::format("Required section 'second' is missing for case type '{}'", to_string(config.type))));
  }

  if (node["coolant"]) {
    auto coolant_result = parse_coolant_config(node["coolant"]);
    if (!coolant_result) {
      return std::unexpected(
          core::ConfigurationError(std::format("In 'coolant' section: {}", coolant_result.error().message())));
    }
    config.coolant = coolant_result.value();
  } else if (requires_coolant(config.type)) {
    return std::unexpected(core::ConfigurationError(
        std::format("Required section 'coolant' is missing for case type '{}'", to_string(config.type))));
  }

  if (config.type != CaseConfig::Type::Mixing) {
    auto target_result = extract_value<double>(node, "target");
    if (!target_result)
      return std::unexpected(target_result.error());
    config.target = target_result.value();
    if (!std::isfinite(config.target)) {
      return std::unexpected(core::ValidationError("target", "must be finite"));
    }
  }

  if (config.type == CaseConfig::Type::MixingTarget) {
    auto target_flow_result = extract_value<double>(node, "target_flow");
    if (!target_flow_result)
      return std::unexpected(target_flow_result.error());
    config.target_flow = target_flow_result.value();
    if (config.target_flow < 0.0) {
      return std::unexpected(core::ValidationError("target_flow", "must not be negative"));
    }
  }

  return config;
}

auto YamlParser::parse_chart_config(const YAML::Node& node) const
    -> std::expected<ChartConfig, core::ConfigurationError> {

  ChartConfig config;

  if (!node) {
    return config;
  }

  try {
    if (node["enabled"]) {
      config.enabled = node["enabled"].as<bool>();
    }

    // Only parse other fields if enabled
    if (!config.enabled) {
      return config;
    }

    if (node["pressure"]) {
      config.pressure = node["pressure"].as<double>();
    }
    if (node["temperature_min"]) {
      config.temperature_min = node["temperature_min"].as<double>();
    }
    if (node["temperature_max"]) {
      config.temperature_max = node["temperature_max"].as<double>();
    }
    if (node["temperature_points"]) {
      config.temperature_points = node["temperature_points"].as<int>();
    }
    if (node["relative_humidities"]) {
      auto rh_result = extract_value<std::vector<double>>(node, "relative_humidities");
      if (!rh_result) {
        return std::unexpected(rh_result.error());
      }
      config.relative_humidities = std::move(rh_result.value());
    }

    if (config.temperature_min >= config.temperature_max) {
      return std::unexpected(core::ConfigurationError("temperature_min must be less than temperature_max"));
    }
    if (config.temperature_points < 2) {
      return std::unexpected(core::ConfigurationError("temperature_points must be at least 2"));
    }
    if (config.relative_humidities.empty()) {
      return std::unexpected(core::ConfigurationError("relative_humidities cannot be empty"));
    }
    for (const double rh : config.relative_humidities) {
      if (rh < constants::limits::min_relative_humidity || rh > constants::limits::max_relative_humidity) {
        return std::unexpected(core::ConfigurationError(std::format("relative humidity {} is outside [0, 100]", rh)));
      }
    }

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'chart' section: {}", e.what())));
  }
}

} // namespace psychro::io
