#include "psychro/io/yaml_parser.hpp"
#include <gtest/gtest.h>
#include <string>

using psychro::io::CaseConfig;
using psychro::io::OutputConfig;
using psychro::io::YamlParser;

namespace {

auto parse(const std::string& content) -> std::expected<psychro::io::Configuration, psychro::core::ConfigurationError> {
  YamlParser parser("inline");
  auto loaded = parser.load_from_string(content);
  EXPECT_TRUE(loaded.has_value());
  return parser.parse();
}

const std::string coil_case = R"(
verbose: true
solver:
  tolerance: 1.0e-6
  max_iterations: 50
  strict_convergence: true
output:
  directory: results
  case_name: coil
  formats: [CSV, h5, hdf5]
cases:
  - name: coil
    type: cooling_temperature
    inlet:
      pressure: 100000
      temperature: 34.0
      relative_humidity: 40.0
      dry_air_mass_flow: 1.0
    coolant:
      supply: 9.0
      return: 14.0
    target: 17.0
)";

} // namespace

TEST(YamlParserTest, ParsesCompleteCaseFile) {
  auto config = parse(coil_case);
  ASSERT_TRUE(config.has_value()) << config.error().message();

  EXPECT_TRUE(config->verbose);
  EXPECT_DOUBLE_EQ(config->solver.tolerance, 1.0e-6);
  EXPECT_EQ(config->solver.max_iterations, 50);
  EXPECT_TRUE(config->solver.strict_convergence);

  EXPECT_EQ(config->output.directory, "results");
  EXPECT_EQ(config->output.case_name, "coil");
  ASSERT_EQ(config->output.formats.size(), 2u);
  EXPECT_EQ(config->output.formats[0], OutputConfig::Format::CSV);
  EXPECT_EQ(config->output.formats[1], OutputConfig::Format::HDF5);

  ASSERT_EQ(config->cases.size(), 1u);
  const auto& coil = config->cases.front();
  EXPECT_EQ(coil.name, "coil");
  EXPECT_EQ(coil.type, CaseConfig::Type::CoolingTemperature);
  EXPECT_DOUBLE_EQ(coil.inlet.pressure, 100000.0);
  ASSERT_TRUE(coil.inlet.relative_humidity.has_value());
  EXPECT_DOUBLE_EQ(*coil.inlet.relative_humidity, 40.0);
  EXPECT_FALSE(coil.inlet.humidity_ratio.has_value());
  ASSERT_TRUE(coil.coolant.has_value());
  EXPECT_DOUBLE_EQ(coil.coolant->supply_temperature, 9.0);
  EXPECT_DOUBLE_EQ(coil.coolant->return_temperature, 14.0);
  EXPECT_DOUBLE_EQ(coil.target, 17.0);
  EXPECT_FALSE(config->chart.enabled);
}

TEST(YamlParserTest, DefaultsForOptionalSections) {
  auto config = parse(R"(
cases:
  - name: mix
    type: MIXING
    inlet:
      temperature: 30.0
      humidity_ratio: 0.012
      dry_air_mass_flow: 0.4
    second:
      temperature: 22.0
      relative_humidity: 50.0
      dry_air_mass_flow: 0.8
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();

  EXPECT_FALSE(config->verbose);
  EXPECT_DOUBLE_EQ(config->solver.tolerance, psychro::constants::solver::tolerance);
  EXPECT_FALSE(config->solver.strict_convergence);
  ASSERT_EQ(config->output.formats.size(), 1u);
  EXPECT_EQ(config->output.formats[0], OutputConfig::Format::CSV);

  const auto& mix = config->cases.front();
  EXPECT_EQ(mix.type, CaseConfig::Type::Mixing);
  EXPECT_DOUBLE_EQ(mix.inlet.pressure, psychro::constants::defaults::pressure);
  ASSERT_TRUE(mix.inlet.humidity_ratio.has_value());
  EXPECT_DOUBLE_EQ(*mix.inlet.humidity_ratio, 0.012);
  ASSERT_TRUE(mix.second.has_value());
  EXPECT_DOUBLE_EQ(mix.second->dry_air_mass_flow, 0.8);
}

TEST(YamlParserTest, ChartOnlyConfiguration) {
  auto config = parse(R"(
chart:
  enabled: true
  pressure: 101325
  temperature_min: 0
  temperature_max: 40
  temperature_points: 41
  relative_humidities: [20, 60, 100]
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();

  EXPECT_TRUE(config->cases.empty());
  EXPECT_TRUE(config->chart.enabled);
  EXPECT_EQ(config->chart.temperature_points, 41);
  ASSERT_EQ(config->chart.relative_humidities.size(), 3u);
  EXPECT_DOUBLE_EQ(config->chart.relative_humidities[1], 60.0);
}

TEST(YamlParserTest, RejectsBothHumiditySpecifications) {
  auto config = parse(R"(
cases:
  - name: heater
    type: heating_temperature
    inlet:
      temperature: 10.0
      relative_humidity: 50.0
      humidity_ratio: 0.004
      dry_air_mass_flow: 1.0
    target: 20.0
)");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().message().find("exactly one"), std::string::npos);
}

TEST(YamlParserTest, RejectsCoilWithoutCoolant) {
  auto config = parse(R"(
cases:
  - name: coil
    type: cooling_power
    inlet:
      temperature: 30.0
      relative_humidity: 50.0
      dry_air_mass_flow: 1.0
    target: -10000
)");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().message().find("coolant"), std::string::npos);
}

TEST(YamlParserTest, RejectsMixingWithoutSecondFlow) {
  auto config = parse(R"(
cases:
  - name: blend
    type: mixing_target
    inlet:
      temperature: 30.0
      relative_humidity: 50.0
    target_flow: 1.0
    target: 20.0
)");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().message().find("second"), std::string::npos);
}

TEST(YamlParserTest, RejectsUnknownValues) {
  auto bad_type = parse(R"(
cases:
  - name: humidifier
    type: steam_humidification
    inlet:
      temperature: 20.0
      relative_humidity: 30.0
    target: 50.0
)");
  ASSERT_FALSE(bad_type.has_value());
  EXPECT_NE(bad_type.error().message().find("steam_humidification"), std::string::npos);

  auto bad_format = parse(R"(
output:
  formats: [csv, vtk]
chart:
  enabled: true
)");
  ASSERT_FALSE(bad_format.has_value());
  EXPECT_NE(bad_format.error().message().find("vtk"), std::string::npos);
}

TEST(YamlParserTest, RejectsInvalidChartRange) {
  auto config = parse(R"(
chart:
  enabled: true
  temperature_min: 40
  temperature_max: 10
)");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().message().find("temperature_min"), std::string::npos);
}

TEST(YamlParserTest, RejectsInvalidSolverSettings) {
  auto config = parse(R"(
solver:
  tolerance: -1.0
chart:
  enabled: true
)");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().message().find("solver.tolerance"), std::string::npos);
}

TEST(YamlParserTest, MissingCasesWithoutChartIsAnError) {
  auto config = parse("verbose: false\n");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().message().find("cases"), std::string::npos);
}
