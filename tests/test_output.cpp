#include "psychro/io/output/csv_writer.hpp"
#include "psychro/io/output/output_writer.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using psychro::io::CaseConfig;
using psychro::io::OutputConfig;
using namespace psychro::io::output;

namespace {

auto split(const std::string& line, char delimiter) -> std::vector<std::string> {
  std::vector<std::string> fields;
  std::string field;
  std::istringstream stream(line);
  while (std::getline(stream, field, delimiter)) {
    fields.push_back(field);
  }
  // getline drops a trailing empty field
  if (!line.empty() && line.back() == delimiter) {
    fields.emplace_back();
  }
  return fields;
}

auto heating_record() -> CaseRecord {
  CaseRecord record;
  record.name = "preheater";
  record.type = CaseConfig::Type::HeatingTemperature;
  record.inlets.push_back(StreamRecord{.pressure = 101325.0,
                                       .temperature = 20.0,
                                       .humidity_ratio = 0.0073,
                                       .relative_humidity = 50.0,
                                       .specific_enthalpy = 38.6,
                                       .dry_air_mass_flow = 1.0});
  record.outlet = StreamRecord{.pressure = 101325.0,
                               .temperature = 30.0,
                               .humidity_ratio = 0.0073,
                               .relative_humidity = 27.5,
                               .specific_enthalpy = 48.8,
                               .dry_air_mass_flow = 1.0};
  record.heat_of_process = 10190.5;
  return record;
}

auto coil_record() -> CaseRecord {
  CaseRecord record;
  record.name = "coil";
  record.type = CaseConfig::Type::CoolingTemperature;
  record.inlets.push_back(StreamRecord{.temperature = 34.0, .humidity_ratio = 0.0135, .dry_air_mass_flow = 1.0});
  record.outlet = StreamRecord{.temperature = 17.0, .humidity_ratio = 0.0098, .dry_air_mass_flow = 1.0};
  record.heat_of_process = -26835.2;
  record.condensate_mass_flow = 0.0038;
  record.condensate_temperature = 11.5;
  record.bypass_factor = 0.25;
  record.coolant_mass_flow = 1.28;
  return record;
}

} // namespace

TEST(CSVWriterTest, HeaderHasOneColumnPerField) {
  const auto header = CSVWriter::header();
  ASSERT_EQ(header.size(), 20u);
  EXPECT_EQ(header.front(), "name");
  EXPECT_EQ(header[2], "inlet_temperature");
  EXPECT_EQ(header[7], "second_temperature");
  EXPECT_EQ(header[10], "outlet_temperature");
  EXPECT_EQ(header[15], "heat_of_process");
  EXPECT_EQ(header.back(), "coolant_mass_flow");
}

TEST(CSVWriterTest, HeatingRowLeavesCoilColumnsEmpty) {
  CSVWriter writer;
  std::ostringstream out;
  writer.write_table(out, {heating_record()});

  std::istringstream lines(out.str());
  std::string header_line;
  std::string row;
  ASSERT_TRUE(std::getline(lines, header_line));
  ASSERT_TRUE(std::getline(lines, row));

  EXPECT_EQ(header_line.rfind("name,type,inlet_temperature", 0), 0u);
  EXPECT_EQ(split(header_line, ',').size(), 20u);

  const auto fields = split(row, ',');
  ASSERT_EQ(fields.size(), 20u);
  EXPECT_EQ(fields[0], "preheater");
  EXPECT_EQ(fields[1], "heating_temperature");
  EXPECT_EQ(fields[2], "20.000000");
  EXPECT_EQ(fields[7], "");
  EXPECT_EQ(fields[10], "30.000000");
  EXPECT_EQ(fields[15], "10190.500000");
  EXPECT_EQ(row.substr(row.size() - 4), ",,,,");
}

TEST(CSVWriterTest, CoilRowCarriesCondensateAndCoolant) {
  CSVWriter writer(CSVConfig{.delimiter = ';', .precision = 3, .include_headers = false});
  std::ostringstream out;
  writer.write_table(out, {coil_record()});

  std::string row = out.str();
  ASSERT_FALSE(row.empty());
  ASSERT_EQ(row.back(), '\n');
  row.pop_back();

  const auto fields = split(row, ';');
  ASSERT_EQ(fields.size(), 20u);
  EXPECT_EQ(fields[1], "cooling_temperature");
  EXPECT_EQ(fields[15], "-26835.200");
  EXPECT_EQ(fields[16], "0.004");
  EXPECT_EQ(fields[17], "11.500");
  EXPECT_EQ(fields[18], "0.250");
  EXPECT_EQ(fields[19], "1.280");
}

TEST(CSVWriterTest, MixingRowFillsSecondInletColumns) {
  CaseRecord record;
  record.name = "economizer";
  record.type = CaseConfig::Type::Mixing;
  record.inlets = {StreamRecord{.temperature = 5.0, .dry_air_mass_flow = 1.0},
                   StreamRecord{.temperature = 22.0, .humidity_ratio = 0.007, .dry_air_mass_flow = 2.0}};
  record.outlet = StreamRecord{.temperature = 16.3, .dry_air_mass_flow = 3.0};

  CSVWriter writer(CSVConfig{.precision = 1, .include_headers = false});
  std::ostringstream out;
  writer.write_table(out, {record});

  auto row = out.str();
  row.pop_back();
  const auto fields = split(row, ',');
  ASSERT_EQ(fields.size(), 20u);
  EXPECT_EQ(fields[7], "22.0");
  EXPECT_EQ(fields[9], "2.0");
  EXPECT_EQ(fields[14], "3.0");
  EXPECT_EQ(fields[16], "");
}

TEST(OutputWriterTest, WritesTimestampedCsvFile) {
  const auto directory = std::filesystem::temp_directory_path() / "psychro_output_test";
  std::filesystem::remove_all(directory);

  OutputConfig config;
  config.directory = directory.string();
  config.case_name = "plant";
  config.formats = {OutputConfig::Format::CSV};

  OutputWriter writer(config);
  OutputDataset dataset;
  dataset.metadata.case_file = "plant.yaml";
  dataset.cases = {heating_record(), coil_record()};

  auto written = writer.write(dataset);
  ASSERT_TRUE(written.has_value()) << written.error().message();
  ASSERT_EQ(written->size(), 1u);

  const auto& path = written->front();
  EXPECT_EQ(path.extension(), ".csv");
  EXPECT_EQ(path.filename().string().rfind("plant_", 0), 0u);
  ASSERT_TRUE(std::filesystem::exists(path));

  std::ifstream file(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(file, line);) {
    lines.push_back(line);
  }
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines[0].rfind("# psychro", 0), 0u);
  EXPECT_EQ(lines[1], "# case file: plant.yaml");
  EXPECT_EQ(lines[3].rfind("preheater,", 0), 0u);
  EXPECT_EQ(lines[4].rfind("coil,", 0), 0u);

  std::filesystem::remove_all(directory);
}

TEST(OutputWriterTest, StreamRecordFromFlow) {
  auto air = psychro::properties::HumidAir::from_relative_humidity(101325.0, 20.0, 50.0);
  ASSERT_TRUE(air.has_value());
  auto flow = psychro::properties::HumidAirFlow::of(*air, 2.0);
  ASSERT_TRUE(flow.has_value());

  const auto record = to_stream_record(*flow);
  EXPECT_DOUBLE_EQ(record.pressure, 101325.0);
  EXPECT_DOUBLE_EQ(record.temperature, 20.0);
  EXPECT_DOUBLE_EQ(record.relative_humidity, 50.0);
  EXPECT_DOUBLE_EQ(record.humidity_ratio, air->humidity_ratio());
  EXPECT_DOUBLE_EQ(record.dew_point_temperature, air->dew_point_temperature());
  EXPECT_DOUBLE_EQ(record.dry_air_mass_flow, 2.0);
  EXPECT_DOUBLE_EQ(record.humid_air_mass_flow, flow->humid_air_mass_flow());
  EXPECT_DOUBLE_EQ(record.volumetric_flow, flow->volumetric_flow());
}
