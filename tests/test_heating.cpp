#include "psychro/process/heating.hpp"
#include <gtest/gtest.h>

using psychro::core::ErrorKind;
using psychro::process::HumidAir;
using psychro::process::HumidAirFlow;

namespace {

auto make_inlet(double dry_air_mass_flow = 1.0) -> HumidAirFlow {
  auto air = HumidAir::from_relative_humidity(101325.0, 20.0, 50.0);
  EXPECT_TRUE(air.has_value());
  auto flow = HumidAirFlow::of(*air, dry_air_mass_flow);
  EXPECT_TRUE(flow.has_value());
  return *flow;
}

} // namespace

TEST(HeatingTest, HeatingToTargetTemperature) {
  const auto inlet = make_inlet();

  auto result = psychro::process::heating_from_temperature(inlet, 30.0);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_DOUBLE_EQ(result->outlet.temperature(), 30.0);
  EXPECT_DOUBLE_EQ(result->outlet.humidity_ratio(), inlet.humidity_ratio());
  EXPECT_DOUBLE_EQ(result->outlet.dry_air_mass_flow(), inlet.dry_air_mass_flow());
  EXPECT_LT(result->outlet.relative_humidity(), inlet.relative_humidity());
  EXPECT_GT(result->heat_of_process, 0.0);

  // Sensible heat of roughly 1.02 kJ/(kg K) over 10 K
  EXPECT_NEAR(result->heat_of_process, 10190.0, 100.0);
  EXPECT_NEAR(result->heat_of_process,
              (result->outlet.specific_enthalpy() - inlet.specific_enthalpy()) * inlet.dry_air_mass_flow() * 1000.0,
              1e-6);
}

TEST(HeatingTest, HeatingFromPowerReproducesTemperatureCase) {
  const auto inlet = make_inlet();

  auto forward = psychro::process::heating_from_temperature(inlet, 30.0);
  ASSERT_TRUE(forward.has_value());

  auto result = psychro::process::heating_from_power(inlet, forward->heat_of_process);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_NEAR(result->outlet.temperature(), 30.0, 0.01);
  EXPECT_DOUBLE_EQ(result->outlet.humidity_ratio(), inlet.humidity_ratio());
  EXPECT_DOUBLE_EQ(result->heat_of_process, forward->heat_of_process);
}

TEST(HeatingTest, HeatingToTargetRelativeHumidity) {
  const auto inlet = make_inlet();

  auto result = psychro::process::heating_from_relative_humidity(inlet, 30.0);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_NEAR(result->outlet.relative_humidity(), 30.0, 0.01);
  EXPECT_GT(result->outlet.temperature(), inlet.temperature());
  EXPECT_DOUBLE_EQ(result->outlet.humidity_ratio(), inlet.humidity_ratio());
  EXPECT_GT(result->heat_of_process, 0.0);
}

TEST(HeatingTest, InvalidTargetsAreRejected) {
  const auto inlet = make_inlet();

  auto negative_power = psychro::process::heating_from_power(inlet, -100.0);
  ASSERT_FALSE(negative_power.has_value());
  EXPECT_EQ(negative_power.error().kind(), ErrorKind::InvalidArgument);

  auto excessive_power = psychro::process::heating_from_power(inlet, 1e9);
  ASSERT_FALSE(excessive_power.has_value());
  EXPECT_EQ(excessive_power.error().kind(), ErrorKind::InvalidArgument);

  auto colder_target = psychro::process::heating_from_temperature(inlet, 15.0);
  ASSERT_FALSE(colder_target.has_value());
  EXPECT_EQ(colder_target.error().kind(), ErrorKind::InvalidArgument);

  auto wetter_target = psychro::process::heating_from_relative_humidity(inlet, 60.0);
  ASSERT_FALSE(wetter_target.has_value());
  EXPECT_EQ(wetter_target.error().kind(), ErrorKind::InvalidArgument);
}

TEST(HeatingTest, ZeroFlowOrZeroPowerLeavesInletUnchanged) {
  const auto no_flow = make_inlet(0.0);
  auto heated = psychro::process::heating_from_temperature(no_flow, 40.0);
  ASSERT_TRUE(heated.has_value());
  EXPECT_DOUBLE_EQ(heated->outlet.temperature(), no_flow.temperature());
  EXPECT_DOUBLE_EQ(heated->heat_of_process, 0.0);

  const auto inlet = make_inlet();
  auto idle = psychro::process::heating_from_power(inlet, 0.0);
  ASSERT_TRUE(idle.has_value());
  EXPECT_DOUBLE_EQ(idle->outlet.temperature(), inlet.temperature());
  EXPECT_DOUBLE_EQ(idle->outlet.humidity_ratio(), inlet.humidity_ratio());
}
