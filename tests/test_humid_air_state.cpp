#include "psychro/properties/humid_air.hpp"
#include "psychro/properties/humid_air_state.hpp"
#include <gtest/gtest.h>

using psychro::core::ErrorKind;
using psychro::properties::HumidAir;
using psychro::properties::HumidAirFlow;

TEST(HumidAirStateTest, FromRelativeHumidityDerivesAllProperties) {
  auto air = HumidAir::from_relative_humidity(101325.0, 20.0, 50.0);
  ASSERT_TRUE(air.has_value()) << air.error().message();

  EXPECT_DOUBLE_EQ(air->pressure(), 101325.0);
  EXPECT_DOUBLE_EQ(air->temperature(), 20.0);
  EXPECT_DOUBLE_EQ(air->relative_humidity(), 50.0);
  EXPECT_NEAR(air->saturation_pressure(), 2338.9, 0.2);
  EXPECT_NEAR(air->humidity_ratio(), 0.00726, 5e-5);
  EXPECT_NEAR(air->dew_point_temperature(), 9.27, 0.05);
  EXPECT_NEAR(air->specific_enthalpy(), 38.5, 0.3);
  EXPECT_NEAR(air->density(), 1.190, 0.005);

  auto wet_bulb = air->wet_bulb_temperature();
  ASSERT_TRUE(wet_bulb.has_value());
  EXPECT_GT(*wet_bulb, air->dew_point_temperature());
  EXPECT_LT(*wet_bulb, air->temperature());
}

TEST(HumidAirStateTest, FromHumidityRatioMatchesRelativeHumidityFactory) {
  auto reference = HumidAir::from_relative_humidity(100000.0, 25.0, 60.0);
  ASSERT_TRUE(reference.has_value());

  auto air = HumidAir::from_humidity_ratio(100000.0, 25.0, reference->humidity_ratio());
  ASSERT_TRUE(air.has_value()) << air.error().message();

  EXPECT_NEAR(air->relative_humidity(), 60.0, 1e-6);
  EXPECT_NEAR(air->specific_enthalpy(), reference->specific_enthalpy(), 1e-9);
  EXPECT_NEAR(air->dew_point_temperature(), reference->dew_point_temperature(), 1e-6);
  EXPECT_DOUBLE_EQ(air->density(), reference->density());
}

TEST(HumidAirStateTest, DryAirHasNoDewPoint) {
  auto air = HumidAir::from_humidity_ratio(100000.0, 20.0, 0.0);
  ASSERT_TRUE(air.has_value());
  EXPECT_DOUBLE_EQ(air->relative_humidity(), 0.0);
  EXPECT_LT(air->dew_point_temperature(), -1e300);
}

TEST(HumidAirStateTest, InvalidInputsAreRejected) {
  auto low_pressure = HumidAir::from_relative_humidity(10000.0, 20.0, 50.0);
  ASSERT_FALSE(low_pressure.has_value());
  EXPECT_EQ(low_pressure.error().kind(), ErrorKind::InvalidArgument);

  auto too_humid = HumidAir::from_relative_humidity(101325.0, 20.0, 101.0);
  ASSERT_FALSE(too_humid.has_value());
  EXPECT_EQ(too_humid.error().kind(), ErrorKind::InvalidArgument);

  auto negative_x = HumidAir::from_humidity_ratio(101325.0, 20.0, -0.001);
  ASSERT_FALSE(negative_x.has_value());
  EXPECT_EQ(negative_x.error().kind(), ErrorKind::InvalidArgument);

  auto too_cold = HumidAir::from_relative_humidity(101325.0, -140.0, 50.0);
  ASSERT_FALSE(too_cold.has_value());
  EXPECT_EQ(too_cold.error().kind(), ErrorKind::InvalidArgument);
}

TEST(HumidAirStateTest, FlowDerivedQuantities) {
  auto air = HumidAir::from_relative_humidity(101325.0, 20.0, 50.0);
  ASSERT_TRUE(air.has_value());

  auto flow = HumidAirFlow::of(*air, 2.0);
  ASSERT_TRUE(flow.has_value());

  EXPECT_DOUBLE_EQ(flow->dry_air_mass_flow(), 2.0);
  EXPECT_DOUBLE_EQ(flow->humid_air_mass_flow(), 2.0 * (1.0 + air->humidity_ratio()));
  EXPECT_DOUBLE_EQ(flow->volumetric_flow(), flow->humid_air_mass_flow() / air->density());
  EXPECT_DOUBLE_EQ(flow->temperature(), 20.0);
  EXPECT_DOUBLE_EQ(flow->humidity_ratio(), air->humidity_ratio());
}

TEST(HumidAirStateTest, NegativeFlowIsRejected) {
  auto air = HumidAir::from_relative_humidity(101325.0, 20.0, 50.0);
  ASSERT_TRUE(air.has_value());

  auto flow = HumidAirFlow::of(*air, -1.0);
  ASSERT_FALSE(flow.has_value());
  EXPECT_EQ(flow.error().kind(), ErrorKind::InvalidArgument);

  auto zero = HumidAirFlow::of(*air, 0.0);
  ASSERT_TRUE(zero.has_value());
  EXPECT_DOUBLE_EQ(zero->volumetric_flow(), 0.0);
}
