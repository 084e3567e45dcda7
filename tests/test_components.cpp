#include "psychro/properties/components.hpp"
#include <gtest/gtest.h>

namespace props = psychro::properties;

TEST(ComponentsTest, LiquidWaterEnthalpy) {
  EXPECT_NEAR(props::liquid_water::specific_enthalpy(20.0), 83.68654489595968, 1e-9);
  EXPECT_DOUBLE_EQ(props::liquid_water::specific_enthalpy(-20.0), 0.0);
}

TEST(ComponentsTest, IceEnthalpy) {
  EXPECT_NEAR(props::ice::specific_enthalpy(-20.0), -372.96357844600004, 1e-9);
  EXPECT_DOUBLE_EQ(props::ice::specific_enthalpy(20.0), 0.0);
}

TEST(ComponentsTest, DryAirAndVapourAreConsistent) {
  EXPECT_GT(props::dry_air::specific_heat(20.0), 1.0);
  EXPECT_LT(props::dry_air::specific_heat(20.0), 1.01);
  EXPECT_NEAR(props::dry_air::density(0.0, 101325.0), 1.2922, 1e-3);
  EXPECT_GT(props::water_vapour::specific_enthalpy(20.0), props::dry_air::specific_enthalpy(20.0));
  EXPECT_GT(props::dry_air::dynamic_viscosity(50.0), props::dry_air::dynamic_viscosity(0.0));
}
