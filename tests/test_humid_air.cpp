#include "psychro/properties/humid_air.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace humid_air = psychro::properties::humid_air;
using psychro::core::ErrorKind;

namespace {

constexpr double atmosphere = 100000.0;
constexpr double standard_atmosphere = 101325.0;
constexpr double dew_point_accuracy = 0.04;
constexpr double wet_bulb_accuracy = 0.007;

} // namespace

TEST(HumidAirTest, SaturationPressureMatchesTables) {
  struct Point {
    double ta;
    double ps;
    double accuracy;
  };
  const Point table[] = {{-40.0, 12.85, 0.03}, {-20.0, 103.26, 0.03}, {0.0, 611.2, 0.2},
                         {20.0, 2338.9, 0.2},  {40.0, 7383.8, 1.9},  {60.0, 19943.9, 1.9}};

  for (const auto& point : table) {
    auto ps = humid_air::saturation_pressure(point.ta);
    ASSERT_TRUE(ps.has_value()) << "ta = " << point.ta << ": " << ps.error().message();
    EXPECT_NEAR(*ps, point.ps, point.accuracy) << "ta = " << point.ta;
  }
}

TEST(HumidAirTest, SaturationPressureBelowCorrelationRangeIsRejected) {
  auto ps = humid_air::saturation_pressure(-150.0);
  ASSERT_FALSE(ps.has_value());
  EXPECT_EQ(ps.error().kind(), ErrorKind::InvalidArgument);
}

TEST(HumidAirTest, SaturationPressureFromHumidityRatio) {
  auto ps = humid_air::saturation_pressure(0.007359483455449959, 50.0, atmosphere);
  ASSERT_TRUE(ps.has_value());
  EXPECT_NEAR(*ps, 2338.880310914088, 1e-8);
}

TEST(HumidAirTest, HumidityRatioFromSaturationPressure) {
  auto x = humid_air::humidity_ratio(75.0, 3169.2164701436063, atmosphere);
  ASSERT_TRUE(x.has_value());
  EXPECT_NEAR(*x, 0.015143324009257978, 1e-12);

  auto x_max = humid_air::max_humidity_ratio(3169.2164701436063, atmosphere);
  ASSERT_TRUE(x_max.has_value());
  EXPECT_NEAR(*x_max, 0.020356309472910922, 1e-12);
}

TEST(HumidAirTest, RelativeHumidityFromHumidityRatio) {
  auto rh = humid_air::relative_humidity(20.0, 0.006615487885540037, atmosphere);
  ASSERT_TRUE(rh.has_value());
  EXPECT_NEAR(*rh, 45.0, 1e-6);

  auto dry = humid_air::relative_humidity(20.0, 0.0, atmosphere);
  ASSERT_TRUE(dry.has_value());
  EXPECT_DOUBLE_EQ(*dry, 0.0);

  // Supersaturated air is capped
  auto capped = humid_air::relative_humidity(20.0, 0.05, atmosphere);
  ASSERT_TRUE(capped.has_value());
  EXPECT_DOUBLE_EQ(*capped, 100.0);
}

TEST(HumidAirTest, RelativeHumidityFromDewPoint) {
  auto rh = humid_air::relative_humidity_from_dew_point(9.2744829786, 20.0);
  ASSERT_TRUE(rh.has_value());
  EXPECT_NEAR(*rh, 50.0, dew_point_accuracy);

  auto saturated = humid_air::relative_humidity_from_dew_point(20.0, 20.0);
  ASSERT_TRUE(saturated.has_value());
  EXPECT_NEAR(*saturated, 100.0, 1e-12);
}

TEST(HumidAirTest, DewPointTemperature) {
  struct Point {
    double ta;
    double rh;
    double tdp;
  };
  const Point table[] = {{20.0, 50.0, 9.2744829786},
                         {20.0, 10.0, -11.18374468},
                         {-20.0, 50.0, -27.0240449},
                         {45.0, 95.0, 44.0071103865}};

  for (const auto& point : table) {
    auto tdp = humid_air::dew_point_temperature(point.ta, point.rh, atmosphere);
    ASSERT_TRUE(tdp.has_value()) << "ta = " << point.ta << ", RH = " << point.rh << ": " << tdp.error().message();
    EXPECT_NEAR(*tdp, point.tdp, dew_point_accuracy) << "ta = " << point.ta << ", RH = " << point.rh;
  }
}

TEST(HumidAirTest, DewPointAtStandardPressure) {
  auto tdp = humid_air::dew_point_temperature(20.0, 50.0, standard_atmosphere);
  ASSERT_TRUE(tdp.has_value()) << tdp.error().message();
  EXPECT_NEAR(*tdp, 9.27, 0.01);
}

TEST(HumidAirTest, DewPointInverterRoundTrip) {
  const double temperatures[] = {-20.0, 0.0, 20.0, 70.0};
  const double humidities[] = {0.1, 10.0, 50.0, 95.0};

  for (const double ta : temperatures) {
    for (const double rh : humidities) {
      auto tdp = humid_air::dew_point_temperature(ta, rh, standard_atmosphere);
      ASSERT_TRUE(tdp.has_value()) << "ta = " << ta << ", RH = " << rh << ": " << tdp.error().message();
      auto t = humid_air::dry_bulb_temperature_from_dew_point(*tdp, rh, standard_atmosphere);
      ASSERT_TRUE(t.has_value()) << "ta = " << ta << ", RH = " << rh << ": " << t.error().message();
      auto recovered = humid_air::dew_point_temperature(*t, rh, standard_atmosphere);
      ASSERT_TRUE(recovered.has_value()) << "ta = " << ta << ", RH = " << rh << ": " << recovered.error().message();
      EXPECT_NEAR(*recovered, *tdp, 2e-3) << "ta = " << ta << ", RH = " << rh;
    }
  }
}

TEST(HumidAirTest, DewPointBoundaries) {
  auto saturated = humid_air::dew_point_temperature(25.0, 100.0, atmosphere);
  ASSERT_TRUE(saturated.has_value());
  EXPECT_DOUBLE_EQ(*saturated, 25.0);

  auto dry = humid_air::dew_point_temperature(25.0, 0.0, atmosphere);
  ASSERT_TRUE(dry.has_value());
  EXPECT_TRUE(std::isinf(*dry));
  EXPECT_LT(*dry, 0.0);

  auto invalid = humid_air::dew_point_temperature(25.0, 120.0, atmosphere);
  ASSERT_FALSE(invalid.has_value());
  EXPECT_EQ(invalid.error().kind(), ErrorKind::InvalidArgument);
}

TEST(HumidAirTest, WetBulbTemperature) {
  auto warm = humid_air::wet_bulb_temperature(20.0, 50.0, atmosphere);
  ASSERT_TRUE(warm.has_value()) << warm.error().message();
  EXPECT_NEAR(*warm, 13.7450652549, wet_bulb_accuracy);

  auto cool = humid_air::wet_bulb_temperature(10.0, 50.0, atmosphere);
  ASSERT_TRUE(cool.has_value()) << cool.error().message();
  EXPECT_NEAR(*cool, 5.4986263891, wet_bulb_accuracy);

  auto saturated = humid_air::wet_bulb_temperature(15.0, 100.0, atmosphere);
  ASSERT_TRUE(saturated.has_value());
  EXPECT_DOUBLE_EQ(*saturated, 15.0);
}

TEST(HumidAirTest, WetBulbNearFreezing) {
  const double cases[][2] = {{5.0, 38.0}, {5.0, 37.5}, {4.5, 42.0}, {4.5, 43.0}, {4.5, 44.0}, {8.5, 2.5}};

  for (const auto& [ta, rh] : cases) {
    auto twb = humid_air::wet_bulb_temperature(ta, rh, standard_atmosphere);
    ASSERT_TRUE(twb.has_value()) << "ta = " << ta << ", RH = " << rh << ": " << twb.error().message();
    auto tdp = humid_air::dew_point_temperature(ta, rh, standard_atmosphere);
    ASSERT_TRUE(tdp.has_value());
    EXPECT_LE(*twb, ta) << "ta = " << ta << ", RH = " << rh;
    EXPECT_GE(*twb, *tdp) << "ta = " << ta << ", RH = " << rh;
  }
}

TEST(HumidAirTest, WetBulbConvergesAcrossGrid) {
  // ta from -20 to 70 degC, RH from 0.5 to 99.5 %, both in 0.5 steps
  for (int i = 0; i <= 180; ++i) {
    const double ta = -20.0 + 0.5 * i;
    for (int j = 1; j <= 199; ++j) {
      const double rh = 0.5 * j;
      auto twb = humid_air::wet_bulb_temperature(ta, rh, standard_atmosphere);
      ASSERT_TRUE(twb.has_value()) << "ta = " << ta << ", RH = " << rh << ": " << twb.error().message();
      EXPECT_LE(*twb, ta + 1e-6) << "ta = " << ta << ", RH = " << rh;
    }
  }
}

TEST(HumidAirTest, TransportProperties) {
  auto mu = humid_air::dynamic_viscosity(20.0, 0.00648405507311303);
  ASSERT_TRUE(mu.has_value());
  EXPECT_NEAR(*mu, 1.7971489177670825e-5, 1e-15);

  auto cp = humid_air::specific_heat(20.0, 0.007261881104670626);
  ASSERT_TRUE(cp.has_value());
  EXPECT_NEAR(*cp, 1.0182187895104544, 1e-11);

  auto k_dry = humid_air::thermal_conductivity(20.0, 0.0);
  auto k_humid = humid_air::thermal_conductivity(20.0, 0.01);
  ASSERT_TRUE(k_dry.has_value());
  ASSERT_TRUE(k_humid.has_value());
  EXPECT_NEAR(*k_dry, 0.0259, 5e-4);
  EXPECT_NE(*k_dry, *k_humid);
}

TEST(HumidAirTest, KinematicViscosity) {
  auto ps = humid_air::saturation_pressure(20.0);
  ASSERT_TRUE(ps.has_value());
  auto x = humid_air::humidity_ratio(50.0, *ps, atmosphere);
  ASSERT_TRUE(x.has_value());

  auto nu = humid_air::kinematic_viscosity(20.0, *x, atmosphere);
  ASSERT_TRUE(nu.has_value());
  EXPECT_NEAR(*nu, 1.529406259567132e-5, 1e-10);
}

TEST(HumidAirTest, DensityMatchesTables) {
  auto saturated_20 = humid_air::density(20.0, 0.014758, 101325.0);
  ASSERT_TRUE(saturated_20.has_value());
  EXPECT_NEAR(*saturated_20, 1.0 / 0.8498, 0.004);

  auto saturated_0 = humid_air::density(0.0, 0.003789, 101325.0);
  ASSERT_TRUE(saturated_0.has_value());
  EXPECT_NEAR(*saturated_0, 1.0 / 0.7781, 0.004);
}

TEST(HumidAirTest, SpecificEnthalpyWithAndWithoutMist) {
  auto unsaturated = humid_air::specific_enthalpy(20.0, 0.0072129, atmosphere);
  ASSERT_TRUE(unsaturated.has_value());
  EXPECT_NEAR(*unsaturated, 38.4012926032259, 1e-9);

  auto water_mist = humid_air::specific_enthalpy(20.0, 0.02, atmosphere);
  ASSERT_TRUE(water_mist.has_value());
  EXPECT_NEAR(*water_mist, 58.32618455095958, 1e-6);

  auto ice_mist = humid_air::specific_enthalpy(-20.0, 0.02, atmosphere);
  ASSERT_TRUE(ice_mist.has_value());
  EXPECT_NEAR(*ice_mist, -25.69550793501464, 1e-6);

  auto unsaturated_cold = humid_air::specific_enthalpy(-20.0, 0.0001532, atmosphere);
  ASSERT_TRUE(unsaturated_cold.has_value());
  EXPECT_NEAR(*unsaturated_cold, -19.68254341443484, 1e-9);
}

TEST(HumidAirTest, EnthalpyInverterRecoversTemperature) {
  const double cases[][2] = {{20.0, 0.0064841}, {0.0, 0.00064841}, {30.0, 0.02539514384567531}, {50.0, 0.02}};

  for (const auto& [ta, x] : cases) {
    auto h = humid_air::specific_enthalpy(ta, x, atmosphere);
    ASSERT_TRUE(h.has_value());
    auto t = humid_air::dry_bulb_temperature_from_enthalpy(*h, x, atmosphere);
    ASSERT_TRUE(t.has_value()) << "ta = " << ta << ", x = " << x << ": " << t.error().message();
    EXPECT_NEAR(*t, ta, 1e-4) << "ta = " << ta << ", x = " << x;
  }
}

TEST(HumidAirTest, EnthalpyInverterRoundTripGrid) {
  const double temperatures[] = {-20.0, 0.0, 20.0, 70.0};
  const double ratios[] = {0.0, 0.0005, 0.005, 0.02};

  for (const double ta : temperatures) {
    for (const double x : ratios) {
      auto h = humid_air::specific_enthalpy(ta, x, standard_atmosphere);
      ASSERT_TRUE(h.has_value()) << "ta = " << ta << ", x = " << x << ": " << h.error().message();
      auto t = humid_air::dry_bulb_temperature_from_enthalpy(*h, x, standard_atmosphere);
      ASSERT_TRUE(t.has_value()) << "ta = " << ta << ", x = " << x << ": " << t.error().message();
      EXPECT_NEAR(*t, ta, 1e-3) << "ta = " << ta << ", x = " << x;
    }
  }
}

TEST(HumidAirTest, HumidityRatioInverterRecoversTemperature) {
  const double cases[][2] = {{-20.0, 10.0}, {20.0, 10.0}, {20.0, 95.0}, {30.0, 95.0}};

  for (const auto& [ta, rh] : cases) {
    auto ps = humid_air::saturation_pressure(ta);
    ASSERT_TRUE(ps.has_value());
    auto x = humid_air::humidity_ratio(rh, *ps, atmosphere);
    ASSERT_TRUE(x.has_value());
    auto t = humid_air::dry_bulb_temperature_from_humidity_ratio(*x, rh, atmosphere);
    ASSERT_TRUE(t.has_value()) << "ta = " << ta << ", RH = " << rh << ": " << t.error().message();
    EXPECT_NEAR(*t, ta, 1e-4) << "ta = " << ta << ", RH = " << rh;
  }
}

TEST(HumidAirTest, MaxDryBulbTemperatureReachesTotalPressure) {
  auto t_max = humid_air::max_dry_bulb_temperature(atmosphere);
  ASSERT_TRUE(t_max.has_value()) << t_max.error().message();
  EXPECT_NEAR(*t_max, 99.6, 0.2);

  auto ps = humid_air::saturation_pressure(*t_max);
  ASSERT_TRUE(ps.has_value());
  EXPECT_NEAR(*ps, atmosphere, 1.0);
}

TEST(HumidAirTest, DryBulbFromDewPointForZeroHumidity) {
  auto t = humid_air::dry_bulb_temperature_from_dew_point(5.0, 0.0, atmosphere);
  ASSERT_TRUE(t.has_value());
  EXPECT_TRUE(std::isinf(*t));
  EXPECT_GT(*t, 0.0);
}
