#include "psychro/solver/bracket_evaluator.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using psychro::core::CalculationError;
using psychro::core::ErrorKind;
using psychro::solver::Bracket;
using psychro::solver::SolverConfig;

namespace {

auto linear(double x) -> std::expected<double, CalculationError> { return x - 100.0; }

} // namespace

TEST(BracketEvaluatorTest, OrderPointsPutsSmallerResidualInB) {
  auto bracket = psychro::solver::order_points(1.0, 0.5, 2.0, -4.0);
  EXPECT_DOUBLE_EQ(bracket.a, 2.0);
  EXPECT_DOUBLE_EQ(bracket.fa, -4.0);
  EXPECT_DOUBLE_EQ(bracket.b, 1.0);
  EXPECT_DOUBLE_EQ(bracket.fb, 0.5);
  EXPECT_TRUE(bracket.has_sign_change());

  auto kept = psychro::solver::order_points(1.0, 3.0, 2.0, 1.0);
  EXPECT_DOUBLE_EQ(kept.a, 1.0);
  EXPECT_DOUBLE_EQ(kept.b, 2.0);
  EXPECT_FALSE(kept.has_sign_change());
}

TEST(BracketEvaluatorTest, EvaluateRejectsNonFiniteResiduals) {
  auto nan_result = psychro::solver::evaluate(
      [](double) -> std::expected<double, CalculationError> { return std::numeric_limits<double>::quiet_NaN(); }, 1.0);
  ASSERT_FALSE(nan_result.has_value());
  EXPECT_EQ(nan_result.error().kind(), ErrorKind::NumericResult);

  auto inf_result = psychro::solver::evaluate(
      [](double) -> std::expected<double, CalculationError> { return std::numeric_limits<double>::infinity(); }, 1.0);
  ASSERT_FALSE(inf_result.has_value());
  EXPECT_EQ(inf_result.error().kind(), ErrorKind::NumericResult);

  auto value = psychro::solver::evaluate(linear, 40.0);
  ASSERT_TRUE(value.has_value());
  EXPECT_DOUBLE_EQ(*value, -60.0);
}

TEST(BracketEvaluatorTest, OrderBracketEvaluatesBothEnds) {
  auto bracket = psychro::solver::order_bracket(linear, -50.0, 50.0);
  ASSERT_TRUE(bracket.has_value());
  EXPECT_DOUBLE_EQ(bracket->b, 50.0);
  EXPECT_DOUBLE_EQ(bracket->fb, -50.0);
  EXPECT_DOUBLE_EQ(bracket->a, -50.0);
  EXPECT_DOUBLE_EQ(bracket->fa, -150.0);
}

TEST(BracketEvaluatorTest, ExpandBracketReachesSignChange) {
  // Root at 100 lies outside the default [-50, 50] pair
  auto initial = psychro::solver::order_bracket(linear, -50.0, 50.0);
  ASSERT_TRUE(initial.has_value());
  ASSERT_FALSE(initial->has_sign_change());

  auto expanded = psychro::solver::expand_bracket(linear, *initial, SolverConfig{});
  ASSERT_TRUE(expanded.has_value());
  EXPECT_TRUE(expanded->has_sign_change());
  EXPECT_LE(std::min(expanded->a, expanded->b), 100.0);
  EXPECT_GE(std::max(expanded->a, expanded->b), 100.0);
}

TEST(BracketEvaluatorTest, ZeroSecondPointDivisorIsInvalid) {
  SolverConfig config;
  config.p2_divisor = 0;

  auto expanded = psychro::solver::expand_bracket(linear, Bracket{.a = -50.0, .fa = -150.0, .b = 50.0, .fb = -50.0},
                                                  config);
  ASSERT_FALSE(expanded.has_value());
  EXPECT_EQ(expanded.error().kind(), ErrorKind::InvalidArgument);
}

TEST(BracketEvaluatorTest, LinearExtrapolation) {
  // Line through (0, -1) and (2, 3) reaches 0 at x = 0.5
  EXPECT_DOUBLE_EQ(psychro::solver::linear_extrapolation(0.0, -1.0, 2.0, 3.0, 0.0), 0.5);
  EXPECT_DOUBLE_EQ(psychro::solver::linear_extrapolation(0.0, -1.0, 2.0, 3.0, 1.0), 1.0);
}
