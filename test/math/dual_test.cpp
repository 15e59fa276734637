#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

#include "toymd/math/dual.hpp"

using namespace toymd;
using D = math::Dual<double>;


TEST(DualTest, SeedAndConstants) {
	const D x = D::variable(2.0);
	EXPECT_EQ(x.value, 2.0);
	EXPECT_EQ(x.grad, 1.0);

	const D c = 5.0;
	EXPECT_EQ(c.value, 5.0);
	EXPECT_EQ(c.grad, 0.0);
}

TEST(DualTest, ArithmeticRules) {
	const D x = D::variable(3.0);

	const D sum = x + 2.0;
	EXPECT_DOUBLE_EQ(sum.value, 5.0);
	EXPECT_DOUBLE_EQ(sum.grad, 1.0);

	const D diff = 2.0 - x;
	EXPECT_DOUBLE_EQ(diff.value, -1.0);
	EXPECT_DOUBLE_EQ(diff.grad, -1.0);

	// product rule: d/dx x^3 = 3x^2
	const D cube = x * x * x;
	EXPECT_DOUBLE_EQ(cube.value, 27.0);
	EXPECT_DOUBLE_EQ(cube.grad, 27.0);

	// quotient rule: d/dx 1/x = -1/x^2
	const D inv = 1.0 / x;
	EXPECT_DOUBLE_EQ(inv.value, 1.0 / 3.0);
	EXPECT_DOUBLE_EQ(inv.grad, -1.0 / 9.0);

	D acc = x;
	acc *= x;
	acc += 1.0;
	acc /= 2.0;
	EXPECT_DOUBLE_EQ(acc.value, 5.0);
	EXPECT_DOUBLE_EQ(acc.grad, 3.0);
}

TEST(DualTest, ElementaryFunctions) {
	const double x0 = 0.7;
	const D x = D::variable(x0);

	EXPECT_DOUBLE_EQ(sqrt(x).grad, 0.5 / std::sqrt(x0));
	EXPECT_DOUBLE_EQ(exp(x).grad, std::exp(x0));
	EXPECT_DOUBLE_EQ(log(x).grad, 1.0 / x0);
	EXPECT_DOUBLE_EQ(sin(x).grad, std::cos(x0));
	EXPECT_DOUBLE_EQ(cos(x).grad, -std::sin(x0));
	EXPECT_DOUBLE_EQ(pow(x, 2.5).grad, 2.5 * std::pow(x0, 1.5));
	EXPECT_DOUBLE_EQ(pow(x, -6).grad, -6.0 * std::pow(x0, -7.0));
	EXPECT_DOUBLE_EQ(abs(-x).grad, 1.0);
}

TEST(DualTest, PowAtZero) {
	const D zero = D::variable(0.0);

	const D p0 = pow(zero, 0);
	EXPECT_EQ(p0.value, 1.0);
	EXPECT_EQ(p0.grad, 0.0);

	const D p1 = pow(zero, 1);
	EXPECT_EQ(p1.value, 0.0);
	EXPECT_EQ(p1.grad, 1.0);

	const D p2 = pow(zero, 2.0);
	EXPECT_EQ(p2.value, 0.0);
	EXPECT_EQ(p2.grad, 0.0);

	// the value stays finite even where the slope does not
	EXPECT_EQ(pow(zero, 0.5).value, 0.0);
	EXPECT_EQ(pow(D(0.0), 0.5).grad, 0.0);
}

TEST(DualTest, ChainRule) {
	// d/dx exp(sin(x)^2) = 2 sin(x) cos(x) exp(sin(x)^2)
	const double x0 = std::numbers::pi / 5;
	const D x = D::variable(x0);
	const D s = sin(x);
	const D y = exp(s * s);

	const double expected = 2 * std::sin(x0) * std::cos(x0) * std::exp(std::sin(x0) * std::sin(x0));
	EXPECT_NEAR(y.grad, expected, 1e-14);
}

TEST(DualTest, Comparisons) {
	const D a(1.0, 5.0);
	const D b(2.0, -1.0);

	EXPECT_TRUE(a < b);
	EXPECT_TRUE(b >= a);
	EXPECT_FALSE(a == D(1.0, 0.0));
	EXPECT_TRUE(a == D(1.0, 5.0));

	EXPECT_EQ(math::value_of(a), 1.0);
	EXPECT_EQ(math::value_of(3.0), 3.0);
	EXPECT_TRUE(math::is_dual_v<const D&>);
	EXPECT_FALSE(math::is_dual_v<double>);
}
