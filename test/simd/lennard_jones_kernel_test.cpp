#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

#include "toymd/toymd.hpp"
#include "toymd/simd/lennard_jones_kernel.hpp"

using namespace toymd;


namespace {
	// owns the arrays ForceArrays points into
	struct Soa {
		std::vector<double> x, y, z, fx, fy, fz;

		explicit Soa(const size_t n) : x(n), y(n), z(n), fx(n), fy(n), fz(n) {}

		[[nodiscard]] simd::ForceArrays arrays() {
			return {x, y, z, fx, fy, fz};
		}
	};

	// jittered 3x3x3 lattice, 27 particles so the vector loop leaves a remainder
	Soa make_lattice() {
		std::mt19937 rng(42);
		std::uniform_real_distribution<double> jitter(-0.05, 0.05);

		Soa soa(27);
		size_t i = 0;
		for (int a = 0; a < 3; ++a)
			for (int b = 0; b < 3; ++b)
				for (int c = 0; c < 3; ++c, ++i) {
					soa.x[i] = 1.1 * a + jitter(rng);
					soa.y[i] = 1.1 * b + jitter(rng);
					soa.z[i] = 1.1 * c + jitter(rng);
				}
		return soa;
	}
}


TEST(LennardJonesKernelTest, SimdMatchesScalar) {
	const LennardJones lj(1.0, 1.0);

	Soa scalar = make_lattice();
	Soa wide = make_lattice();
	simd::lennard_jones_forces_scalar(scalar.arrays(), lj);
	simd::lennard_jones_forces(wide.arrays(), lj);

	for (size_t i = 0; i < scalar.x.size(); ++i) {
		EXPECT_NEAR(wide.fx[i], scalar.fx[i], 1e-9 * (1 + std::abs(scalar.fx[i])));
		EXPECT_NEAR(wide.fy[i], scalar.fy[i], 1e-9 * (1 + std::abs(scalar.fy[i])));
		EXPECT_NEAR(wide.fz[i], scalar.fz[i], 1e-9 * (1 + std::abs(scalar.fz[i])));
	}
}

TEST(LennardJonesKernelTest, MatchesSystemForces) {
	const LennardJones lj(1.0, 1.0, 2.5);
	Soa soa = make_lattice();

	Environment env (lj);
	for (size_t i = 0; i < soa.x.size(); ++i) {
		env.add_particle({soa.x[i], soa.y[i], soa.z[i]}, {}, 1.0);
	}
	auto system = build_system(env);
	system.update_forces();

	simd::lennard_jones_forces(soa.arrays(), lj);

	for (size_t i = 0; i < soa.x.size(); ++i) {
		const vec3 & f = system.force(i);
		EXPECT_NEAR(soa.fx[i], f.x, 1e-9 * (1 + std::abs(f.x)));
		EXPECT_NEAR(soa.fy[i], f.y, 1e-9 * (1 + std::abs(f.y)));
		EXPECT_NEAR(soa.fz[i], f.z, 1e-9 * (1 + std::abs(f.z)));
	}
}

TEST(LennardJonesKernelTest, ForcesSumToZero) {
	Soa soa = make_lattice();
	simd::lennard_jones_forces(soa.arrays(), LennardJones(1.0, 1.0));

	double sx = 0, sy = 0, sz = 0;
	for (size_t i = 0; i < soa.x.size(); ++i) {
		sx += soa.fx[i];
		sy += soa.fy[i];
		sz += soa.fz[i];
	}
	EXPECT_NEAR(sx, 0.0, 1e-9);
	EXPECT_NEAR(sy, 0.0, 1e-9);
	EXPECT_NEAR(sz, 0.0, 1e-9);
}

TEST(LennardJonesKernelTest, DimerForceIsAttractiveBeyondMinimum) {
	Soa soa(2);
	soa.x = {0.0, 1.5};
	simd::lennard_jones_forces(soa.arrays(), LennardJones(1.0, 1.0));

	EXPECT_GT(soa.fx[0], 0.0);
	EXPECT_DOUBLE_EQ(soa.fx[0], -soa.fx[1]);
	EXPECT_EQ(soa.fy[0], 0.0);
}

TEST(LennardJonesKernelTest, MismatchedLengthsThrow) {
	Soa soa(4);
	soa.fz.resize(3);
	EXPECT_THROW(simd::lennard_jones_forces(soa.arrays(), LennardJones(1.0, 1.0)), std::invalid_argument);
	EXPECT_THROW(simd::lennard_jones_forces_scalar(soa.arrays(), LennardJones(1.0, 1.0)), std::invalid_argument);
}
