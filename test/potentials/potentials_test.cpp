#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

#include "toymd/toymd.hpp"

using namespace toymd;
using potential::evaluate;
using potential::pair_energy;
using potential::pair_force;

static_assert(potential::IsPotential<LennardJones>);
static_assert(potential::IsPotential<Morse>);
static_assert(potential::IsPotential<Harmonic>);
static_assert(potential::IsPotential<InverseDistance>);
static_assert(potential::IsPotential<NoPotential>);


TEST(LennardJonesTest, EnergyAndDerivative) {
	const LennardJones lj(2.0, 1.5);

	for (const double r : {1.2, 1.5, 1.8, 3.0}) {
		const double sr6 = std::pow(1.5 / r, 6);
		const double u = 4 * 2.0 * (sr6 * sr6 - sr6);
		const double du = 4 * 2.0 * (-12 * sr6 * sr6 + 6 * sr6) / r;

		const auto term = evaluate(lj, r);
		EXPECT_NEAR(term.energy, u, 1e-10) << "r=" << r;
		EXPECT_NEAR(term.derivative, du, 1e-10) << "r=" << r;
	}
}

TEST(LennardJonesTest, MinimumAtEquilibriumDistance) {
	const LennardJones lj(1.0, 1.0);
	const double r_min = lj.equilibrium_distance();

	EXPECT_NEAR(r_min, std::pow(2.0, 1.0 / 6.0), 1e-14);
	EXPECT_NEAR(evaluate(lj, r_min).derivative, 0.0, 1e-12);
	EXPECT_NEAR(pair_energy(lj, r_min), -1.0, 1e-12);
}

TEST(LennardJonesTest, DefaultCutoffIsThreeSigma) {
	const LennardJones lj(1.0, 1.1);
	EXPECT_TRUE(lj.has_cutoff());
	EXPECT_DOUBLE_EQ(lj.cutoff(), 3.3);
	EXPECT_DOUBLE_EQ(lj.cutoff2(), 3.3 * 3.3);

	const LennardJones wide(1.0, 1.0, potential::no_cutoff);
	EXPECT_FALSE(wide.has_cutoff());
}

TEST(LennardJonesTest, PairForceDirection) {
	const LennardJones lj(1.0, 1.0);

	// j sits at +x and inside the repulsive core: i is pushed towards -x
	const vec3 f_rep = pair_force(lj, vec3(1.0, 0, 0));
	EXPECT_NEAR(f_rep.x, -24.0, 1e-12);
	EXPECT_EQ(f_rep.y, 0.0);

	// beyond the minimum i is pulled towards j
	const vec3 f_att = pair_force(lj, vec3(0, 1.5, 0));
	EXPECT_GT(f_att.y, 0.0);
}

TEST(MorseTest, EnergyAndDerivative) {
	const Morse morse(3.0, 1.2, 1.0);

	EXPECT_NEAR(pair_energy(morse, 1.0), -3.0, 1e-14);
	EXPECT_FALSE(morse.has_cutoff());

	for (const double r : {0.8, 1.3, 2.5}) {
		const double e = std::exp(-1.2 * (r - 1.0));
		const double u = 3.0 * ((1 - e) * (1 - e) - 1);
		const double du = 2 * 3.0 * 1.2 * e * (1 - e);

		const auto term = evaluate(morse, r);
		EXPECT_NEAR(term.energy, u, 1e-12);
		EXPECT_NEAR(term.derivative, du, 1e-12);
	}
}

TEST(HarmonicTest, EnergyAndDerivative) {
	const Harmonic spring(4.0, 1.0);
	const auto term = evaluate(spring, 1.5);
	EXPECT_DOUBLE_EQ(term.energy, 0.5 * 4.0 * 0.25);
	EXPECT_DOUBLE_EQ(term.derivative, 2.0);

	// stretched spring pulls i towards j
	const vec3 f = pair_force(spring, vec3(0, 0, 2.0));
	EXPECT_DOUBLE_EQ(f.z, 4.0);
}

TEST(InverseDistanceTest, GravityIsAttractive) {
	const InverseDistance gravity(-2.0);
	const auto term = evaluate(gravity, 2.0);
	EXPECT_DOUBLE_EQ(term.energy, -1.0);
	EXPECT_DOUBLE_EQ(term.derivative, 0.5);

	const vec3 f = pair_force(gravity, vec3(-2.0, 0, 0));
	EXPECT_DOUBLE_EQ(f.x, -0.5);
}

TEST(NoPotentialTest, NoForce) {
	const NoPotential none;
	EXPECT_EQ(pair_energy(none, 0.5), 0.0);
	EXPECT_EQ(pair_force(none, vec3(1, 2, 3)), vec3(0, 0, 0));
}

TEST(CustomPotentialTest, GenericLambda) {
	const Custom soft([](const auto r) { return 1.0 / (r * r); });
	static_assert(potential::IsPotential<std::remove_cvref_t<decltype(soft)>>);

	const auto term = evaluate(soft, 2.0);
	EXPECT_DOUBLE_EQ(term.energy, 0.25);
	EXPECT_DOUBLE_EQ(term.derivative, -0.25);

	const Custom with_cut([](const auto r) { return r * r; }, 1.0);
	EXPECT_EQ(pair_energy(with_cut, 1.5), 0.0);
}

TEST(PotentialTest, CutoffExcludesOnlyLargerDistances) {
	const LennardJones lj(1.0, 1.0, 2.0);

	EXPECT_NE(pair_energy(lj, 2.0), 0.0);
	EXPECT_EQ(pair_energy(lj, 2.0 + 1e-12), 0.0);
	EXPECT_EQ(pair_force(lj, vec3(0, 2.5, 0)), vec3(0, 0, 0));
}

TEST(PotentialTest, EnergyShift) {
	const LennardJones lj = LennardJones(1.0, 1.0).with_energy_shift();
	EXPECT_TRUE(lj.is_shifted());
	EXPECT_NEAR(pair_energy(lj, lj.cutoff()), 0.0, 1e-15);

	// forces do not change
	const LennardJones plain(1.0, 1.0);
	EXPECT_DOUBLE_EQ(evaluate(lj, 1.3).derivative, evaluate(plain, 1.3).derivative);
	EXPECT_NEAR(pair_energy(lj, 1.3), pair_energy(plain, 1.3) - plain.energy(3.0), 1e-15);

	// a later cutoff change keeps the shift consistent
	const LennardJones moved = lj.with_cutoff(2.5);
	EXPECT_NEAR(pair_energy(moved, 2.5), 0.0, 1e-15);
}

TEST(PotentialTest, InvalidModifiersThrow) {
	EXPECT_THROW((void)Morse(1, 1, 1).with_energy_shift(), std::logic_error);
	EXPECT_THROW((void)LennardJones(1, 1).with_cutoff(-1.0), std::invalid_argument);
	EXPECT_THROW((void)LennardJones(1, 1).with_cutoff(0.0), std::invalid_argument);
}

TEST(PotentialTest, ZeroSeparationThrows) {
	EXPECT_THROW((void)evaluate(LennardJones(1, 1), 0.0), std::domain_error);
	EXPECT_THROW((void)pair_force(InverseDistance(1.0), vec3{}), std::domain_error);
}
