#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include "toymd/toymd.hpp"
#include "utils.h"

using namespace toymd;


TEST(SystemTest, StoresParticlesInInsertionOrder) {
	const auto sys = make_pair_system(NoPotential(), {1, 2, 3}, {4, 5, 6}, {1, 0, 0}, {0, 1, 0}, 1.0, 2.0);

	ASSERT_EQ(sys.size(), 2u);
	EXPECT_EQ(sys.dimensions(), 3);
	EXPECT_EQ(sys.time(), 0.0);
	EXPECT_EQ(sys.step(), 0u);

	EXPECT_EQ(sys.position(0), vec3(1, 2, 3));
	EXPECT_EQ(sys.velocity(1), vec3(0, 1, 0));
	EXPECT_EQ(sys.mass(1), 2.0);
	EXPECT_EQ(sys.force(0), vec3(0, 0, 0));

	const env::ParticleView p = sys.view_id(1);
	EXPECT_EQ(p.position, vec3(4, 5, 6));
	EXPECT_EQ(p.mass, 2.0);
}

TEST(SystemTest, IdLookup) {
	auto sys = make_pair_system(NoPotential(), {0, 0, 0}, {1, 0, 0});

	EXPECT_TRUE(sys.contains(1));
	EXPECT_FALSE(sys.contains(2));
	EXPECT_EQ(sys.index_of(1), 1u);
	EXPECT_THROW((void)sys.index_of(99), std::out_of_range);

	sys.at_id(0).velocity = {1, 2, 3};
	EXPECT_EQ(sys.velocity(0), vec3(1, 2, 3));
}

TEST(SystemTest, ForEachParticle) {
	auto sys = make_pair_system(NoPotential(), {0, 0, 0}, {1, 0, 0});

	sys.for_each_particle([](auto p) { p.velocity = p.position * 2.0; });
	EXPECT_EQ(sys.velocity(1), vec3(2, 0, 0));

	double mass = 0;
	std::as_const(sys).for_each_particle([&](const env::ParticleView & p) { mass += p.mass; });
	EXPECT_EQ(mass, 2.0);
}

TEST(SystemTest, PairForceAndNewtonsThirdLaw) {
	auto sys = make_pair_system(LennardJones(1.0, 1.0), {0, 0, 0}, {1.0, 0, 0});
	sys.update_forces();

	EXPECT_NEAR(sys.force(0).x, -24.0, 1e-12);
	EXPECT_NEAR(sys.force(1).x, 24.0, 1e-12);
	EXPECT_EQ(sys.force(0).y, 0.0);
	EXPECT_EQ(sys.force(1) + sys.force(0), vec3(0, 0, 0));
}

TEST(SystemTest, ForcesVanishAtEquilibrium) {
	const LennardJones lj(1.0, 1.0);
	auto sys = make_pair_system(lj, {0, 0, 0}, {0, lj.equilibrium_distance(), 0});
	sys.update_forces();

	EXPECT_NEAR(sys.force(0).norm(), 0.0, 1e-12);
	EXPECT_NEAR(sys.potential_energy(), -1.0, 1e-12);
}

TEST(SystemTest, CutoffSkipsDistantPairs) {
	Environment env (LennardJones(1.0, 1.0, 2.0));
	env.add_particle({0, 0, 0}, {}, 1.0);
	env.add_particle({1.5, 0, 0}, {}, 1.0);
	env.add_particle({10, 0, 0}, {}, 1.0);
	auto sys = build_system(env);
	sys.update_forces();

	EXPECT_EQ(sys.force(2), vec3(0, 0, 0));
	EXPECT_NE(sys.force(0), vec3(0, 0, 0));
	EXPECT_NEAR(sys.potential_energy(), potential::pair_energy(LennardJones(1.0, 1.0), 1.5), 1e-15);
}

TEST(SystemTest, ForcesEqualNegativeEnergyGradient) {
	Environment env (LennardJones(1.0, 1.0).with_energy_shift());
	env.add_particles(ParticleCuboid().at(0.05, -0.1, 0.02).count(2, 2, 2).spacing(1.15));
	env.add_particle({0.6, 0.55, 0.5}, {}, 1.0);
	auto sys = build_system(env);
	sys.update_forces();

	const std::vector<vec3> grad = sys.potential_energy_gradient();
	ASSERT_EQ(grad.size(), sys.size());

	for (size_t i = 0; i < sys.size(); ++i) {
		EXPECT_NEAR(grad[i].x, -sys.force(i).x, 1e-9) << "particle " << i;
		EXPECT_NEAR(grad[i].y, -sys.force(i).y, 1e-9) << "particle " << i;
		EXPECT_NEAR(grad[i].z, -sys.force(i).z, 1e-9) << "particle " << i;
	}

	EXPECT_LT(max_abs_force_sum(sys), 1e-9);
}

TEST(SystemTest, CoincidentParticlesThrowOnForceUpdate) {
	auto sys = make_pair_system(Harmonic(1.0, 1.0), {0, 0, 0}, {1, 0, 0});
	sys.position(1) = sys.position(0);

	try {
		sys.update_forces();
		FAIL() << "expected std::domain_error";
	} catch (const std::domain_error & e) {
		EXPECT_THAT(e.what(), testing::HasSubstr("particles 0 and 1"));
	}
}

TEST(SystemTest, CoincidentParticlesThrowOnEnergyGradient) {
	auto sys = make_pair_system(Harmonic(1.0, 1.0), {0, 0, 0}, {1, 0, 0});
	sys.position(1) = sys.position(0);

	try {
		(void)sys.potential_energy_gradient();
		FAIL() << "expected std::domain_error";
	} catch (const std::domain_error & e) {
		EXPECT_THAT(e.what(), testing::HasSubstr("particles 0 and 1"));
	}
}

TEST(SystemTest, Observables) {
	const auto sys = make_pair_system(NoPotential(), {1, 0, 0}, {-1, 0, 0}, {0, 1, 0}, {0, -1, 0}, 1.0, 3.0);

	EXPECT_DOUBLE_EQ(sys.kinetic_energy(), 0.5 * 1 + 0.5 * 3);
	EXPECT_EQ(sys.potential_energy(), 0.0);
	EXPECT_DOUBLE_EQ(sys.total_energy(), 2.0);
	EXPECT_DOUBLE_EQ(sys.total_mass(), 4.0);

	EXPECT_EQ(sys.momentum(), vec3(0, -2, 0));
	EXPECT_EQ(sys.center_of_mass(), vec3(-0.5, 0, 0));
	EXPECT_EQ(sys.center_of_mass_velocity(), vec3(0, -0.5, 0));

	// L = sum r x m v = (1,0,0)x(0,1,0) + (-1,0,0)x(0,-3,0) = (0,0,1) + (0,0,3)
	EXPECT_EQ(sys.angular_momentum(), vec3(0, 0, 4));

	// relative velocities: +1.5 and -0.5 in y
	EXPECT_DOUBLE_EQ(sys.temperature(), (1 * 1.5 * 1.5 + 3 * 0.5 * 0.5) / (3.0 * 2));
}

TEST(SystemTest, RemoveDrift) {
	auto sys = make_pair_system(NoPotential(), {0, 0, 0}, {1, 0, 0}, {2, 0, 0}, {4, 1, 0}, 1.0, 1.0);
	const double temperature = sys.temperature();

	sys.remove_drift();

	EXPECT_NEAR(sys.momentum().norm(), 0.0, 1e-15);
	EXPECT_EQ(sys.velocity(0), vec3(-1, -0.5, 0));
	EXPECT_DOUBLE_EQ(sys.temperature(), temperature);
}

TEST(SystemTest, TimeBookkeeping) {
	auto sys = make_pair_system(NoPotential(), {0, 0, 0}, {1, 0, 0});
	sys.update_time(0.5);
	sys.increment_step();
	EXPECT_EQ(sys.time(), 0.5);
	EXPECT_EQ(sys.step(), 1u);

	const auto ctx = sys.context();
	EXPECT_EQ(ctx.time(), 0.5);
	EXPECT_EQ(ctx.size(), 2u);

	sys.reset_time();
	EXPECT_EQ(sys.time(), 0.0);
	EXPECT_EQ(sys.step(), 0u);
}
