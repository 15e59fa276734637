#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

#include "toymd/toymd.hpp"
#include "orbit_monitor.h"
#include "utils.h"

using namespace toymd;


TEST(SymplecticEulerTest, SingleStepKickThenDrift) {
	auto system = make_pair_system(Harmonic(1.0, 1.0), {-1, 0, 0}, {1, 0, 0});

	SymplecticEuler integrator(system);
	integrator.run_for_steps(0.1, 1);

	EXPECT_NEAR(system.velocity(0).x, 0.1, 1e-15);
	EXPECT_NEAR(system.position(0).x, -0.99, 1e-15);
	EXPECT_NEAR(system.position(1).x, 0.99, 1e-15);
	EXPECT_NEAR(system.force(0).x, 0.98, 1e-14);
}

TEST(SymplecticEulerTest, OscillatorEnergyStaysBounded) {
	auto system = make_pair_system(Harmonic(1.0, 1.0), {-0.6, 0, 0}, {0.6, 0, 0});

	SymplecticEuler integrator(system, monitors<EnergyMonitor>);
	integrator.add_monitor(EnergyMonitor());
	integrator.run_for_duration(0.01, 50.0);

	// the error oscillates with amplitude of order omega dt but does not grow
	const auto & energy = integrator.monitors<EnergyMonitor>()[0];
	EXPECT_LT(energy.max_relative_deviation(), 0.02);
}

TEST(SymplecticEulerTest, OrbitTest) {
	constexpr double R = 1;
	constexpr double M = 1.0;
	constexpr double m = 1e-10;
	const double v = std::sqrt(M / R);
	const double T = 2 * std::numbers::pi * R / v;

	auto system = make_pair_system(InverseDistance(-M * m), {0, 0, 0}, {0, R, 0}, {0, 0, 0}, {v, 0, 0}, M, m);

	SymplecticEuler integrator(system, OrbitMonitor(v, R, 1e-2));
	integrator.run_for_duration(0.001, T);

	EXPECT_NEAR(system.position(1).norm(), R, 1e-2);
}
