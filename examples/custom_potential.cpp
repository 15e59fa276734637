#include <toymd/toymd.hpp>
#include <cmath>
#include <iostream>

using namespace toymd;

// Screened Coulomb (Yukawa) potential given only as an energy, the force comes from
// automatic differentiation.
int main() {
	constexpr double kappa = 0.8;

	const auto yukawa = Custom([](auto r) {
		using std::exp;
		return exp(-kappa * r) / r;
	}, 6.0);

	// compare the derivative against the closed form
	for (const double r : {0.5, 1.0, 2.0, 4.0}) {
		const double exact = -std::exp(-kappa * r) * (1 + kappa * r) / (r * r);
		std::cout << "r = " << r
		          << "  dU/dr = " << derivative([&](auto x) { return yukawa.energy(x); }, r)
		          << "  exact = " << exact << "\n";
	}

	auto cube = ParticleCuboid()
		.count({3, 3, 3})
		.spacing(1.5)
		.mass(1.0);

	auto system = build_system(Environment(yukawa)
		.with_particles(cube)
		.with_temperature(0.05)
		.with_seed(1));

	VelocityVerlet integrator(system, TerminalOutput(Trigger::every(200)));
	integrator.run_for_duration(0.005, 10);
}
