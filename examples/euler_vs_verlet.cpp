#include <toymd/toymd.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using namespace toymd;
namespace fs = std::filesystem;

// The same Lennard-Jones dimer integrated with all four schemes. Energy series go to csv.

namespace {
	constexpr double dt = 0.005;
	constexpr double duration = 50;

	auto make_dimer() {
		return build_system(Environment(LennardJones(1.0, 1.0))
			.with_particle({0.0, 0.0, 0.0}, {}, 1.0)
			.with_particle({1.5, 0.0, 0.0}, {}, 1.0));
	}

	EnergyMonitor energy_log(const fs::path & dir_path, const std::string & name) {
		return EnergyMonitor(Trigger::every(10), (dir_path / (name + ".csv")).string());
	}

	template<class I>
	void run_and_report(const std::string & name, I & integrator) {
		integrator.run_for_duration(dt, duration);

		const auto & energy = integrator.template monitors<EnergyMonitor>()[0];
		std::cout << std::left << std::setw(18) << name
		          << std::setw(16) << energy.relative_drift()
		          << energy.max_relative_deviation() << "\n";
	}
}

int main() {
	const auto dir_path = fs::path(PROJECT_SOURCE_DIR) / "output/euler_vs_verlet";
	remove_all(dir_path);
	create_directories(dir_path);

	std::cout << std::left << std::setw(18) << "integrator"
	          << std::setw(16) << "drift" << "max deviation" << "\n";

	auto euler_system = make_dimer();
	ForwardEuler euler(euler_system, energy_log(dir_path, "forward_euler"));
	run_and_report("forward_euler", euler);

	auto symplectic_system = make_dimer();
	SymplecticEuler symplectic(symplectic_system, energy_log(dir_path, "symplectic_euler"));
	run_and_report("symplectic_euler", symplectic);

	auto verlet_system = make_dimer();
	VelocityVerlet verlet(verlet_system, energy_log(dir_path, "velocity_verlet"));
	run_and_report("velocity_verlet", verlet);

	auto yoshida_system = make_dimer();
	Yoshida4 yoshida(yoshida_system, energy_log(dir_path, "yoshida4"));
	run_and_report("yoshida4", yoshida);
}
