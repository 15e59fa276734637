#include <toymd/toymd.hpp>
#include <filesystem>
#include <iostream>
#include <numbers>

using namespace toymd;
namespace fs = std::filesystem;

// Light planet on a circular orbit around a heavy star, G = 1.
int main() {
	const auto dir_path = fs::path(PROJECT_SOURCE_DIR) / "output/two_body_orbit";
	remove_all(dir_path);
	create_directories(dir_path);

	constexpr double m_star = 1.0;
	constexpr double m_planet = 1.0e-3;

	const auto env = Environment(InverseDistance(-m_star * m_planet))
		.with_particle({0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, m_star)
		.with_particle({1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, m_planet);

	auto system = build_system(env);

	// ten periods
	const double duration = 10 * 2 * std::numbers::pi;

	Yoshida4 integrator(system, monitors<XyzOutput, EnergyMonitor, ProgressBar>);
	integrator
		.with_monitor(XyzOutput(Trigger::every(20), (dir_path / "orbit.xyz").string()))
		.with_monitor(EnergyMonitor(Trigger::every(20), (dir_path / "energy.csv").string()))
		.with_monitor(ProgressBar(Trigger::every(100)))
		.run_for_duration(0.01, duration);

	const auto & energy = integrator.monitors<EnergyMonitor>()[0];
	const vec3 r = system.position(1) - system.position(0);

	std::cout << "\nfinal radius:          " << r.norm() << "\n"
	          << "relative energy drift: " << energy.relative_drift() << "\n";
}
