#include <toymd/toymd.hpp>
#include <filesystem>

using namespace toymd;
namespace fs = std::filesystem;

int main() {
	const auto dir_path = fs::path(PROJECT_SOURCE_DIR) / "output/lj_cluster";
	remove_all(dir_path);
	create_directories(dir_path);

	auto cube = ParticleCuboid()
		.at({0, 0, 0})
		.count({5, 5, 5})
		.spacing(1.12)
		.mass(1.0);

	auto env = Environment(LennardJones(1.0, 1.0).with_energy_shift())
		.with_particles(cube)
		.with_temperature(0.1)
		.with_seed(7);

	auto system = build_system(env);

	VelocityVerlet integrator(system, monitors<TerminalOutput, XyzOutput, EnergyMonitor, Benchmark>);
	integrator
		.with_monitor(TerminalOutput(Trigger::every(500)))
		.with_monitor(XyzOutput(Trigger::every(50), (dir_path / "cluster.xyz").string(), "Ar"))
		.with_monitor(EnergyMonitor(Trigger::every(10), (dir_path / "energy.csv").string()))
		.with_monitor(Benchmark())
		.with_dt(0.002)
		.for_duration(10)
		.run();
}
