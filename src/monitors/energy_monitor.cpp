#include "toymd/monitors/energy_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>


namespace toymd::monitor {

	void EnergyMonitor::finalize() const {
		namespace fs = std::filesystem;
		if (csv_file.empty()) return;

		const fs::path path(csv_file);
		if (path.has_parent_path()) {
			fs::create_directories(path.parent_path());
		}

		std::ofstream out(path);
		if (!out) throw std::runtime_error("Failed to create energy file: " + path.string());

		out.precision(std::numeric_limits<double>::max_digits10);
		out << "step,time,kinetic,potential,total\n";
		for (const auto & s : history) {
			out << s.step << ',' << s.time << ',' << s.kinetic << ',' << s.potential << ',' << s.total() << '\n';
		}
	}

	double EnergyMonitor::initial_energy() const {
		if (history.empty()) {
			throw std::logic_error("energy monitor has no samples; run an integrator first");
		}
		return history.front().total();
	}

	double EnergyMonitor::final_energy() const {
		if (history.empty()) {
			throw std::logic_error("energy monitor has no samples; run an integrator first");
		}
		return history.back().total();
	}

	double EnergyMonitor::relative_drift() const {
		return deviation(final_energy());
	}

	double EnergyMonitor::max_relative_deviation() const {
		double worst = 0.0;
		for (const auto & s : history) {
			worst = std::max(worst, std::abs(deviation(s.total())));
		}
		return worst;
	}

	double EnergyMonitor::deviation(const double energy) const {
		const double e0 = initial_energy();
		if (e0 == 0.0) return energy - e0;
		return (energy - e0) / std::abs(e0);
	}
}
