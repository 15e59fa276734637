#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "toymd/core/context.hpp"
#include "toymd/monitors/monitor.hpp"


namespace toymd::monitor {

	struct EnergySample {
		size_t step;
		double time;
		double kinetic;
		double potential;

		[[nodiscard]] double total() const noexcept { return kinetic + potential; }
	};


	// Energy time series of a run. The state before the first step is sampled on
	// initialize, every triggered step afterwards. Each run starts a new series.
	class EnergyMonitor final : public Monitor {
	public:
		explicit EnergyMonitor(shared::Trigger trig = shared::Trigger::always(), std::string csv_path = "")
			: Monitor(std::move(trig)), csv_file(std::move(csv_path)) {}

		template<class S>
		void initialize(const core::SystemContext<S> & sys) {
			history.clear();
			history.reserve(num_steps + 1);
			sample(sys);
		}

		template<class S>
		void record(const core::SystemContext<S> & sys) {
			sample(sys);
		}

		// writes the series as csv if a path was given
		void finalize() const;

		[[nodiscard]] const std::vector<EnergySample>& samples() const noexcept { return history; }

		[[nodiscard]] double initial_energy() const;
		[[nodiscard]] double final_energy() const;

		// (E_last - E_0) / |E_0|, or E_last - E_0 if E_0 is zero
		[[nodiscard]] double relative_drift() const;

		// largest |E - E_0| / |E_0| over all samples, absolute if E_0 is zero
		[[nodiscard]] double max_relative_deviation() const;

	private:
		std::string csv_file;
		std::vector<EnergySample> history;

		template<class S>
		void sample(const core::SystemContext<S> & sys) {
			history.push_back({sys.step(), sys.time(), sys.kinetic_energy(), sys.potential_energy()});
		}

		[[nodiscard]] double deviation(double energy) const;
	};
}
