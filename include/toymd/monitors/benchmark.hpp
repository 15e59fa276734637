#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <vector>

#include "toymd/math/statistics.hpp"
#include "toymd/monitors/monitor.hpp"

namespace toymd::monitor {

	// Wall clock time of every integration step. The report goes to the stream on finalize.
	class Benchmark : public Monitor {
	public:
		explicit Benchmark(std::ostream & stream = std::cout) : Monitor(shared::Trigger::always()), out(&stream) {}

		void initialize() {
			run_started = Clock::now();
			timings.clear();
			timings.reserve(num_steps);
			particle_updates = 0;
		}

		template<class S>
		void before_step(const core::SystemContext<S> & sys) {
			particle_updates += sys.size();
			step_started = Clock::now();
		}

		template<class S>
		void record(const core::SystemContext<S> &) {
			timings.push_back(std::chrono::duration<double>(Clock::now() - step_started).count());
		}

		void finalize();

		[[nodiscard]] const std::vector<double>& step_timings() const noexcept { return timings; }

		// statistics of the step timings, throws std::invalid_argument before the first step
		[[nodiscard]] math::Summary summary() const { return math::summarize(timings); }

	private:
		using Clock = std::chrono::steady_clock;

		std::ostream * out;
		Clock::time_point run_started;
		Clock::time_point step_started;
		std::vector<double> timings;
		uint64_t particle_updates = 0;
	};

}
