#pragma once
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <string>

#include "toymd/monitors/monitor.hpp"

namespace toymd::monitor {

	// Single redrawn line: bar, percentage, steps done and elapsed wall time.
	class ProgressBar : public Monitor {
	public:
		explicit ProgressBar(shared::Trigger trig = shared::Trigger::always(), std::ostream & stream = std::cout)
			: Monitor(std::move(trig)), out(&stream) {}

		template<class S>
		void initialize(const core::SystemContext<S> & sys) {
			first_step = sys.step();
			started = Clock::now();
			drawn = false;
		}

		template<class S>
		void record(const core::SystemContext<S> & sys) {
			if (num_steps == 0) return;

			const size_t done = sys.step() - first_step;
			const double fraction = static_cast<double>(done) / static_cast<double>(num_steps);
			const auto filled = static_cast<size_t>(bar_width * fraction);
			const double elapsed = std::chrono::duration<double>(Clock::now() - started).count();

			std::string bar(bar_width, ' ');
			for (size_t i = 0; i < bar_width; ++i) {
				if (i < filled) bar[i] = '=';
				else if (i == filled) bar[i] = '>';
			}

			*out << "\r[" << bar << "] "
				<< std::setw(3) << static_cast<int>(fraction * 100.0) << "% "
				<< done << "/" << num_steps << " steps, "
				<< std::fixed << std::setprecision(1) << elapsed << " s" << std::defaultfloat;
			out->flush();
			drawn = true;
		}

		// the bar is redrawn in place, so its line is only ended once the run is over
		void finalize() {
			if (drawn) {
				*out << "\n";
				out->flush();
			}
		}

	private:
		using Clock = std::chrono::steady_clock;
		static constexpr size_t bar_width = 50;

		std::ostream * out;
		size_t first_step = 0;
		Clock::time_point started{};
		bool drawn = false;
	};
}
