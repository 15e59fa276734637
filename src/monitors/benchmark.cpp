#include "toymd/monitors/benchmark.hpp"

#include <iomanip>
#include <numeric>
#include <string>


namespace toymd::monitor {

	void Benchmark::finalize() {
		if (timings.empty()) return;

		const double wall_s = std::chrono::duration<double>(Clock::now() - run_started).count();
		const double stepping_s = std::accumulate(timings.begin(), timings.end(), 0.0);
		const math::Summary stats = summary();

		const double steps_per_s = stats.mean > 0 ? 1.0 / stats.mean : 0.0;
		const double mups = stepping_s > 0 ? static_cast<double>(particle_updates) / stepping_s / 1e6 : 0.0;

		const std::string rule(40, '-');
		std::ostream & os = *out;
		const auto flags = os.flags();
		const auto precision = os.precision();

		os << "\n" << rule << "\n"
		   << " toymd benchmark\n"
		   << rule << "\n";

		os << std::fixed << std::setprecision(5)
		   << "  steps:              " << stats.count << "\n"
		   << "  particle updates:   " << particle_updates << "\n"
		   << "  wall time:          " << wall_s << " s\n"
		   << "  stepping time:      " << stepping_s << " s\n"
		   << rule << "\n";

		os << std::setprecision(2)
		   << "  throughput:         " << steps_per_s << " steps/s\n"
		   << "  performance:        " << mups << " MUPS\n"
		   << rule << "\n";

		os << std::scientific << std::setprecision(3)
		   << "  step time mean:     " << stats.mean << " s\n"
		   << "  step time median:   " << stats.median << " s\n"
		   << "  step time min:      " << stats.min << " s\n"
		   << "  step time max:      " << stats.max << " s\n"
		   << "  step time std dev:  " << stats.std_dev << " s\n"
		   << rule << "\n\n";

		os.flags(flags);
		os.precision(precision);
	}

}
