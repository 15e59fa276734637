#include "toymd/math/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>


namespace toymd::math {

	Summary summarize(const std::vector<double> & samples) {
		if (samples.empty()) {
			throw std::invalid_argument("cannot summarize an empty sample");
		}

		Summary s;
		s.count = samples.size();

		// sort a copy to find median without altering the callers order
		std::vector<double> sorted = samples;
		std::ranges::sort(sorted);

		s.min = sorted.front();
		s.max = sorted.back();
		s.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(s.count);

		const size_t mid = s.count / 2;
		s.median = s.count % 2 == 0 ? 0.5 * (sorted[mid - 1] + sorted[mid]) : sorted[mid];

		double variance_accum = 0.0;
		for (const double x : samples) {
			variance_accum += (x - s.mean) * (x - s.mean);
		}
		s.std_dev = std::sqrt(variance_accum / static_cast<double>(s.count));

		return s;
	}

} // namespace toymd::math
