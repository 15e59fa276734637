#pragma once
#include <cstddef>
#include <vector>


namespace toymd::math {

	struct Summary {
		size_t count = 0;
		double min = 0;
		double max = 0;
		double mean = 0;
		double median = 0;
		double std_dev = 0;
	};

	// throws std::invalid_argument on an empty sample
	Summary summarize(const std::vector<double> & samples);

} // namespace toymd::math
