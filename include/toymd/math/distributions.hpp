#pragma once
#include <random>
#include <cstdint>

#include "toymd/base/types.hpp"

namespace toymd::math {

	using RandomEngine = std::mt19937_64;

	/**
	 * Generates a velocity vector according to the Maxwell-Boltzmann distribution.
	 * @param sigma Standard deviation per component (sqrt(kT/m))
	 * @param dimensions Number of active dimensions (1, 2, or 3)
	 * @param engine Random engine; callers own it so runs are reproducible from a seed
	 */
	inline vec3 maxwell_boltzmann_velocity(const double sigma, const size_t dimensions, RandomEngine & engine) {
		// when adding independent normally distributed values to all velocity components
		// the velocity change is maxwell boltzmann distributed
		std::normal_distribution dist{0.0, 1.0};

		vec3 velocity{0.0};
		for (size_t i = 0; i < dimensions && i < 3; ++i) {
			velocity[static_cast<int>(i)] = sigma * dist(engine);
		}
		return velocity;
	}

}
