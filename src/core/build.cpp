#include "toymd/core/build.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_set>

#include "toymd/math/distributions.hpp"


namespace toymd::core::internal {

	namespace {
		bool is_finite(const vec3 & v) {
			return v.all([](const double x) { return std::isfinite(x); });
		}

		std::string describe(const env::Particle & p, const size_t index) {
			return "particle #" + std::to_string(index) +
				(p.id.has_value() ? " (id " + std::to_string(p.id.value()) + ")" : "");
		}
	}


	void validate_settings(const uint8_t dimensions, const std::optional<double> temperature) {
		if (dimensions < 1 || dimensions > 3) {
			throw std::invalid_argument(
				"number of dimensions must be 1, 2 or 3. Got: " + std::to_string(dimensions)
			);
		}

		if (temperature.has_value() && !(temperature.value() >= 0.0 && std::isfinite(temperature.value()))) {
			throw std::invalid_argument(
				"initial temperature must be finite and non-negative. Got: " + std::to_string(temperature.value())
			);
		}
	}


	void validate_particles(const std::vector<env::Particle> & particles) {
		if (particles.empty()) {
			throw std::invalid_argument("Environment contains no particles");
		}

		std::unordered_set<ParticleID> seen_ids;
		for (size_t i = 0; i < particles.size(); ++i) {
			const env::Particle & p = particles[i];

			if (!(p.mass > 0.0) || !std::isfinite(p.mass)) {
				throw std::invalid_argument(
					describe(p, i) + " has invalid mass " + std::to_string(p.mass) + ". Mass must be positive."
				);
			}
			if (!is_finite(p.position)) {
				throw std::invalid_argument(describe(p, i) + " has a non-finite position " + p.position.to_string());
			}
			if (!is_finite(p.velocity)) {
				throw std::invalid_argument(describe(p, i) + " has a non-finite velocity " + p.velocity.to_string());
			}
			if (p.id.has_value() && !seen_ids.insert(p.id.value()).second) {
				throw std::invalid_argument("Found duplicate particle id " + std::to_string(p.id.value()));
			}
		}

		// check for overlapping particles: sort lexicographically, then compare neighbours
		std::vector<size_t> order(particles.size());
		std::iota(order.begin(), order.end(), 0);
		auto key = [&](const size_t i) {
			const vec3 & x = particles[i].position;
			return std::tuple(x.x, x.y, x.z);
		};
		std::ranges::sort(order, [&](const size_t a, const size_t b) { return key(a) < key(b); });

		for (size_t k = 1; k < order.size(); ++k) {
			if (particles[order[k]].position == particles[order[k-1]].position) {
				throw std::invalid_argument(
					describe(particles[order[k-1]], order[k-1]) + " and " +
					describe(particles[order[k]], order[k]) +
					" share the position " + particles[order[k]].position.to_string()
				);
			}
		}
	}


	void assign_ids(std::vector<env::Particle> & particles) {
		ParticleID next_id = 0;
		for (const auto & p : particles) {
			if (p.id.has_value()) {
				next_id = std::max(next_id, static_cast<ParticleID>(p.id.value() + 1));
			}
		}

		for (auto & p : particles) {
			if (!p.id.has_value()) {
				p.id = next_id++;
			}
		}
	}


	void apply_thermal_velocities(std::vector<env::Particle> & particles, const double temperature,
								  const uint8_t dimensions, const uint64_t seed) {
		math::RandomEngine engine(seed);

		std::vector<vec3> thermal;
		thermal.reserve(particles.size());

		vec3 momentum{};
		double total_mass = 0.0;
		for (const auto & p : particles) {
			const double sigma = std::sqrt(temperature / p.mass);
			thermal.push_back(math::maxwell_boltzmann_velocity(sigma, dimensions, engine));
			momentum += p.mass * thermal.back();
			total_mass += p.mass;
		}

		const vec3 drift = momentum / total_mass;
		for (size_t i = 0; i < particles.size(); ++i) {
			particles[i].velocity += thermal[i] - drift;
		}
	}

} // namespace toymd::core::internal
