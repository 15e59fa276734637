#pragma once

#include <cstdint>
#include <optional>
#include <ankerl/unordered_dense.h>
#include <vector>

#include "toymd/base/types.hpp"
#include "toymd/env/particle.hpp"
#include "toymd/env/environment.hpp"
#include "toymd/core/system.hpp"


namespace toymd::core {

	struct BuildInfo {
		size_t particle_count = 0;
		ankerl::unordered_dense::map<ParticleID, size_t> id_map;  // particle id -> index in the system
	};

	namespace internal {
		// all validators throw std::invalid_argument
		void validate_particles(const std::vector<env::Particle> & particles);
		void validate_settings(uint8_t dimensions, std::optional<double> temperature);

		// give every particle without explicit id one, counting up from the largest explicit id
		void assign_ids(std::vector<env::Particle> & particles);

		// add Maxwell-Boltzmann velocities at the given temperature; the centre of mass
		// drift they introduce is removed again
		void apply_thermal_velocities(std::vector<env::Particle> & particles, double temperature,
									  uint8_t dimensions, uint64_t seed);
	}


	template <potential::IsPotential P>
	System<P> build_system(const env::Environment<P> & environment, BuildInfo * build_info) {
		std::vector<env::Particle> particles = environment.particles();

		internal::validate_settings(environment.dimensions(), environment.temperature());
		internal::validate_particles(particles);
		internal::assign_ids(particles);

		if (environment.temperature().has_value() && environment.temperature().value() > 0.0) {
			internal::apply_thermal_velocities(
				particles, environment.temperature().value(), environment.dimensions(), environment.seed()
			);
		}

		if (build_info) {
			build_info->particle_count = particles.size();
			build_info->id_map.clear();
			for (size_t i = 0; i < particles.size(); ++i) {
				build_info->id_map[particles[i].id.value()] = i;
			}
		}

		return System<P>(environment.potential(), particles, environment.dimensions());
	}

} // namespace toymd::core
