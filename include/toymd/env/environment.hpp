#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "toymd/base/types.hpp"
#include "toymd/env/particle.hpp"
#include "toymd/env/generators.hpp"
#include "toymd/potentials/potential.hpp"


namespace toymd::env {

	// Declarative description of a run: which potential, which particles and how the
	// initial state is prepared. Turned into a core::System by core::build_system.
	template<potential::IsPotential P>
	class Environment {
	public:
		using potential_t = P;

		explicit Environment(P pot) : pair_potential(std::move(pot)) {}

		// ---------
		// PARTICLES
		// ---------
		void add_particle(const vec3& position, const vec3& velocity, const double mass,
						  const std::optional<ParticleID> id = std::nullopt) {
			Particle p;
			p.id = id;
			p.position = position;
			p.velocity = velocity;
			p.mass = mass;
			particle_list.push_back(p);
		}

		void add_particle(const Particle & particle) {
			particle_list.push_back(particle);
		}

		void add_particles(const std::vector<Particle> & particles) {
			particle_list.insert(particle_list.end(), particles.begin(), particles.end());
		}

		template<IsParticleGenerator G>
		void add_particles(const G & generator) {
			add_particles(generator.to_particles());
		}


		// -------------
		// RUN SETTINGS
		// -------------
		// number of spatial dimensions that carry thermal motion; used for temperature
		void set_dimensions(const uint8_t d) noexcept {
			num_dimensions = d;
		}

		// draw Maxwell-Boltzmann velocities at this temperature (k_B = 1) during build
		void set_temperature(const double t) noexcept {
			init_temperature = t;
		}

		void set_seed(const uint64_t s) noexcept {
			random_seed = s;
		}


		// ---------------
		// FLUENT BUILDERS
		// ---------------
		Environment& with_particle(const vec3& position, const vec3& velocity, const double mass,
								   const std::optional<ParticleID> id = std::nullopt) {
			add_particle(position, velocity, mass, id);
			return *this;
		}

		Environment& with_particle(const Particle & particle) {
			add_particle(particle);
			return *this;
		}

		Environment& with_particles(const std::vector<Particle> & particles) {
			add_particles(particles);
			return *this;
		}

		template<IsParticleGenerator G>
		Environment& with_particles(const G & generator) {
			add_particles(generator);
			return *this;
		}

		Environment& with_dimensions(const uint8_t d) noexcept {
			set_dimensions(d);
			return *this;
		}

		Environment& with_temperature(const double t) noexcept {
			set_temperature(t);
			return *this;
		}

		Environment& with_seed(const uint64_t s) noexcept {
			set_seed(s);
			return *this;
		}


		// ---------
		// ACCESSORS
		// ---------
		[[nodiscard]] const P& potential() const noexcept { return pair_potential; }
		[[nodiscard]] const std::vector<Particle>& particles() const noexcept { return particle_list; }
		[[nodiscard]] uint8_t dimensions() const noexcept { return num_dimensions; }
		[[nodiscard]] std::optional<double> temperature() const noexcept { return init_temperature; }
		[[nodiscard]] uint64_t seed() const noexcept { return random_seed; }

	private:
		P pair_potential;
		std::vector<Particle> particle_list;
		uint8_t num_dimensions = 3;
		std::optional<double> init_temperature;
		uint64_t random_seed = 42;
	};

} // namespace toymd::env
