#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <ankerl/unordered_dense.h>
#include <utility>
#include <vector>

#include "toymd/base/types.hpp"
#include "toymd/base/debug.hpp"
#include "toymd/math/autodiff.hpp"
#include "toymd/env/particle.hpp"
#include "toymd/env/environment.hpp"
#include "toymd/potentials/potential.hpp"
#include "toymd/potentials/evaluate.hpp"
#include "toymd/core/context.hpp"


namespace toymd::core {
	struct BuildInfo;

	template <potential::IsPotential P>
	class System;

	template <potential::IsPotential P>
	System<P> build_system(const env::Environment<P> & environment, BuildInfo * build_info = nullptr);


	// Particle state of one simulation run, stored as separate arrays per quantity.
	// Forces come from a single pair potential summed over all particle pairs.
	template <potential::IsPotential P>
	class System final {
	public:
		using potential_t = P;
		using SysContext = SystemContext<System>;


		// -----------------
		// LIFECYCLE & STATE
		// -----------------
		[[nodiscard]] double time() const noexcept { return time_; }
		[[nodiscard]] size_t step() const noexcept { return step_; }

		void update_time(const double dt) noexcept { time_ += dt; }
		void increment_step() noexcept { ++step_; }
		void reset_time() noexcept { time_ = 0; step_ = 0; }

		[[nodiscard]] size_t size() const noexcept { return positions_.size(); }
		[[nodiscard]] uint8_t dimensions() const noexcept { return dims; }
		[[nodiscard]] const P& potential() const noexcept { return pair_potential; }


		// ------------------
		// PARTICLE ACCESSORS
		// ------------------
		// "at" implies mutable access, "view" implies read-only

		// INDEX ACCESSORS (fast)
		[[nodiscard]] ParticleID id(const size_t index) const { return ids_[index]; }
		[[nodiscard]] double mass(const size_t index) const { return masses_[index]; }

		[[nodiscard]] vec3& position(const size_t index) { return positions_[index]; }
		[[nodiscard]] vec3& velocity(const size_t index) { return velocities_[index]; }
		[[nodiscard]] vec3& force(const size_t index) { return forces_[index]; }
		[[nodiscard]] const vec3& position(const size_t index) const { return positions_[index]; }
		[[nodiscard]] const vec3& velocity(const size_t index) const { return velocities_[index]; }
		[[nodiscard]] const vec3& force(const size_t index) const { return forces_[index]; }

		[[nodiscard]] env::ParticleRef at(const size_t index) {
			TMD_ASSERT(index < size(), "particle index out of range");
			return {ids_[index], positions_[index], velocities_[index], forces_[index], masses_[index]};
		}

		[[nodiscard]] env::ParticleView view(const size_t index) const {
			TMD_ASSERT(index < size(), "particle index out of range");
			return {ids_[index], positions_[index], velocities_[index], forces_[index], masses_[index]};
		}

		// ID ACCESSORS (stable)
		[[nodiscard]] bool contains(const ParticleID id) const noexcept {
			return id_to_index.contains(id);
		}

		// convert id to index
		[[nodiscard]] size_t index_of(const ParticleID id) const {
			const auto it = id_to_index.find(id);
			if (it == id_to_index.end()) {
				throw std::out_of_range("no particle with id " + std::to_string(id));
			}
			return it->second;
		}

		[[nodiscard]] env::ParticleRef at_id(const ParticleID id) {
			return at(index_of(id));
		}

		[[nodiscard]] env::ParticleView view_id(const ParticleID id) const {
			return view(index_of(id));
		}

		// WHOLE ARRAYS
		[[nodiscard]] std::span<const vec3> positions() const noexcept { return positions_; }
		[[nodiscard]] std::span<const vec3> velocities() const noexcept { return velocities_; }
		[[nodiscard]] std::span<const vec3> forces() const noexcept { return forces_; }
		[[nodiscard]] std::span<const double> masses() const noexcept { return masses_; }


		// --------------
		// FUNCTIONAL OPS
		// --------------
		template<typename Func>
		void for_each_particle(Func && func) {
			for (size_t i = 0; i < size(); ++i) {
				func(at(i));
			}
		}

		template<typename Func>
		void for_each_particle(Func && func) const {
			for (size_t i = 0; i < size(); ++i) {
				func(view(i));
			}
		}


		// -------
		// PHYSICS
		// -------
		// recompute all forces from the current positions
		void update_forces();

		// subtract the centre of mass velocity from every particle
		void remove_drift();


		// -----------
		// OBSERVABLES
		// -----------
		[[nodiscard]] double kinetic_energy() const;
		[[nodiscard]] double potential_energy() const;
		[[nodiscard]] double total_energy() const { return kinetic_energy() + potential_energy(); }

		[[nodiscard]] double total_mass() const;
		[[nodiscard]] vec3 momentum() const;
		[[nodiscard]] vec3 center_of_mass() const;
		[[nodiscard]] vec3 center_of_mass_velocity() const { return momentum() / total_mass(); }
		[[nodiscard]] vec3 angular_momentum() const;

		// sum m |v - v_cm|^2 / (D N) with k_B = 1
		[[nodiscard]] double temperature() const;

		// d(potential_energy)/dx_i for every particle, obtained by differentiating the
		// total energy of the whole configuration. Equals -force(i).
		[[nodiscard]] std::vector<vec3> potential_energy_gradient() const;


		// --------
		// CONTEXTS
		// --------
		[[nodiscard]] SysContext context() const { return SysContext(*this); }

	private:
		P pair_potential;
		uint8_t dims;

		std::vector<ParticleID> ids_;
		std::vector<vec3> positions_;
		std::vector<vec3> velocities_;
		std::vector<vec3> forces_;
		std::vector<double> masses_;
		ankerl::unordered_dense::map<ParticleID, size_t> id_to_index;

		double time_ = 0;
		size_t step_ = 0;


		// private constructor since System should only be creatable through build_system(...)
		System(P pot, const std::vector<env::Particle> & particles, const uint8_t dimensions)
			: pair_potential(std::move(pot)), dims(dimensions)
		{
			const size_t n = particles.size();
			ids_.reserve(n);
			positions_.reserve(n);
			velocities_.reserve(n);
			forces_.assign(n, vec3{});
			masses_.reserve(n);
			id_to_index.reserve(n);

			for (size_t i = 0; i < n; ++i) {
				const env::Particle & p = particles[i];
				TMD_ASSERT(p.id.has_value(), "particle ids must be assigned before the system is created");

				ids_.push_back(p.id.value());
				positions_.push_back(p.position);
				velocities_.push_back(p.velocity);
				masses_.push_back(p.mass);
				id_to_index.emplace(p.id.value(), i);
			}
		}

		template <potential::IsPotential Q>
		friend System<Q> build_system(const env::Environment<Q> & environment, BuildInfo * build_info);

		// total pair energy of a configuration, generic over the scalar so it can be differentiated.
		// Coincident pairs throw std::domain_error like update_forces.
		template<typename T>
		T configuration_energy(const std::vector<math::Vec3<T>> & x) const {
			const P & pot = pair_potential;
			T energy(0.0);
			for (size_t i = 0; i < x.size(); ++i) {
				for (size_t j = i + 1; j < x.size(); ++j) {
					const T r2 = (x[j] - x[i]).norm_squared();
					if (math::value_of(r2) > pot.cutoff2()) continue;
					if (math::value_of(r2) == 0.0) {
						throw std::domain_error(
							"particles " + std::to_string(ids_[i]) + " and " + std::to_string(ids_[j]) +
							" occupy the same position " + positions_[i].to_string()
						);
					}

					using std::sqrt;
					const T r = sqrt(r2);
					energy += pot.energy(r) - pot.energy_offset();
				}
			}
			return energy;
		}
	};



	template <potential::IsPotential P>
	void System<P>::update_forces() {
		for (auto & f : forces_) {
			f = vec3{};
		}

		const size_t n = size();
		for (size_t i = 0; i < n; ++i) {
			const vec3 xi = positions_[i];
			vec3 fi{};  // accumulate locally, written once per i

			for (size_t j = i + 1; j < n; ++j) {
				const vec3 r = positions_[j] - xi;
				const double r2 = r.norm_squared();
				if (r2 > pair_potential.cutoff2()) continue;

				if (r2 == 0.0) {
					throw std::domain_error(
						"particles " + std::to_string(ids_[i]) + " and " + std::to_string(ids_[j]) +
						" occupy the same position " + xi.to_string()
					);
				}

				const vec3 f = potential::pair_force(pair_potential, r);
				fi += f;
				forces_[j] -= f; // Newton's third law
			}

			forces_[i] += fi;
		}
	}

	template <potential::IsPotential P>
	void System<P>::remove_drift() {
		const vec3 v_cm = center_of_mass_velocity();
		for (auto & v : velocities_) {
			v -= v_cm;
		}
	}

	template <potential::IsPotential P>
	double System<P>::kinetic_energy() const {
		double kinetic = 0.0;
		for (size_t i = 0; i < size(); ++i) {
			kinetic += 0.5 * masses_[i] * velocities_[i].norm_squared();
		}
		return kinetic;
	}

	template <potential::IsPotential P>
	double System<P>::potential_energy() const {
		double energy = 0.0;
		const size_t n = size();
		for (size_t i = 0; i < n; ++i) {
			for (size_t j = i + 1; j < n; ++j) {
				const vec3 r = positions_[j] - positions_[i];
				if (r.norm_squared() > pair_potential.cutoff2()) continue;
				energy += potential::pair_energy(pair_potential, r.norm());
			}
		}
		return energy;
	}

	template <potential::IsPotential P>
	double System<P>::total_mass() const {
		double m = 0.0;
		for (const double mi : masses_) {
			m += mi;
		}
		return m;
	}

	template <potential::IsPotential P>
	vec3 System<P>::momentum() const {
		vec3 p{};
		for (size_t i = 0; i < size(); ++i) {
			p += masses_[i] * velocities_[i];
		}
		return p;
	}

	template <potential::IsPotential P>
	vec3 System<P>::center_of_mass() const {
		vec3 weighted{};
		for (size_t i = 0; i < size(); ++i) {
			weighted += masses_[i] * positions_[i];
		}
		return weighted / total_mass();
	}

	template <potential::IsPotential P>
	vec3 System<P>::angular_momentum() const {
		vec3 l{};
		for (size_t i = 0; i < size(); ++i) {
			l += positions_[i].cross(masses_[i] * velocities_[i]);
		}
		return l;
	}

	template <potential::IsPotential P>
	double System<P>::temperature() const {
		if (dims == 0 || size() == 0) return 0.0;

		const vec3 v_cm = center_of_mass_velocity();
		double kinetic = 0.0;
		for (size_t i = 0; i < size(); ++i) {
			const vec3 dv = velocities_[i] - v_cm;
			kinetic += masses_[i] * dv.norm_squared();
		}

		const size_t dof = static_cast<size_t>(dims) * size();
		return kinetic / static_cast<double>(dof);
	}

	template <potential::IsPotential P>
	std::vector<vec3> System<P>::potential_energy_gradient() const {
		return math::gradient(
			[this](const auto & x) { return configuration_energy(x); },
			positions_
		);
	}


	template<class S> concept IsSystem = requires(S & s, const S & cs) {
		typename S::potential_t;
		{ s.update_forces() } -> std::same_as<void>;
		{ cs.time() } -> std::convertible_to<double>;
		{ cs.step() } -> std::convertible_to<size_t>;
		{ cs.context() };
	};

} // namespace toymd::core
