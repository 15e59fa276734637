#pragma once

#include <cstddef>
#include <cstdint>

#include "toymd/base/types.hpp"
#include "toymd/env/particle.hpp"


namespace toymd::core {

	// Read-only view of a system handed to monitors.
	template<class System>
	class SystemContext {
	public:
		explicit SystemContext(const System & sys): system(sys) {}

		// -----------------
		// LIFECYCLE & STATE
		// -----------------
		[[nodiscard]] double time() const noexcept { return system.time(); }
		[[nodiscard]] size_t step() const noexcept { return system.step(); }
		[[nodiscard]] size_t size() const noexcept { return system.size(); }
		[[nodiscard]] uint8_t dimensions() const noexcept { return system.dimensions(); }


		// ------------------
		// PARTICLE ACCESSORS
		// ------------------
		[[nodiscard]] ParticleID id(const size_t index) const { return system.id(index); }
		[[nodiscard]] const vec3& position(const size_t index) const { return system.position(index); }
		[[nodiscard]] const vec3& velocity(const size_t index) const { return system.velocity(index); }
		[[nodiscard]] const vec3& force(const size_t index) const { return system.force(index); }
		[[nodiscard]] double mass(const size_t index) const { return system.mass(index); }

		[[nodiscard]] env::ParticleView view(const size_t index) const {
			return system.view(index);
		}


		// -----------
		// OBSERVABLES
		// -----------
		[[nodiscard]] double kinetic_energy() const { return system.kinetic_energy(); }
		[[nodiscard]] double potential_energy() const { return system.potential_energy(); }
		[[nodiscard]] double total_energy() const { return system.total_energy(); }
		[[nodiscard]] double temperature() const { return system.temperature(); }
		[[nodiscard]] vec3 momentum() const { return system.momentum(); }
		[[nodiscard]] vec3 angular_momentum() const { return system.angular_momentum(); }

	private:
		const System& system;
	};

} // namespace toymd::core
