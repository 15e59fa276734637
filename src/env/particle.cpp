#include "toymd/env/particle.hpp"
#include <sstream>


namespace toymd::env {

	namespace {
		std::string format_particle(const std::string& id, const vec3& position, const vec3& velocity,
									const vec3* force, const double mass) {
			std::ostringstream oss;
			oss << "Particle ID: " << id << "\n"
				<< "Position: " << position[0] << " " << position[1] << " " << position[2] << "\n"
				<< "Velocity: " << velocity[0] << " " << velocity[1] << " " << velocity[2] << "\n";
			if (force) {
				oss << "Force: " << (*force)[0] << " " << (*force)[1] << " " << (*force)[2] << "\n";
			}
			oss << "Mass: " << mass << "\n";
			return oss.str();
		}
	}

	std::string Particle::to_string() const {
		const std::string id_str = id.has_value() ? std::to_string(id.value()) : "unassigned";
		return format_particle(id_str, position, velocity, nullptr, mass);
	}

	std::string ParticleRef::to_string() const {
		return format_particle(std::to_string(id), position, velocity, &force, mass);
	}

	std::string ParticleView::to_string() const {
		return format_particle(std::to_string(id), position, velocity, &force, mass);
	}
}
