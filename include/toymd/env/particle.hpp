#pragma once

#include <optional>
#include <string>

#include "toymd/base/types.hpp"


namespace toymd::env {

    // Particle description used when assembling an Environment.
    struct Particle {
        std::optional<ParticleID> id;   // assigned during build if not set
        vec3 position;
        vec3 velocity;
        double mass = 1.0;

        Particle& at(const vec3& p) noexcept {
            position = p; return *this;
        }
        Particle& at(const double x, const double y, const double z) noexcept {
            position = {x,y,z}; return *this;
        }
        Particle& with_velocity(const vec3& v) noexcept {
            velocity = v; return *this;
        }
        Particle& with_velocity(const double x, const double y, const double z) noexcept {
            velocity = {x,y,z}; return *this;
        }
        Particle& with_mass(const double m) noexcept {
            mass = m; return *this;
        }
        Particle& with_id(const ParticleID i) noexcept {
            id = i; return *this;
        }

        [[nodiscard]] std::string to_string() const;
    };


    // Mutable handle on one particle stored inside a System.
    struct ParticleRef {
        const ParticleID id;
        vec3& position;
        vec3& velocity;
        vec3& force;
        const double mass;

        [[nodiscard]] std::string to_string() const;
    };

    // Read-only handle on one particle stored inside a System.
    struct ParticleView {
        const ParticleID id;
        const vec3& position;
        const vec3& velocity;
        const vec3& force;
        const double mass;

        [[nodiscard]] std::string to_string() const;
    };

} // namespace toymd::env
