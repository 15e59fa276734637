#pragma once
#include <concepts>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "toymd/base/types.hpp"
#include "toymd/env/particle.hpp"

namespace toymd::env {

    template<typename T>
    concept IsParticleGenerator = requires (const T x) {
        {x.to_particles()} -> std::same_as<std::vector<Particle>>;
    };

    // velocity added on top of the mean velocity, as a function of the particle position
    using ThermalVelocity = std::function<vec3(const vec3&)>;


    namespace internal {
        // Settings shared by all lattice shapes. Setters return the concrete generator.
        template<class Derived>
        class LatticeGenerator {
        public:
            Derived& velocity(const vec3& v) noexcept {
                mean_velocity = v; return self();
            }
            Derived& velocity(const double x, const double y, const double z) noexcept {
                return velocity(vec3{x, y, z});
            }
            Derived& spacing(const double d) noexcept {
                lattice_spacing = d; return self();
            }
            Derived& mass(const double m) noexcept {
                particle_mass = m; return self();
            }
            Derived& thermal(ThermalVelocity tv) {
                thermal_velocity = std::move(tv); return self();
            }

        protected:
            vec3 mean_velocity{};
            double lattice_spacing = 0.0;
            double particle_mass = 1.0;
            ThermalVelocity thermal_velocity;

            void check_spacing(const char * shape) const {
                if (!(lattice_spacing > 0)) {
                    throw std::logic_error(std::string(shape) + " lattice spacing must be positive, got "
                        + std::to_string(lattice_spacing));
                }
            }

            [[nodiscard]] Particle make_particle(const vec3& position) const {
                const vec3 v = thermal_velocity ? mean_velocity + thermal_velocity(position) : mean_velocity;
                return Particle().at(position).with_velocity(v).with_mass(particle_mass);
            }

        private:
            Derived& self() noexcept { return static_cast<Derived&>(*this); }
        };
    }


    // Regular lattice of count.x * count.y * count.z particles, the first one at the origin.
    class ParticleCuboid : public internal::LatticeGenerator<ParticleCuboid> {
    public:
        ParticleCuboid& at(const vec3& p) noexcept {
            origin = p; return *this;
        }
        ParticleCuboid& at(const double x, const double y, const double z) noexcept {
            return at(vec3{x, y, z});
        }
        ParticleCuboid& count(const uint3& n) noexcept {
            cells = n; return *this;
        }
        ParticleCuboid& count(const unsigned x, const unsigned y, const unsigned z) noexcept {
            return count(uint3{x, y, z});
        }

        [[nodiscard]] std::vector<Particle> to_particles() const;

    private:
        vec3 origin{};
        uint3 cells{};
    };


    // Lattice points that lie strictly inside an ellipsoid around the centre.
    // Radii smaller than the spacing are raised to it, so the centre is always filled.
    class ParticleSphere : public internal::LatticeGenerator<ParticleSphere> {
    public:
        ParticleSphere& at(const vec3& c) noexcept {
            center = c; return *this;
        }
        ParticleSphere& at(const double x, const double y, const double z) noexcept {
            return at(vec3{x, y, z});
        }
        ParticleSphere& radius_xyz(const vec3& r) noexcept {
            radii = r; return *this;
        }
        ParticleSphere& radius(const double r) noexcept {
            return radius_xyz(vec3{r, r, r});
        }

        [[nodiscard]] std::vector<Particle> to_particles() const;

    private:
        vec3 center{};
        vec3 radii{};
    };

    static_assert(IsParticleGenerator<ParticleCuboid>);
    static_assert(IsParticleGenerator<ParticleSphere>);
}
