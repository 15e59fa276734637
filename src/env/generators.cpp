#include "toymd/env/generators.hpp"

#include <algorithm>
#include <cmath>


namespace toymd::env {

    std::vector<Particle> ParticleCuboid::to_particles() const {
        check_spacing("cuboid");

        std::vector<Particle> particles;
        particles.reserve(static_cast<size_t>(cells.x) * cells.y * cells.z);

        // x is the outermost index, the last particle sits at origin + (count - 1) * spacing
        for (uint32_t i = 0; i < cells.x; ++i) {
            for (uint32_t j = 0; j < cells.y; ++j) {
                for (uint32_t k = 0; k < cells.z; ++k) {
                    const vec3 offset = lattice_spacing * vec3(i, j, k);
                    particles.push_back(make_particle(origin + offset));
                }
            }
        }
        return particles;
    }


    std::vector<Particle> ParticleSphere::to_particles() const {
        check_spacing("sphere");

        const double d = lattice_spacing;
        const vec3 r {std::max(radii.x, d), std::max(radii.y, d), std::max(radii.z, d)};

        // lattice extent in units of the spacing along each axis
        const auto nx = static_cast<int>(r.x / d);
        const auto ny = static_cast<int>(r.y / d);
        const auto nz = static_cast<int>(r.z / d);

        std::vector<Particle> particles;
        for (int i = -nx; i <= nx; ++i) {
            for (int j = -ny; j <= ny; ++j) {
                for (int k = -nz; k <= nz; ++k) {
                    const vec3 offset = d * vec3(i, j, k);
                    const double qx = offset.x / r.x;
                    const double qy = offset.y / r.y;
                    const double qz = offset.z / r.z;
                    if (qx*qx + qy*qy + qz*qz >= 1.0) continue;

                    particles.push_back(make_particle(center + offset));
                }
            }
        }
        return particles;
    }
} // namespace toymd::env
