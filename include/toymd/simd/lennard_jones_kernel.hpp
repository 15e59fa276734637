#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>

#include "toymd/potentials/lennard_jones.hpp"
#include "toymd/simd/wide.hpp"


namespace toymd::simd {

    // Coordinates and forces of N particles, one array per component.
    struct ForceArrays {
        std::span<const double> x, y, z;
        std::span<double> fx, fy, fz;
    };

    namespace internal {
        inline void check_sizes(const ForceArrays & a) {
            const size_t n = a.x.size();
            if (a.y.size() != n || a.z.size() != n || a.fx.size() != n || a.fy.size() != n || a.fz.size() != n) {
                throw std::invalid_argument("all coordinate and force arrays must have the same length");
            }
        }
    }

    // Reference loop. Force on i from every j != i inside the cutoff, no Newton's third
    // law so that each i only writes its own entry. Coincident pairs contribute nothing.
    inline void lennard_jones_forces_scalar(const ForceArrays & a, const potential::LennardJones & lj) {
        internal::check_sizes(a);

        const size_t n = a.x.size();
        const double sigma2 = lj.sigma * lj.sigma;
        const double eps24 = 24.0 * lj.epsilon;
        const double rc2 = lj.cutoff2();

        for (size_t i = 0; i < n; ++i) {
            double fx = 0, fy = 0, fz = 0;
            for (size_t j = 0; j < n; ++j) {
                if (i == j) continue;
                const double dx = a.x[j] - a.x[i];
                const double dy = a.y[j] - a.y[i];
                const double dz = a.z[j] - a.z[i];
                const double r2 = dx*dx + dy*dy + dz*dz;
                if (r2 > rc2 || r2 == 0.0) continue;

                const double inv_r2 = 1.0 / r2;
                const double sr6 = sigma2 * inv_r2 * sigma2 * inv_r2 * sigma2 * inv_r2;
                const double mag = eps24 * inv_r2 * (sr6 - 2.0 * sr6 * sr6);

                fx += mag * dx;
                fy += mag * dy;
                fz += mag * dz;
            }
            a.fx[i] = fx;
            a.fy[i] = fy;
            a.fz[i] = fz;
        }
    }

    // Same result as the scalar loop, the j loop runs Wide<double>::size() lanes at a time.
    inline void lennard_jones_forces(const ForceArrays & a, const potential::LennardJones & lj) {
        using W = Wide<double>;
        constexpr size_t width = W::size();

        internal::check_sizes(a);

        const size_t n = a.x.size();
        const size_t n_vec = n - n % width;

        const W sigma2(lj.sigma * lj.sigma);
        const W eps24(24.0 * lj.epsilon);
        const W rc2(lj.cutoff2());
        const W zero(0.0);
        const W one(1.0);
        const W two(2.0);

        for (size_t i = 0; i < n; ++i) {
            const W xi(a.x[i]), yi(a.y[i]), zi(a.z[i]);
            W fx(0.0), fy(0.0), fz(0.0);

            size_t j = 0;
            for (; j < n_vec; j += width) {
                const W dx = W::load(a.x.data() + j) - xi;
                const W dy = W::load(a.y.data() + j) - yi;
                const W dz = W::load(a.z.data() + j) - zi;
                const W r2 = dx*dx + dy*dy + dz*dz;

                // the lane j == i has r2 == 0 and drops out here
                const Mask<double> active = (r2 > zero) & (r2 <= rc2);
                if (!active.any()) continue;

                const W inv_r2 = one / select(active, r2, one);
                const W s = sigma2 * inv_r2;
                const W sr6 = s * s * s;
                const W mag = select(active, eps24 * inv_r2 * (sr6 - two * sr6 * sr6), zero);

                fx += mag * dx;
                fy += mag * dy;
                fz += mag * dz;
            }

            double tx = fx.reduce_add();
            double ty = fy.reduce_add();
            double tz = fz.reduce_add();

            // remainder
            const double s2 = lj.sigma * lj.sigma;
            for (; j < n; ++j) {
                if (i == j) continue;
                const double dx = a.x[j] - a.x[i];
                const double dy = a.y[j] - a.y[i];
                const double dz = a.z[j] - a.z[i];
                const double r2 = dx*dx + dy*dy + dz*dz;
                if (r2 > lj.cutoff2() || r2 == 0.0) continue;

                const double inv_r2 = 1.0 / r2;
                const double sr6 = s2 * inv_r2 * s2 * inv_r2 * s2 * inv_r2;
                const double mag = 24.0 * lj.epsilon * inv_r2 * (sr6 - 2.0 * sr6 * sr6);
                tx += mag * dx;
                ty += mag * dy;
                tz += mag * dz;
            }

            a.fx[i] = tx;
            a.fy[i] = ty;
            a.fz[i] = tz;
        }
    }
}
