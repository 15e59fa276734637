#include <algorithm>
#include <iostream>
#include <random>
#include <vector>

#include "toymd/base/types.hpp"
#include "timing.hpp"

// --- Configuration ---
static constexpr size_t N = 2000;
static constexpr int REPS = 5;
static constexpr double SIGMA2 = 1.0;
static constexpr double EPSILON = 1.0;
static constexpr double R_CUT2 = 9.0;

using toymd::vec3;

struct Particle {
    vec3 position = {};
    vec3 velocity = {};
    vec3 force = {};
    double mass = 1.0;
    int id = 0;
};

struct Particles {
    std::vector<double> x, y, z;
    std::vector<double> fx, fy, fz;
};


inline double lj_magnitude(const double r2) {
    const double r2inv = 1.0 / r2;
    const double s2 = SIGMA2 * r2inv;
    const double s6 = s2 * s2 * s2;
    return 24.0 * EPSILON * r2inv * (s6 - 2.0 * s6 * s6);
}

double forces_aos(std::vector<Particle> & particles) {
    for (auto & p : particles) p.force = {};

    for (size_t i = 0; i < particles.size(); ++i) {
        const vec3 xi = particles[i].position;
        vec3 fi{};
        for (size_t j = i + 1; j < particles.size(); ++j) {
            const vec3 r = particles[j].position - xi;
            const double r2 = r.norm_squared();
            if (r2 > R_CUT2) continue;
            const vec3 f = lj_magnitude(r2) * r;
            fi += f;
            particles[j].force -= f;
        }
        particles[i].force += fi;
    }
    return particles[0].force.x;
}

double forces_soa(Particles & p) {
    const size_t n = p.x.size();
    std::fill(p.fx.begin(), p.fx.end(), 0.0);
    std::fill(p.fy.begin(), p.fy.end(), 0.0);
    std::fill(p.fz.begin(), p.fz.end(), 0.0);

    for (size_t i = 0; i < n; ++i) {
        const double xi = p.x[i], yi = p.y[i], zi = p.z[i];
        double fx = 0, fy = 0, fz = 0;
        for (size_t j = i + 1; j < n; ++j) {
            const double dx = p.x[j] - xi;
            const double dy = p.y[j] - yi;
            const double dz = p.z[j] - zi;
            const double r2 = dx*dx + dy*dy + dz*dz;
            if (r2 > R_CUT2) continue;
            const double m = lj_magnitude(r2);
            fx += m * dx; fy += m * dy; fz += m * dz;
            p.fx[j] -= m * dx; p.fy[j] -= m * dy; p.fz[j] -= m * dz;
        }
        p.fx[i] += fx; p.fy[i] += fy; p.fz[i] += fz;
    }
    return p.fx[0];
}


int main() {
    std::mt19937 rng(1);
    std::uniform_real_distribution<double> coord(0.0, 12.0);

    std::vector<Particle> aos(N);
    Particles soa;
    for (size_t i = 0; i < N; ++i) {
        aos[i].position = {coord(rng), coord(rng), coord(rng)};
        aos[i].id = static_cast<int>(i);
        soa.x.push_back(aos[i].position.x);
        soa.y.push_back(aos[i].position.y);
        soa.z.push_back(aos[i].position.z);
    }
    soa.fx.assign(N, 0.0);
    soa.fy.assign(N, 0.0);
    soa.fz.assign(N, 0.0);

    std::cout << "Particles: " << N << "\n";

    print_section("Force loop, memory layout");
    const double t_aos = time_it("array of structs", REPS, [&] { return forces_aos(aos); });
    const double t_soa = time_it("struct of arrays", REPS, [&] { return forces_soa(soa); });
    std::cout << "  speedup: " << t_aos / t_soa << "x\n";

    // flat 3 x M matrix, row-major: element (c, k) at c * M + k
    constexpr size_t M = 2'000'000;
    std::vector<double> matrix(3 * M, 1.0);

    print_section("Traversal of a row-major 3 x M matrix");
    const double t_row = time_it("inner loop over columns (contiguous)", REPS, [&] {
        double sum = 0.0;
        for (size_t c = 0; c < 3; ++c)
            for (size_t k = 0; k < M; ++k)
                sum += matrix[c * M + k];
        return sum;
    });
    const double t_col = time_it("inner loop over rows (strided)", REPS, [&] {
        double sum = 0.0;
        for (size_t k = 0; k < M; ++k)
            for (size_t c = 0; c < 3; ++c)
                sum += matrix[c * M + k];
        return sum;
    });
    std::cout << "  speedup: " << t_col / t_row << "x\n";

    return 0;
}
