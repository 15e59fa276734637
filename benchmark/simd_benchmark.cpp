#include <iostream>
#include <random>
#include <vector>

#include "toymd/simd/lennard_jones_kernel.hpp"
#include "timing.hpp"

// --- Configuration ---
static constexpr size_t N = 4000;
static constexpr int REPS = 5;

using namespace toymd;


int main() {
    std::mt19937 rng(3);
    std::uniform_real_distribution<double> coord(0.0, 15.0);

    std::vector<double> x(N), y(N), z(N), fx(N), fy(N), fz(N);
    for (size_t i = 0; i < N; ++i) {
        x[i] = coord(rng);
        y[i] = coord(rng);
        z[i] = coord(rng);
    }

    const simd::ForceArrays arrays{x, y, z, fx, fy, fz};
    const potential::LennardJones lj(1.0, 1.0);

    std::cout << "Particles: " << N << "\n";
    std::cout << "SIMD lanes (double): " << simd::Wide<double>::size() << "\n";

    print_section("Lennard-Jones forces, full N^2 loop");
    const double t_scalar = time_it("scalar", REPS, [&] {
        simd::lennard_jones_forces_scalar(arrays, lj);
        return fx[0];
    });
    const double t_simd = time_it("xsimd", REPS, [&] {
        simd::lennard_jones_forces(arrays, lj);
        return fx[0];
    });
    std::cout << "  speedup: " << t_scalar / t_simd << "x\n";

    return 0;
}
