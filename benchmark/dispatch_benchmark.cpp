#include <any>
#include <functional>
#include <iostream>
#include <memory>
#include <vector>

#include "toymd/potentials/lennard_jones.hpp"
#include "timing.hpp"

// --- Configuration ---
static constexpr size_t N = 4'000'000;
static constexpr int REPS = 5;

using toymd::potential::LennardJones;


// runtime-polymorphic potential
struct VirtualPotential {
    virtual ~VirtualPotential() = default;
    [[nodiscard]] virtual double energy(double r) const = 0;
};

struct VirtualLennardJones final : VirtualPotential {
    double epsilon, sigma;
    VirtualLennardJones(const double e, const double s) : epsilon(e), sigma(s) {}

    [[nodiscard]] double energy(const double r) const override {
        const double sr = sigma / r;
        const double sr6 = sr * sr * sr * sr * sr * sr;
        return 4.0 * epsilon * (sr6 * sr6 - sr6);
    }
};


// mutable globals, the compiler must reload them every iteration
double g_epsilon = 1.0;
double g_sigma = 1.0;
double g_scale = 4.0;

static constexpr double c_epsilon = 1.0;
static constexpr double c_sigma = 1.0;
static constexpr double c_scale = 4.0;


template<typename F>
double sum_over(const std::vector<double> & rs, F && energy) {
    double total = 0.0;
    for (const double r : rs) {
        total += energy(r);
    }
    return total;
}


int main() {
    std::vector<double> rs(N);
    for (size_t i = 0; i < N; ++i) {
        rs[i] = 0.9 + 2.0 * static_cast<double>(i) / static_cast<double>(N);
    }

    const LennardJones lj(1.0, 1.0);
    const std::unique_ptr<VirtualPotential> virt = std::make_unique<VirtualLennardJones>(1.0, 1.0);
    const std::function<double(double)> fn = [lj](const double r) { return lj.energy(r); };

    std::cout << "Pair distances: " << N << "\n";

    print_section("Potential dispatch in the inner loop");
    const double t_static = time_it("static type (template)", REPS, [&] {
        return sum_over(rs, [&](const double r) { return lj.energy(r); });
    });
    time_it("virtual interface", REPS, [&] {
        return sum_over(rs, [&](const double r) { return virt->energy(r); });
    });
    time_it("std::function", REPS, [&] {
        return sum_over(rs, fn);
    });
    time_it("std::any accumulator", REPS, [&] {
        // type erased accumulator, every update goes through any_cast
        std::any total = 0.0;
        for (const double r : rs) {
            total = std::any_cast<double>(total) + lj.energy(r);
        }
        return std::any_cast<double>(total);
    });
    std::cout << "  (times relative to " << t_static << " ms for the static version)\n";

    print_section("Constants");
    time_it("mutable globals", REPS, [&] {
        return sum_over(rs, [](const double r) {
            const double sr = g_sigma / r;
            const double sr6 = sr * sr * sr * sr * sr * sr;
            return g_scale * g_epsilon * (sr6 * sr6 - sr6);
        });
    });
    time_it("constexpr constants", REPS, [&] {
        return sum_over(rs, [](const double r) {
            const double sr = c_sigma / r;
            const double sr6 = sr * sr * sr * sr * sr * sr;
            return c_scale * c_epsilon * (sr6 * sr6 - sr6);
        });
    });

    return 0;
}
