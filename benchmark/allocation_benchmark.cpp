#include <iostream>
#include <span>
#include <vector>

#include "timing.hpp"

// --- Configuration ---
static constexpr size_t N = 1'000'000;
static constexpr size_t SLICE = 500'000;
static constexpr int REPS = 20;
static constexpr double DT = 0.001;


double sum_copy(const std::vector<double> & data, const size_t offset, const size_t count) {
    const std::vector<double> slice(data.begin() + offset, data.begin() + offset + count);
    double sum = 0.0;
    for (const double v : slice) sum += v;
    return sum;
}

double sum_view(const std::span<const double> slice) {
    double sum = 0.0;
    for (const double v : slice) sum += v;
    return sum;
}


// x + dt * v + 0.5 * dt^2 * a, one temporary vector per operation
std::vector<double> scale(const std::vector<double> & a, const double s) {
    std::vector<double> out(a.size());
    for (size_t i = 0; i < a.size(); ++i) out[i] = s * a[i];
    return out;
}

std::vector<double> add(const std::vector<double> & a, const std::vector<double> & b) {
    std::vector<double> out(a.size());
    for (size_t i = 0; i < a.size(); ++i) out[i] = a[i] + b[i];
    return out;
}


int main() {
    std::vector<double> x(N, 1.0), v(N, 0.5), a(N, -0.25);

    std::cout << "Elements: " << N << ", slice: " << SLICE << "\n";

    print_section("Slicing");
    const double t_copy = time_it("copy into a new vector", REPS, [&] {
        return sum_copy(x, N / 4, SLICE);
    });
    const double t_view = time_it("std::span view", REPS, [&] {
        return sum_view(std::span<const double>(x).subspan(N / 4, SLICE));
    });
    std::cout << "  speedup: " << t_copy / t_view << "x\n";

    print_section("Position update x + dt v + dt^2/2 a");
    const double t_temp = time_it("temporaries per expression", REPS, [&] {
        x = add(add(x, scale(v, DT)), scale(a, 0.5 * DT * DT));
        return x[0];
    });
    const double t_fused = time_it("fused in-place loop", REPS, [&] {
        for (size_t i = 0; i < N; ++i) {
            x[i] += DT * v[i] + 0.5 * DT * DT * a[i];
        }
        return x[0];
    });
    std::cout << "  speedup: " << t_temp / t_fused << "x\n";

    return 0;
}
