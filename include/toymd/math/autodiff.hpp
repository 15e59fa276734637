#pragma once
#include <vector>
#include <utility>
#include <concepts>

#include "toymd/math/dual.hpp"
#include "toymd/math/vec3.hpp"


namespace toymd::math {

    template<std::floating_point T>
    struct ValueAndDerivative {
        T value;
        T derivative;
    };

    // f must be callable with Dual<T> (usually a generic lambda)
    template<std::floating_point T, typename F>
    requires std::invocable<F&, Dual<T>>
    ValueAndDerivative<T> value_and_derivative(F && f, const T x) {
        const Dual<T> y = f(Dual<T>::variable(x));
        return {y.value, y.grad};
    }

    template<std::floating_point T, typename F>
    requires std::invocable<F&, Dual<T>>
    T derivative(F && f, const T x) {
        return value_and_derivative(std::forward<F>(f), x).derivative;
    }


    // Gradient of a scalar function of a whole configuration.
    // f receives const std::vector<Vec3<Dual<double>>>& and returns Dual<double>.
    // Forward mode: one sweep per coordinate, so 3N evaluations of f.
    template<typename F>
    std::vector<Vec3<double>> gradient(F && f, const std::vector<Vec3<double>> & points) {
        using D = Dual<double>;

        std::vector<Vec3<D>> seeded;
        seeded.reserve(points.size());
        for (const auto & p : points) {
            seeded.emplace_back(p);
        }

        std::vector<Vec3<double>> grad(points.size());
        for (size_t i = 0; i < seeded.size(); ++i) {
            for (int axis = 0; axis < 3; ++axis) {
                seeded[i][axis].grad = 1.0;
                const D out = f(std::as_const(seeded));
                grad[i][axis] = out.grad;
                seeded[i][axis].grad = 0.0;
            }
        }

        return grad;
    }

} // namespace toymd::math
