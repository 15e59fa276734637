#pragma once
#include <cmath>
#include <ostream>
#include <concepts>
#include <type_traits>


namespace toymd::math {

    // Forward-mode dual number a + b*e with e^2 = 0.
    // Evaluating f(Dual{x, 1}) yields {f(x), f'(x)}.
    template<std::floating_point T>
    struct Dual {
        using value_type = T;

        T value;
        T grad;

        Dual() : value(0), grad(0) {}
        Dual(T v) : value(v), grad(0) {}  // NOLINT: implicit so that constants mix with duals
        Dual(T v, T g) : value(v), grad(g) {}

        // seed an independent variable
        static Dual variable(T v) { return {v, T(1)}; }


        // ----------
        // ARITHMETIC
        // ----------
        friend Dual operator+(const Dual& a, const Dual& b) { return {a.value + b.value, a.grad + b.grad}; }
        friend Dual operator-(const Dual& a, const Dual& b) { return {a.value - b.value, a.grad - b.grad}; }
        friend Dual operator*(const Dual& a, const Dual& b) {
            return {a.value * b.value, a.grad * b.value + a.value * b.grad};
        }
        friend Dual operator/(const Dual& a, const Dual& b) {
            const T inv = T(1) / b.value;
            return {a.value * inv, (a.grad * b.value - a.value * b.grad) * inv * inv};
        }

        Dual operator-() const { return {-value, -grad}; }
        Dual operator+() const { return *this; }

        Dual& operator+=(const Dual& rhs) { return *this = *this + rhs; }
        Dual& operator-=(const Dual& rhs) { return *this = *this - rhs; }
        Dual& operator*=(const Dual& rhs) { return *this = *this * rhs; }
        Dual& operator/=(const Dual& rhs) { return *this = *this / rhs; }


        // -----------
        // COMPARISONS
        // -----------
        // ordering looks at the value only; equality also compares the derivative
        friend bool operator==(const Dual& a, const Dual& b) { return a.value == b.value && a.grad == b.grad; }
        friend bool operator<(const Dual& a, const Dual& b)  { return a.value < b.value; }
        friend bool operator<=(const Dual& a, const Dual& b) { return a.value <= b.value; }
        friend bool operator>(const Dual& a, const Dual& b)  { return a.value > b.value; }
        friend bool operator>=(const Dual& a, const Dual& b) { return a.value >= b.value; }


        // --------------
        // MATH FUNCTIONS
        // --------------
        // found through ADL after `using std::sqrt;` etc.
        friend Dual sqrt(const Dual& x) {
            const T s = std::sqrt(x.value);
            return {s, x.grad / (T(2) * s)};
        }

        friend Dual exp(const Dual& x) {
            const T e = std::exp(x.value);
            return {e, x.grad * e};
        }

        friend Dual log(const Dual& x) {
            return {std::log(x.value), x.grad / x.value};
        }

        friend Dual sin(const Dual& x) {
            return {std::sin(x.value), x.grad * std::cos(x.value)};
        }

        friend Dual cos(const Dual& x) {
            return {std::cos(x.value), -x.grad * std::sin(x.value)};
        }

        friend Dual abs(const Dual& x) {
            return x.value < T(0) ? -x : x;
        }

        // x^0 is the constant 1, also at x = 0
        friend Dual pow(const Dual& x, const T exponent) {
            if (exponent == T(0)) return {T(1), T(0)};
            const T value = std::pow(x.value, exponent);
            if (x.grad == T(0)) return {value, T(0)};
            return {value, exponent * std::pow(x.value, exponent - T(1)) * x.grad};
        }

        friend Dual pow(const Dual& x, const int exponent) {
            return pow(x, static_cast<T>(exponent));
        }

        friend std::ostream& operator<<(std::ostream& os, const Dual& x) {
            return os << x.value << "+" << x.grad << "e";
        }
    };


    template<typename T>
    struct is_dual : std::false_type {};

    template<typename T>
    struct is_dual<Dual<T>> : std::true_type {};

    template<typename T>
    inline constexpr bool is_dual_v = is_dual<std::remove_cvref_t<T>>::value;

    // plain value of either a scalar or a dual
    template<typename T>
    auto value_of(const T& x) {
        if constexpr (is_dual_v<T>) {
            return x.value;
        } else {
            return x;
        }
    }

} // namespace toymd::math
