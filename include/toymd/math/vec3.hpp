#pragma once
#include <cmath>
#include <string>
#include <sstream>
#include <concepts>
#include <algorithm>

#include "toymd/base/debug.hpp"


namespace toymd::math {

    // anything that behaves like a number: floats, integers, dual numbers
    template<typename T>
    concept IsVectorSuitable = requires(T a, T b) {
        { a + b };
        { a - b };
        { a * b };
        { a / b };
        T(0);
    };


    // ---------------
    // VEC3 DEFINITION
    // ---------------
    template <IsVectorSuitable T>
    struct Vec3 {
        using type = T;

        T x, y, z;

        Vec3() : x(0), y(0), z(0) {}
        Vec3(T x, T y, T z) : x(x), y(y), z(z) {}
        explicit Vec3(T v) : x(v), y(v), z(v) {}

        // e.g. Vec3<double> -> Vec3<Dual<double>>
        template <typename U>
        requires (!std::same_as<T, U>) && std::constructible_from<T, const U&>
        explicit Vec3(const Vec3<U>& other)
            : x(static_cast<T>(other.x)), y(static_cast<T>(other.y)), z(static_cast<T>(other.z)) {}


        // --------------------------
        // ARITHMETIC (VECTOR-VECTOR)
        // --------------------------
        Vec3 operator+(const Vec3& other) const noexcept {
            return {x + other.x, y + other.y, z + other.z};
        }

        Vec3 operator-(const Vec3& other) const noexcept {
            return {x - other.x, y - other.y, z - other.z};
        }

        // point-wise multiplication
        Vec3 operator*(const Vec3& other) const noexcept {
            return {x * other.x, y * other.y, z * other.z};
        }

        // point-wise division
        Vec3 operator/(const Vec3& other) const noexcept {
            return {x / other.x, y / other.y, z / other.z};
        }

        Vec3 operator-() const noexcept {
            return {-x, -y, -z};
        }


        // --------------------------
        // ARITHMETIC (VECTOR-SCALAR)
        // --------------------------
        Vec3 operator*(const T& scalar) const noexcept {
            return {x * scalar, y * scalar, z * scalar};
        }

        Vec3 operator/(const T& scalar) const noexcept {
            return {x / scalar, y / scalar, z / scalar};
        }

        // scalar on the left
        friend Vec3 operator*(const T& scalar, const Vec3& rhs) noexcept {
            return {scalar * rhs.x, scalar * rhs.y, scalar * rhs.z};
        }


        // --------------------
        // COMPOUND ASSIGNMENTS
        // --------------------
        Vec3& operator+=(const Vec3& rhs) noexcept {
            x += rhs.x;
            y += rhs.y;
            z += rhs.z;
            return *this;
        }

        Vec3& operator-=(const Vec3& rhs) noexcept {
            x -= rhs.x;
            y -= rhs.y;
            z -= rhs.z;
            return *this;
        }

        Vec3& operator*=(const T& scalar) noexcept {
            x *= scalar;
            y *= scalar;
            z *= scalar;
            return *this;
        }

        Vec3& operator/=(const T& scalar) noexcept {
            x /= scalar;
            y /= scalar;
            z /= scalar;
            return *this;
        }


        // -------------------
        // GEOMETRIC FUNCTIONS
        // -------------------
        [[nodiscard]] T dot(const Vec3& rhs) const noexcept {
            return x * rhs.x + y * rhs.y + z * rhs.z;
        }

        [[nodiscard]] Vec3 cross(const Vec3& rhs) const noexcept {
            return {
                y * rhs.z - z * rhs.y,
                z * rhs.x - x * rhs.z,
                x * rhs.y - y * rhs.x
            };
        }

        [[nodiscard]] T norm_squared() const noexcept {
            return dot(*this);
        }

        [[nodiscard]] T norm() const noexcept {
            using std::sqrt;
            return sqrt(norm_squared());
        }


        // --------
        // EQUALITY
        // --------
        bool operator==(const Vec3& other) const noexcept {
            return x == other.x && y == other.y && z == other.z;
        }


        // ---------
        // ACCESSORS
        // ---------
        // Access component by index: 0 for x, 1 for y, 2 for z.
        T& operator[](const int index) noexcept {
            TMD_ASSERT(index >= 0 && index < 3, "Index out of bounds");
            if (index == 0) return x;
            if (index == 1) return y;
            return z;
        }

        const T& operator[](const int index) const noexcept {
            TMD_ASSERT(index >= 0 && index < 3, "Index out of bounds");
            if (index == 0) return x;
            if (index == 1) return y;
            return z;
        }

        [[nodiscard]] T max() const noexcept {
            return std::max(x, std::max(y, z));
        }

        [[nodiscard]] T min() const noexcept {
            return std::min(x, std::min(y, z));
        }


        //-----------------
        // LOGIC PREDICATES
        // ----------------
        template <typename Predicate>
        [[nodiscard]] bool any(Predicate predicate) const {
            return predicate(x) || predicate(y) || predicate(z);
        }

        template <typename Predicate>
        [[nodiscard]] bool all(Predicate predicate) const {
            return predicate(x) && predicate(y) && predicate(z);
        }

        // debug print
        [[nodiscard]] std::string to_string() const {
            std::ostringstream ss;
            ss << "{" << x << ", " << y << ", " << z << "}";
            return ss.str();
        }
    };

} // namespace toymd::math
