#pragma once
#include <xsimd/xsimd.hpp>

#include <cstddef>


namespace toymd::simd {

    // Lane-wise boolean produced by comparing two Wide values.
    template<typename T>
    class Mask {
    public:
        using native_type = ::xsimd::batch_bool<T>;

        Mask(native_type m) : bits(m) {}  // NOLINT: comparisons return the native type

        friend Mask operator&(const Mask& a, const Mask& b) { return a.bits & b.bits; }

        [[nodiscard]] bool any() const { return ::xsimd::any(bits); }
        [[nodiscard]] const native_type& native() const noexcept { return bits; }

    private:
        native_type bits;
    };


    // One xsimd batch of the architecture selected at compile time (-march).
    // Scalars broadcast implicitly so kernels read like their scalar versions.
    template<typename T>
    class Wide {
    public:
        using value_type = T;
        using native_type = ::xsimd::batch<T>;

        static constexpr size_t size() { return native_type::size; }

        Wide(const T scalar) : lanes(scalar) {}  // NOLINT
        Wide(const native_type & b) : lanes(b) {}  // NOLINT

        // unaligned, reads size() values
        static Wide load(const T* src) { return native_type::load_unaligned(src); }

        friend Wide operator+(const Wide& a, const Wide& b) { return a.lanes + b.lanes; }
        friend Wide operator-(const Wide& a, const Wide& b) { return a.lanes - b.lanes; }
        friend Wide operator*(const Wide& a, const Wide& b) { return a.lanes * b.lanes; }
        friend Wide operator/(const Wide& a, const Wide& b) { return a.lanes / b.lanes; }
        friend Wide operator-(const Wide& a) { return -a.lanes; }

        Wide& operator+=(const Wide& b) { lanes += b.lanes; return *this; }

        friend Mask<T> operator<=(const Wide& a, const Wide& b) { return a.lanes <= b.lanes; }
        friend Mask<T> operator>(const Wide& a, const Wide& b)  { return a.lanes > b.lanes; }

        // per lane: mask ? a : b
        friend Wide select(const Mask<T>& mask, const Wide& a, const Wide& b) {
            return ::xsimd::select(mask.native(), a.lanes, b.lanes);
        }

        [[nodiscard]] T reduce_add() const { return ::xsimd::reduce_add(lanes); }

    private:
        native_type lanes;
    };

}
