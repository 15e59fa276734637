#pragma once

#include <concepts>
#include <stdexcept>
#include <string>

#include "toymd/base/types.hpp"
#include "toymd/math/dual.hpp"


namespace toymd::potential {

    constexpr double no_cutoff = 1.0e150; // 1.0e150 squared is 1.0e300 <  max of double = 1.79e308

    // A pair potential is a scalar function U(r) of the inter-particle distance.
    // Subclasses implement `template<class T> T energy(const T& r) const`, generic over
    // the scalar so that forces can be obtained by differentiating with math::Dual.
    struct Potential {
        explicit Potential(const double cutoff): pot_cutoff(cutoff), pot_cutoff2(cutoff*cutoff) {}

        [[nodiscard]] bool has_cutoff() const noexcept {
            return pot_cutoff < no_cutoff;
        }

        [[nodiscard]] double cutoff() const noexcept {
            return pot_cutoff;
        }

        [[nodiscard]] double cutoff2() const noexcept {
            return pot_cutoff2;
        }

        [[nodiscard]] bool is_shifted() const noexcept {
            return shifted;
        }

        // subtracted from every energy inside the cutoff
        [[nodiscard]] double energy_offset() const noexcept {
            return offset;
        }

    protected:
        void set_cutoff(const double c) {
            if (!(c > 0.0)) {
                throw std::invalid_argument("cutoff radius must be positive. Got: " + std::to_string(c));
            }
            pot_cutoff = c;
            pot_cutoff2 = c*c;
        }

        double pot_cutoff;
        double pot_cutoff2;
        double offset = 0.0;
        bool shifted = false;
    };


    // fluent modifiers that return the concrete potential type
    template<class Derived>
    struct PotentialBase : Potential {
        using Potential::Potential;

        [[nodiscard]] Derived with_cutoff(const double c) const {
            Derived d = static_cast<const Derived&>(*this);
            d.set_cutoff(c);
            if (d.shifted) {
                d.offset = d.energy(d.pot_cutoff);
            }
            return d;
        }

        // shift the energy so that U(cutoff) = 0; forces are unchanged
        [[nodiscard]] Derived with_energy_shift() const {
            Derived d = static_cast<const Derived&>(*this);
            if (!d.has_cutoff()) {
                throw std::logic_error("cannot shift the energy of a potential without cutoff");
            }
            d.offset = d.energy(d.pot_cutoff);
            d.shifted = true;
            return d;
        }
    };


    template <class P>
    concept IsPotential = std::derived_from<P, Potential> &&
        requires(const P & p, const double r, const math::Dual<double> & d) {
            { p.energy(r) } -> std::same_as<double>;
            { p.energy(d) } -> std::same_as<math::Dual<double>>;
        };

} // namespace toymd::potential
