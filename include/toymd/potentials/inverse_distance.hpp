#pragma once

#include "toymd/potentials/potential.hpp"


namespace toymd::potential {
    // U = strength / r. Coulomb for strength = k q1 q2, gravity for strength = -G m1 m2.
    struct InverseDistance : PotentialBase<InverseDistance> {
        double strength;

        explicit InverseDistance(const double strength_, const double cutoff = no_cutoff)
            : PotentialBase(cutoff), strength(strength_) {}

        template<typename T>
        T energy(const T& r) const {
            return strength / r;
        }
    };
}
