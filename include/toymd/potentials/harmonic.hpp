#pragma once

#include "toymd/potentials/potential.hpp"


namespace toymd::potential {
	// Harmonic spring (Hooke's law). k: spring constant; r0: equilibrium distance.
	struct Harmonic : PotentialBase<Harmonic> {
		double k;
		double r0;

		Harmonic(const double strength, const double equilibrium, const double cutoff = no_cutoff)
		: PotentialBase(cutoff), k(strength), r0(equilibrium) {}

		template<typename T>
		T energy(const T& r) const {
			const T dr = r - r0;
			return 0.5 * k * dr * dr;
		}
	};
}
