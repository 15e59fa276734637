#pragma once

#include "toymd/potentials/potential.hpp"


namespace toymd::potential {
	// Non-interacting particles: U = 0 everywhere.
	struct NoPotential : PotentialBase<NoPotential> {
		NoPotential(): PotentialBase(no_cutoff) {}

		template<typename T>
		T energy(const T&) const {
			return T(0.0);
		}
	};
}
