#pragma once

#include "toymd/potentials/potential.hpp"


namespace toymd::potential {

	// Lennard-Jones potential (12-6). epsilon: well depth; sigma: zero-cross distance.
	struct LennardJones : PotentialBase<LennardJones> {
		LennardJones(const double epsilon_, const double sigma_, const double cutoff = -1.0)
		: PotentialBase(cutoff < 0.0 ? 3.0 * sigma_ : cutoff), epsilon(epsilon_), sigma(sigma_) {}

		template<typename T>
		T energy(const T& r) const {
			const T sr = sigma / r;
			const T sr2 = sr * sr;
			const T sr6 = sr2 * sr2 * sr2;
			return 4.0 * epsilon * (sr6 * sr6 - sr6);
		}

		// location of the minimum, 2^(1/6) sigma
		[[nodiscard]] double equilibrium_distance() const noexcept {
			return 1.122462048309373 * sigma;
		}

		double epsilon; // Depth of the potential well
		double sigma; // Distance at which potential is zero
	};
}
