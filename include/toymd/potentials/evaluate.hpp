#pragma once

#include <stdexcept>

#include "toymd/base/types.hpp"
#include "toymd/math/dual.hpp"
#include "toymd/potentials/potential.hpp"


namespace toymd::potential {

	struct PairTerm {
		double energy;      // U(r), shifted if the potential is
		double derivative;  // dU/dr
	};

	// One dual evaluation gives U and dU/dr. Zero beyond the cutoff.
	template<IsPotential P>
	PairTerm evaluate(const P & pot, const double r) {
		if (r > pot.cutoff()) {
			return {0.0, 0.0};
		}
		if (r == 0.0) {
			throw std::domain_error("pair potential evaluated at zero separation");
		}

		const math::Dual<double> u = pot.energy(math::Dual<double>::variable(r));
		return {u.value - pot.energy_offset(), u.grad};
	}

	template<IsPotential P>
	double pair_energy(const P & pot, const double r) {
		return evaluate(pot, r).energy;
	}

	// Force on particle i for r = x_j - x_i. The force on j is the negation.
	// F_i = -grad_i U(|x_j - x_i|) = U'(|r|) r / |r|
	template<IsPotential P>
	vec3 pair_force(const P & pot, const vec3 & r) {
		const double dist = r.norm();
		const PairTerm term = evaluate(pot, dist);
		if (term.derivative == 0.0) {
			return vec3{};
		}
		return (term.derivative / dist) * r;
	}

} // namespace toymd::potential
