#pragma once

#include <cmath>

#include "toymd/potentials/potential.hpp"


namespace toymd::potential {

	// Morse potential D[(1 - exp(-a(r - r0)))^2 - 1], minimum -D at r0.
	struct Morse : PotentialBase<Morse> {
		Morse(const double depth_, const double width_, const double r0_, const double cutoff = no_cutoff)
		: PotentialBase(cutoff), depth(depth_), width(width_), r0(r0_) {}

		template<typename T>
		T energy(const T& r) const {
			using std::exp;
			const T e = 1.0 - exp(-width * (r - r0));
			return depth * (e * e - 1.0);
		}

		double depth;
		double width; // stiffness a
		double r0;    // equilibrium distance
	};
}
