#pragma once

#include <vector>

#include "toymd/toymd.hpp"

using namespace toymd;


// Two particles with ids 0 and 1, in this order.
template<potential::IsPotential P>
System<P> make_pair_system(P pot, const vec3 & x0, const vec3 & x1,
						   const vec3 & v0 = {}, const vec3 & v1 = {},
						   const double m0 = 1.0, const double m1 = 1.0) {
	Environment env (std::move(pot));
	env.add_particle(x0, v0, m0, 0);
	env.add_particle(x1, v1, m1, 1);
	return build_system(env);
}

template<class S>
double max_abs_force_sum(const S & sys) {
	vec3 total{};
	for (const vec3 & f : sys.forces()) {
		total += f;
	}
	return std::max(std::abs(total.x), std::max(std::abs(total.y), std::abs(total.z)));
}
