#pragma once

#include <utility>

#include "toymd/potentials/potential.hpp"


namespace toymd::potential {

	// User-supplied U(r). fn must accept both double and math::Dual<double>,
	// so a generic lambda such as [](auto r) { return 1.0 / (r*r); } is the usual form.
	template<typename F>
	struct Custom : PotentialBase<Custom<F>> {
		explicit Custom(F f, const double cutoff = no_cutoff)
		: PotentialBase<Custom<F>>(cutoff), fn(std::move(f)) {}

		template<typename T>
		T energy(const T& r) const {
			return static_cast<T>(fn(r));
		}

	private:
		F fn;
	};

	template<typename F>
	Custom(F) -> Custom<F>;

	template<typename F>
	Custom(F, double) -> Custom<F>;
}
