#pragma once

#include <gtest/gtest.h>
#include "toymd/toymd.hpp"

using namespace toymd;


// Checks that the lighter of two particles stays on a circle of radius r with speed v.
class OrbitMonitor final : public Monitor {
public:
	OrbitMonitor(): Monitor(Trigger::always()) {}
	explicit OrbitMonitor(const double v, const double r, const double tol = 1e-3)
		: Monitor(Trigger::always()), v(v), r(r), tol(tol) {}

	template<class S>
	void record(const SystemContext<S> & sys) const {
		EXPECT_EQ(sys.size(), 2u);
		const size_t light = sys.mass(0) < sys.mass(1) ? 0 : 1;

		EXPECT_NEAR(sys.velocity(light).norm(), v, tol);
		EXPECT_NEAR(sys.position(light).norm(), r, tol);
	}

	double v{};
	double r{};
	double tol{};
};
