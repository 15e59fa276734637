#pragma once
#include <type_traits>

#include "toymd/integrators/integrator.hpp"
#include "toymd/core/system.hpp"
#include "toymd/monitors/monitor.hpp"

namespace toymd::integrator {

	template<core::IsSystem Sys, class Pack> class ForwardEuler;

	// Explicit Euler: position and velocity both advance with the values of the
	// previous step. First order and not symplectic, the energy of a bound system grows.
	template <core::IsSystem Sys, class ... TMonitors>
	class ForwardEuler<Sys, monitor::MonitorPack<TMonitors...>>
		: public Integrator<ForwardEuler<Sys, monitor::MonitorPack<TMonitors...>>, Sys, monitor::MonitorPack<TMonitors...>> {
	public:
		using Base = Integrator<ForwardEuler, Sys, monitor::MonitorPack<TMonitors...>>;
		using Base::dt;
		using Base::sys;
		using Base::Base;

		void integration_step() {
			sys.for_each_particle([&](auto p) {
				p.position += dt * p.velocity;
				p.velocity += dt * (p.force / p.mass);
			});

			sys.update_forces();
		}
	};

	// Deduction guide so user can write ForwardEuler(sys, monitors<M1, M2, M3>)
	template<class Sys, class... Ms>
	ForwardEuler(Sys&, monitor::MonitorPack<Ms...>)
		-> ForwardEuler<Sys, monitor::MonitorPack<Ms...>>;

	// Deduction guide so user can write ForwardEuler(sys, m1, m2, m3)
	template<class Sys, class... Ms>
	ForwardEuler(Sys&, Ms...)
		-> ForwardEuler<Sys, monitor::MonitorPack<std::decay_t<Ms>...>>;
}
