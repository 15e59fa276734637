#pragma once
#include <type_traits>

#include "toymd/integrators/integrator.hpp"
#include "toymd/core/system.hpp"
#include "toymd/monitors/monitor.hpp"

namespace toymd::integrator {

	template<core::IsSystem Sys, class Pack> class SymplecticEuler;

	// Semi-implicit Euler, kick then drift.
	template <core::IsSystem Sys, class ... TMonitors>
	class SymplecticEuler<Sys, monitor::MonitorPack<TMonitors...>>
		: public Integrator<SymplecticEuler<Sys, monitor::MonitorPack<TMonitors...>>, Sys, monitor::MonitorPack<TMonitors...>> {
	public:
		using Base = Integrator<SymplecticEuler, Sys, monitor::MonitorPack<TMonitors...>>;
		using Base::dt;
		using Base::sys;
		using Base::Base;

		void integration_step() {
			sys.for_each_particle([&](auto p) {
				p.velocity += dt * (p.force / p.mass);
				p.position += dt * p.velocity;
			});

			sys.update_forces();
		}
	};

	// Deduction guide so user can write SymplecticEuler(sys, monitors<M1, M2, M3>)
	template<class Sys, class... Ms>
	SymplecticEuler(Sys&, monitor::MonitorPack<Ms...>)
		-> SymplecticEuler<Sys, monitor::MonitorPack<Ms...>>;

	// Deduction guide so user can write SymplecticEuler(sys, m1, m2, m3)
	template<class Sys, class... Ms>
	SymplecticEuler(Sys&, Ms...)
		-> SymplecticEuler<Sys, monitor::MonitorPack<std::decay_t<Ms>...>>;
}
