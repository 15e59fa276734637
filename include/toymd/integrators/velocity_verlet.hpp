#pragma once
#include <type_traits>

#include "toymd/integrators/integrator.hpp"
#include "toymd/core/system.hpp"
#include "toymd/monitors/monitor.hpp"

namespace toymd::integrator {

	template<core::IsSystem Sys, class Pack> class VelocityVerlet;

	template <core::IsSystem Sys, class ... TMonitors>
	class VelocityVerlet<Sys, monitor::MonitorPack<TMonitors...>>
		: public Integrator<VelocityVerlet<Sys, monitor::MonitorPack<TMonitors...>>, Sys, monitor::MonitorPack<TMonitors...>> {
	public:
		using Base = Integrator<VelocityVerlet, Sys, monitor::MonitorPack<TMonitors...>>;
		using Base::dt;
		using Base::sys;
		using Base::Base;

		void integration_step() {
			sys.for_each_particle([&](auto p) {
				p.velocity += (dt / 2.0) * (p.force / p.mass);
				p.position += dt * p.velocity;
			});

			sys.update_forces();

			sys.for_each_particle([&](auto p) {
			   p.velocity += (dt / 2.0) * (p.force / p.mass);
			});
		}
	};

	// Deduction guide so user can write VelocityVerlet(sys, monitors<M1, M2, M3>)
	template<class Sys, class... Ms>
	VelocityVerlet(Sys&, monitor::MonitorPack<Ms...>)
		-> VelocityVerlet<Sys, monitor::MonitorPack<Ms...>>;

	// Deduction guide so user can write VelocityVerlet(sys, m1, m2, m3)
	template<class Sys, class... Ms>
	VelocityVerlet(Sys&, Ms...)
		-> VelocityVerlet<Sys, monitor::MonitorPack<std::decay_t<Ms>...>>;
}
