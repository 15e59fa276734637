#pragma once
#include <type_traits>

#include "toymd/integrators/integrator.hpp"
#include "toymd/core/system.hpp"
#include "toymd/monitors/monitor.hpp"

namespace toymd::integrator {

	template<core::IsSystem Sys, class Pack> class Yoshida4;

	// Fourth order symplectic composition of three velocity Verlet steps.
	template <core::IsSystem Sys, class ... TMonitors>
	class Yoshida4<Sys, monitor::MonitorPack<TMonitors...>>
		: public Integrator<Yoshida4<Sys, monitor::MonitorPack<TMonitors...>>, Sys, monitor::MonitorPack<TMonitors...>> {
	public:
		using Base = Integrator<Yoshida4, Sys, monitor::MonitorPack<TMonitors...>>;
		using Base::dt;
		using Base::sys;
		using Base::Base;

		void verlet_step(const double delta_t) {
			sys.for_each_particle([&](auto p) {
				p.velocity += (delta_t / 2.0) * (p.force / p.mass);
				p.position += delta_t * p.velocity;
			});

			sys.update_forces();

			sys.for_each_particle([&](auto p) {
				p.velocity += (delta_t / 2.0) * (p.force / p.mass);
			});
		}

		void integration_step() {
			// w1 = 1 / (2 - 2^(1/3)), w0 = -2^(1/3) w1
			constexpr double w1 = 1.3512071919596578;
			constexpr double w0 = -1.7024143839193153;

			verlet_step(w1*dt);
			verlet_step(w0*dt);
			verlet_step(w1*dt);
		}
	};

	// Deduction guide so user can write Yoshida4(sys, monitors<M1, M2, M3>)
	template<class Sys, class... Ms>
	Yoshida4(Sys&, monitor::MonitorPack<Ms...>)
		-> Yoshida4<Sys, monitor::MonitorPack<Ms...>>;

	// Deduction guide so user can write Yoshida4(sys, m1, m2, m3)
	template<class Sys, class... Ms>
	Yoshida4(Sys&, Ms...)
		-> Yoshida4<Sys, monitor::MonitorPack<std::decay_t<Ms>...>>;
}
