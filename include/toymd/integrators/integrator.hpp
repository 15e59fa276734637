#pragma once

#include <cmath>
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "toymd/base/types.hpp"
#include "toymd/core/system.hpp"
#include "toymd/monitors/monitor.hpp"
#include "toymd/shared/pack_storage.hpp"
#include "toymd/shared/trigger.hpp"


namespace toymd::integrator {

	// Shared driver of all time stepping schemes. Derived implements integration_step(),
	// which advances positions and velocities by dt and leaves the forces valid for the
	// new positions.
	template<class Derived, core::IsSystem Sys, class Pack> class Integrator;  // primary template

	template <class Derived, core::IsSystem Sys, class... TMonitors>  // partial specialization
	class Integrator<Derived, Sys, monitor::MonitorPack<TMonitors...>> {
	public:

		explicit Integrator(Sys& sys_ref)
			: sys(sys_ref)
		{}

		explicit Integrator(Sys& s, monitor::MonitorPack<TMonitors...>) : sys(s) {}

		template<class... Ms>
		requires (sizeof...(Ms) > 0 && (same_as_any<std::decay_t<Ms>, TMonitors...> && ...))
		explicit Integrator(Sys& s, Ms&&... ms) : sys(s) {
			add_monitors(std::forward<Ms>(ms)...);
		}

		template<typename T> requires same_as_any<T, TMonitors...>
		void add_monitor(T monitor) {
			monitor_storage.add(std::move(monitor));
		}

		template<typename... Ts>
		void add_monitors(Ts&&... ms) {
			(add_monitor(std::decay_t<Ts>(std::forward<Ts>(ms))), ...);
		}

		// DSL-style chaining
		template<typename T>
		requires same_as_any<T, TMonitors...>
		Derived& with_monitor(T monitor) {
			add_monitor(std::move(monitor));
			return derived();
		}

		template<typename... Ts>
		Derived& with_monitors(Ts&&... ms) {
			add_monitors(std::forward<Ts>(ms)...);
			return derived();
		}

		template<typename T>
		requires same_as_any<T, TMonitors...>
		[[nodiscard]] std::vector<T>& monitors() {
			return monitor_storage.template get_list<T>();
		}

		template<typename T>
		requires same_as_any<T, TMonitors...>
		[[nodiscard]] const std::vector<T>& monitors() const {
			return monitor_storage.template get_list<T>();
		}


		void set_dt(const double delta_t) {
			if (!(delta_t > 0) || !std::isfinite(delta_t)) {
				throw std::invalid_argument(
					"time step must be positive and finite. Got delta_t=" + std::to_string(delta_t)
				);
			}
			dt = delta_t;
		}

		void set_duration(const double dur) {
			if (!(dur >= 0) || !std::isfinite(dur)) {
				throw std::invalid_argument(
					"duration must be non-negative and finite. Got duration=" + std::to_string(dur)
				);
			}
			duration = dur;
			most_recently_set = DURATION;
		}

		void set_steps(const size_t steps) {
			num_steps = steps;
			most_recently_set = STEP;
		}

		Derived& with_dt(const double delta_t) {
			set_dt(delta_t);
			return derived();
		}

		Derived& for_duration(const double dur) {
			set_duration(dur);
			return derived();
		}

		Derived& for_steps(const size_t steps) {
			set_steps(steps);
			return derived();
		}

		Derived& run() {
			if (dt <= 0) {
				throw std::invalid_argument("time step has not been specified!");
			}

			if (most_recently_set == DURATION) {
				// tolerance so that e.g. 1.0 / 0.1 gives 10 steps and not 9
				num_steps = static_cast<size_t>(std::floor(duration / dt + 1e-9));
			} else if (most_recently_set == STEP) {
				duration = static_cast<double>(num_steps) * dt;
			} else {
				throw std::invalid_argument("neither duration nor number steps have been specified!");
			}

			init_monitors();
			dispatch_initialize_monitors();

			// simulation loop
			sys.update_forces(); // ensure valid force initialization
			for (size_t step = 0; step < num_steps; ++step) {
				dispatch_monitor_preparation();
				derived().integration_step();
				sys.update_time(dt);
				sys.increment_step();
				dispatch_monitor_recording();
			}

			finalize_monitors();

			return derived();
		}

		Derived& run_for_duration(const double delta_t, const double dur) {
			return with_dt(delta_t).for_duration(dur).run();
		}

		// Integrate for explicit number of steps
		Derived& run_for_steps(const double delta_t, const size_t steps) {
			return with_dt(delta_t).for_steps(steps).run();
		}

		[[nodiscard]] double delta_t() const noexcept { return dt; }
		[[nodiscard]] size_t steps() const noexcept { return num_steps; }


	protected:
		Sys & sys;
		size_t num_steps{};
		double duration = 0;
		double dt = 0;

	private:
		enum MostRecentlySet {
			DURATION = 1,
			NONE = 0,
			STEP = -1
		};
		MostRecentlySet most_recently_set = NONE;

		shared::internal::PackStorage<TMonitors...> monitor_storage;

		Derived& derived() { return static_cast<Derived&>(*this); }

		void init_monitors() {
			const double start = sys.time();
			monitor_storage.for_each_item([&](auto& mon) { mon.init(dt, start, start + duration, num_steps); });
		}

		void dispatch_initialize_monitors() {
			const auto ctx = sys.context();
			monitor_storage.for_each_item([&](auto& mon) { monitor::internal::dispatch_initialize(mon, ctx); });
		}

		void dispatch_monitor_preparation() {
			const auto ctx = sys.context();
			const auto state = shared::TriggerState::of(sys);
			monitor_storage.for_each_item([&](auto & mon) {
				// triggers may carry state, only ask the ones that have a hook here
				if constexpr (requires { mon.before_step(ctx); }) {
					if (mon.should_trigger(state)) {
						monitor::internal::dispatch_before_step(mon, ctx);
					}
				}
			});
		}

		void dispatch_monitor_recording() {
			const auto ctx = sys.context();
			const auto state = shared::TriggerState::of(sys);
			monitor_storage.for_each_item([&](auto & mon) {
				if (mon.should_trigger(state)) {
					monitor::internal::dispatch_record(mon, ctx);
				}
			});
		}

		void finalize_monitors() {
			monitor_storage.for_each_item([&](auto& mon) { monitor::internal::dispatch_finalize(mon); });
		}
	};

} // namespace toymd::integrator
