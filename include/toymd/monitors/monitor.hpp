#pragma once

#include <concepts>
#include <cstddef>
#include <utility>

#include "toymd/core/context.hpp"
#include "toymd/shared/trigger.hpp"

namespace toymd::monitor {

	// Monitors observe a running integration. A subclass must implement
	//     template<class S> void record(const core::SystemContext<S> &)
	// and may implement initialize(ctx) or initialize(), before_step(ctx) and finalize().
	class Monitor {
	public:
		explicit Monitor(shared::Trigger trig) : trigger(std::move(trig)) {}

		[[nodiscard]] bool should_trigger(const shared::TriggerState & state) const {
			return trigger(state);
		}

		// Called once at the start to set integration parameters
		void init(const double delta_t, const double start_t, const double end_t, const size_t steps) {
			dt = delta_t;
			start_time = start_t;
			end_time = end_t;
			num_steps = steps;
		}

	protected:
		double dt{};
		double start_time{};
		double end_time{};
		size_t num_steps{};
		shared::Trigger trigger;
	};


	template <class M> concept IsMonitor = std::derived_from<M, Monitor>;

	template<IsMonitor... Ms> struct MonitorPack {};

	template<class... Ms> inline constexpr MonitorPack<Ms...> monitors{};


	namespace internal {
		// Optional: overridable initialization, called right after init()
		template<IsMonitor M, class S>
		void dispatch_initialize(M & mon, const core::SystemContext<S> & sys) {
			if constexpr (requires { mon.initialize(sys); }) {
				mon.initialize(sys);
			} else if constexpr (requires { mon.initialize(); }) {
				mon.initialize();
			}
		}

		// Optional: Called before a step
		template<IsMonitor M, class S>
		void dispatch_before_step(M & mon, const core::SystemContext<S> & sys) {
			if constexpr (requires { mon.before_step(sys); }) {
				mon.before_step(sys);
			}
		}

		// Required: Called after a step
		template<IsMonitor M, class S>
		void dispatch_record(M & mon, const core::SystemContext<S> & sys) {
			static_assert(
				requires { mon.record(sys); },
				"Monitor subclass must implement: template<class S> void record(const core::SystemContext<S> &)"
			);
			mon.record(sys);
		}

		// Optional: Called once at the end
		template<IsMonitor M>
		void dispatch_finalize(M & mon) {
			if constexpr (requires { mon.finalize(); }) {
				mon.finalize();
			}
		}
	}
}
