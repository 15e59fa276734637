#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <utility>


namespace toymd::shared {

	// Snapshot of the run that a trigger decides on. Taken after each step.
	struct TriggerState {
		size_t step = 0;
		double time = 0.0;
		size_t particles = 0;

		template<class S>
		static TriggerState of(const S & sys) {
			return {sys.step(), sys.time(), sys.size()};
		}
	};


	// Predicate over the run state deciding whether a monitor fires.
	// Copies share nothing: stateful triggers (periodically) keep their own memory.
	class Trigger {
	public:
		using Predicate = std::function<bool(const TriggerState&)>;

		explicit Trigger(Predicate p) : predicate(std::move(p)) {
			if (!predicate) throw std::invalid_argument("trigger predicate must be callable");
		}

		bool operator()(const TriggerState & state) const {
			return predicate(state);
		}


		// ----------
		// STEP BASED
		// ----------
		// steps where (step + offset) is a multiple of n
		static Trigger every(const size_t n, const size_t offset = 0) {
			if (n == 0) {
				throw std::invalid_argument("trigger period must be at least one step");
			}
			return Trigger([n, offset](const TriggerState & s) { return (s.step + offset) % n == 0; });
		}

		static Trigger after(const size_t first) {
			return Trigger([first](const TriggerState & s) { return s.step >= first; });
		}

		// half open: [first, last)
		static Trigger between(const size_t first, const size_t last) {
			return Trigger([first, last](const TriggerState & s) { return first <= s.step && s.step < last; });
		}

		static Trigger at_step(const size_t target) {
			return Trigger([target](const TriggerState & s) { return s.step == target; });
		}


		// ----------
		// TIME BASED
		// ----------
		// fires at the first step reached once `period` has elapsed since the last firing
		static Trigger periodically(const double period, const double offset = 0.0) {
			if (!(period > 0.0) || !std::isfinite(period)) {
				throw std::invalid_argument("trigger period must be positive and finite");
			}
			return Trigger([period, last = offset - period](const TriggerState & s) mutable {
				if (s.time - last < period) return false;
				last = s.time;
				return true;
			});
		}

		static Trigger after_time(const double t) {
			return Trigger([t](const TriggerState & s) { return s.time >= t; });
		}

		// half open: [t_first, t_last)
		static Trigger between_time(const double t_first, const double t_last) {
			return Trigger([t_first, t_last](const TriggerState & s) { return t_first <= s.time && s.time < t_last; });
		}


		// -------
		// GENERIC
		// -------
		static Trigger always() {
			return Trigger([](const TriggerState &) { return true; });
		}

		static Trigger never() {
			return Trigger([](const TriggerState &) { return false; });
		}

		static Trigger when(Predicate p) {
			return Trigger(std::move(p));
		}


		// both operands are always evaluated so stateful triggers see every step
		friend Trigger operator&&(Trigger a, Trigger b) {
			return Trigger([a = std::move(a), b = std::move(b)](const TriggerState & s) {
				const bool x = a(s);
				const bool y = b(s);
				return x && y;
			});
		}

		friend Trigger operator||(Trigger a, Trigger b) {
			return Trigger([a = std::move(a), b = std::move(b)](const TriggerState & s) {
				const bool x = a(s);
				const bool y = b(s);
				return x || y;
			});
		}

		friend Trigger operator!(Trigger a) {
			return Trigger([a = std::move(a)](const TriggerState & s) { return !a(s); });
		}

	private:
		Predicate predicate;
	};
}
