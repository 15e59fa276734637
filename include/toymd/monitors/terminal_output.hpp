#pragma once

#include <iomanip>
#include <iostream>
#include <ostream>

#include "toymd/core/context.hpp"
#include "toymd/monitors/monitor.hpp"

namespace toymd::monitor {

	// One log line per trigger: step, time, energies and temperature.
	class TerminalOutput final : public Monitor {
	public:
		explicit TerminalOutput(shared::Trigger trig = shared::Trigger::always(), std::ostream & stream = std::cout)
			: Monitor(std::move(trig)), out(&stream) {}

		template<class S>
		void initialize(const core::SystemContext<S> & sys) const {
			*out << std::left
				<< std::setw(10) << "step"
				<< std::setw(14) << "time"
				<< std::setw(16) << "E_kin"
				<< std::setw(16) << "E_pot"
				<< std::setw(16) << "E_tot"
				<< "T" << "\n";
			record(sys);
		}

		template<class S>
		void record(const core::SystemContext<S> & sys) const {
			const double kinetic = sys.kinetic_energy();
			const double potential = sys.potential_energy();

			*out << std::left << std::setprecision(8)
				<< std::setw(10) << sys.step()
				<< std::setw(14) << sys.time()
				<< std::setw(16) << kinetic
				<< std::setw(16) << potential
				<< std::setw(16) << kinetic + potential
				<< sys.temperature() << "\n";
		}

	private:
		std::ostream * out;
	};
}
