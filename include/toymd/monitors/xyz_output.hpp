#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include <utility>

#include "toymd/core/context.hpp"
#include "toymd/monitors/monitor.hpp"


namespace toymd::monitor {

	// Trajectory in extended XYZ format, readable by OVITO and ASE. One frame holds
	// the particle count, a comment line with step and time, and one row per
	// particle with species, position and velocity. The initial state is the first frame.
	class XyzOutput final : public Monitor {
	public:
		explicit XyzOutput(
			shared::Trigger trig,
			std::string file_path = "output/trajectory.xyz",
			std::string species = "X")
		:
			Monitor(std::move(trig)), path(std::move(file_path)), symbol(std::move(species)) {}

		template<class S>
		void initialize(const core::SystemContext<S> & sys) {
			open();
			record(sys);
		}

		template<class S>
		void record(const core::SystemContext<S> & sys) {
			write_header(sys.size(), sys.step(), sys.time());
			for (size_t i = 0; i < sys.size(); ++i) {
				write_row(sys.position(i), sys.velocity(i));
			}
			end_frame();
		}

		void finalize();

		[[nodiscard]] size_t frames_written() const noexcept { return frames; }
		[[nodiscard]] const std::string& file() const noexcept { return path; }

	private:
		std::string path;
		std::string symbol;
		std::ofstream out;
		size_t frames = 0;

		void open();
		void write_header(size_t n, size_t step, double time);
		void write_row(const vec3 & position, const vec3 & velocity);

		// flushes the frame, throws std::runtime_error if any part of it failed to write
		void end_frame();
	};

}
