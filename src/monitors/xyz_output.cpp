#include "toymd/monitors/xyz_output.hpp"

#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>


namespace toymd::monitor {

	void XyzOutput::open() {
		namespace fs = std::filesystem;

		const fs::path full_path(path);
		if (full_path.has_parent_path()) {
			fs::create_directories(full_path.parent_path());
		}

		out = std::ofstream(full_path, std::ios::trunc);
		if (!out) throw std::runtime_error("Failed to create output file: " + full_path.string());

		out.precision(std::numeric_limits<double>::digits10);
		frames = 0;
	}

	void XyzOutput::finalize() {
		if (out.is_open()) {
			out.close();
			if (!out) throw std::runtime_error("Failed to close output file: " + path);
		}
	}

	void XyzOutput::end_frame() {
		out.flush();
		if (!out) {
			throw std::runtime_error("Failed to write frame " + std::to_string(frames) + " to " + path);
		}
		++frames;
	}

	void XyzOutput::write_header(const size_t n, const size_t step, const double time) {
		out << n << '\n';
		out << "Properties=species:S:1:pos:R:3:velo:R:3"
			<< " Step=" << step
			<< " Time=" << time << '\n';
	}

	void XyzOutput::write_row(const vec3 & position, const vec3 & velocity) {
		out << symbol << ' '
			<< position.x << ' ' << position.y << ' ' << position.z << ' '
			<< velocity.x << ' ' << velocity.y << ' ' << velocity.z << '\n';
	}
}
