#pragma once
#include <cstdint>
#include <concepts>

#include "toymd/math/vec3.hpp"


namespace toymd {
	using vec3 = math::Vec3<double>;
	using uint3 = math::Vec3<uint32_t>;

	using ParticleID = uint32_t;

	template <typename T, typename... Ts>
	concept same_as_any = (... or std::same_as<T, Ts>);

} // namespace toymd
