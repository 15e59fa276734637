#pragma once
#include "toymd/base/types.hpp"

#include "toymd/math/vec3.hpp"
#include "toymd/math/dual.hpp"
#include "toymd/math/autodiff.hpp"
#include "toymd/math/statistics.hpp"

#include "toymd/env/particle.hpp"
#include "toymd/env/generators.hpp"
#include "toymd/env/environment.hpp"

#include "toymd/potentials/potential.hpp"
#include "toymd/potentials/evaluate.hpp"
#include "toymd/potentials/lennard_jones.hpp"
#include "toymd/potentials/morse.hpp"
#include "toymd/potentials/harmonic.hpp"
#include "toymd/potentials/inverse_distance.hpp"
#include "toymd/potentials/no_potential.hpp"
#include "toymd/potentials/custom.hpp"

#include "toymd/monitors/monitor.hpp"
#include "toymd/monitors/energy_monitor.hpp"
#include "toymd/monitors/terminal_output.hpp"
#include "toymd/monitors/xyz_output.hpp"
#include "toymd/monitors/progressbar.hpp"
#include "toymd/monitors/benchmark.hpp"

#include "toymd/integrators/integrator.hpp"
#include "toymd/integrators/forward_euler.hpp"
#include "toymd/integrators/symplectic_euler.hpp"
#include "toymd/integrators/velocity_verlet.hpp"
#include "toymd/integrators/yoshida4.hpp"

#include "toymd/core/build.hpp"
#include "toymd/core/system.hpp"
#include "toymd/core/context.hpp"


namespace toymd {

	// Math
	using math::Dual;
	using math::derivative;
	using math::value_and_derivative;
	using math::gradient;

	// Environment
	using env::Environment;

	using env::ParticleCuboid;
	using env::ParticleSphere;
	using env::ParticleView;
	using env::ParticleRef;
	using env::Particle;

	// Potentials
	using potential::Potential;
	using potential::LennardJones;
	using potential::Morse;
	using potential::Harmonic;
	using potential::InverseDistance;
	using potential::NoPotential;
	using potential::Custom;

	// System
	using core::System;
	using core::build_system;
	using core::BuildInfo;
	using core::SystemContext;

	// Monitors
	using monitor::monitors;
	using monitor::Monitor;
	using monitor::EnergyMonitor;
	using monitor::EnergySample;
	using monitor::TerminalOutput;
	using monitor::XyzOutput;
	using monitor::ProgressBar;
	using monitor::Benchmark;

	// Integrators
	using integrator::ForwardEuler;
	using integrator::SymplecticEuler;
	using integrator::VelocityVerlet;
	using integrator::Yoshida4;

	// shared
	using shared::Trigger;
}
