#include "TEBD.h"
#include "Logger.hpp"
#include "Random.hpp"

#include <cmath>
#include <limits>

#include <fmt/format.h>

// Mean truncation error per step above which a stage is flagged
constexpr double truncation_warning_threshold = 1e-6;

static void trotter_step(InfiniteMPS& mps, const Eigen::Matrix4cd& U_full, const Eigen::Matrix4cd& U_half, uint32_t chi, uint32_t trotter_order) {
  if (trotter_order == 1) {
    mps.apply_two_site_gate(0, U_full, chi);
    mps.apply_two_site_gate(1, U_full, chi);
  } else if (trotter_order == 2) {
    mps.apply_two_site_gate(0, U_half, chi);
    mps.apply_two_site_gate(1, U_full, chi);
    mps.apply_two_site_gate(0, U_half, chi);
  } else {
    throw std::invalid_argument(fmt::format("Trotter order must be 1 or 2; received {}.", trotter_order));
  }
}

TEBDStepResult tebd_step(InfiniteMPS& mps, const Eigen::Matrix4cd& H, uint32_t chi, double dt, EvolutionType type, uint32_t trotter_order) {
  Eigen::Matrix4cd U_full = evolution_operator(H, dt, type);
  Eigen::Matrix4cd U_half = evolution_operator(H, dt/2.0, type);
  trotter_step(mps, U_full, U_half, chi, trotter_order);

  TEBDStepResult result;
  double energy = 0.0;
  for (uint32_t bond = 0; bond < 2; bond++) {
    result.density_matrices[bond] = mps.two_site_density_matrix(bond);
    energy += (result.density_matrices[bond] * H).trace().real();
  }
  result.energy = energy/2.0;

  return result;
}

InfiniteMPSOptions InfiniteTEBD::make_options(const TEBDConfig& config) {
  InfiniteMPSOptions options;
  options.sv_threshold = config.sv_threshold;
  options.environment_tolerance = config.environment_tolerance;
  options.environment_max_iterations = config.environment_max_iterations;
  return options;
}

InfiniteTEBD::InfiniteTEBD(const TEBDConfig& config) : config(config) {
  config.validate();
  evolution = parse_evolution_type(config.evolution);
  H = make_hamiltonian(config);
  reference = reference_energy(config);

  if (config.seed != 0) {
    Random::seed_rng(config.seed);
  }

  mps = InfiniteMPS::random(2, config.initial_bond_dimension, make_options(config));
}

InfiniteTEBD::InfiniteTEBD(const TEBDConfig& config, const InfiniteMPS& initial_state) : config(config), mps(initial_state) {
  config.validate();
  evolution = parse_evolution_type(config.evolution);
  H = make_hamiltonian(config);
  reference = reference_energy(config);

  if (mps.physical_dim() != 2) {
    throw std::invalid_argument(fmt::format("InfiniteTEBD requires a qubit chain; initial state has physical dimension {}.", mps.physical_dim()));
  }
  mps.set_options(make_options(config));
}

StageResult InfiniteTEBD::run_stage(uint32_t chi, double dt) {
  if (chi == 0 || dt <= 0.0) {
    throw std::invalid_argument(fmt::format("Invalid stage parameters chi = {}, dt = {}.", chi, dt));
  }

  Eigen::Matrix4cd U_full = evolution_operator(H, dt, evolution);
  Eigen::Matrix4cd U_half = evolution_operator(H, dt/2.0, evolution);

  mps.reset_truncation_error();

  StageResult result{chi, dt, 0, mps.energy(H), std::numeric_limits<double>::infinity(), 0.0, 0.0, false};
  double previous_energy = result.energy;

  while (result.steps < config.max_steps) {
    trotter_step(mps, U_full, U_half, chi, config.trotter_order);
    result.steps++;

    if (config.canonicalize_interval != 0 && result.steps % config.canonicalize_interval == 0) {
      mps.canonicalize();
    }

    if (result.steps % config.measure_interval == 0 || result.steps == config.max_steps) {
      result.energy = mps.energy(H);
      result.energy_change = std::abs(result.energy - previous_energy);
      previous_energy = result.energy;

      if (config.verbose) {
        fmt::print("chi = {:>3}, dt = {:.3e}, step = {:>6}, E = {:>16.12f}, dE = {:.3e}, S = {:.6f}, trunc = {:.3e}\n",
            chi, dt, result.steps, result.energy, result.energy_change, mps.entanglement_entropy(0), mps.truncation_error());
      }

      if (evolution == EvolutionType::Imaginary && result.energy_change < config.energy_tolerance) {
        result.converged = true;
        break;
      }
    }
  }

  // Real-time evolution conserves energy; a stage runs its full schedule
  if (evolution == EvolutionType::Real) {
    result.converged = true;
  }

  result.entropy = mps.entanglement_entropy(0);
  result.truncation_error = mps.truncation_error();

  if (!result.converged) {
    Logger::log_warning(fmt::format("Stage chi = {}, dt = {} did not converge within {} steps; last dE = {:.3e}.", chi, dt, config.max_steps, result.energy_change));
  }

  if (result.truncation_error/result.steps > truncation_warning_threshold) {
    Logger::log_warning(fmt::format("Stage chi = {}, dt = {} has mean truncation error {:.3e} per step.", chi, dt, result.truncation_error/result.steps));
  }

  Logger::log_info(fmt::format("Stage chi = {}, dt = {}: {} steps, E = {:.12f}, S = {:.6f}, converged = {}.",
        chi, dt, result.steps, result.energy, result.entropy, result.converged));

  return result;
}

std::vector<StageResult> InfiniteTEBD::run() {
  std::vector<StageResult> results;
  for (uint32_t chi : config.bond_dimensions) {
    for (double dt : config.time_steps) {
      results.push_back(run_stage(chi, dt));
    }
  }

  const StageResult& last = results.back();
  if (config.verbose) {
    fmt::print("Final energy per site: {:.12f} (chi = {}, {} evolution)\n", last.energy, mps.bond_dimension(0), config.evolution);
    if (reference) {
      fmt::print("Reference energy:      {:.12f}, error = {:.3e}\n", *reference, std::abs(last.energy - *reference));
    }
  }

  if (!config.checkpoint.empty()) {
    mps.save(config.checkpoint);
  }

  return results;
}
