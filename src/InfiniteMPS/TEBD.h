#pragma once

#include "InfiniteMPS.h"
#include "Hamiltonians.h"
#include "TEBDConfig.h"

#include <array>
#include <optional>

struct TEBDStepResult {
  std::array<Eigen::MatrixXcd, 2> density_matrices;
  double energy;
};

// One Trotter step of exp(-H dt) (or exp(-i H dt)) over both bonds, truncating to chi.
// First order applies bond 0 then bond 1; second order is the symmetric
// half-full-half splitting.
TEBDStepResult tebd_step(InfiniteMPS& mps, const Eigen::Matrix4cd& H, uint32_t chi, double dt, EvolutionType type, uint32_t trotter_order=2);

struct StageResult {
  uint32_t chi;
  double dt;
  uint32_t steps;
  double energy;
  double energy_change;
  double entropy;
  double truncation_error;
  bool converged;
};

class InfiniteTEBD {
  public:
    InfiniteTEBD(const TEBDConfig& config);
    InfiniteTEBD(const TEBDConfig& config, const InfiniteMPS& initial_state);

    StageResult run_stage(uint32_t chi, double dt);
    std::vector<StageResult> run();

    const InfiniteMPS& state() const {
      return mps;
    }

    const Eigen::Matrix4cd& hamiltonian() const {
      return H;
    }

    std::optional<double> exact_energy() const {
      return reference;
    }

  private:
    TEBDConfig config;
    EvolutionType evolution;
    Eigen::Matrix4cd H;
    std::optional<double> reference;
    InfiniteMPS mps;

    static InfiniteMPSOptions make_options(const TEBDConfig& config);
};
