#include "tests.hpp"

#include "TEBD.h"
#include "Instructions.hpp"
#include "Random.hpp"

#include <numbers>
#include <cstdio>
#include <algorithm>
#include <cmath>

#include <unsupported/Eigen/KroneckerProduct>

static TEBDConfig quiet_config(const std::string& model) {
  TEBDConfig config;
  config.model = model;
  config.verbose = false;
  config.seed = 271;
  return config;
}

static bool is_density_matrix(const Eigen::MatrixXcd& rho) {
  if (!is_close_eps(1e-8, rho.trace(), 1.0)) {
    return false;
  }

  if (!rho.isApprox(rho.adjoint(), 1e-8)) {
    return false;
  }

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(rho);
  return solver.eigenvalues().minCoeff() > -1e-8;
}

bool test_hamiltonians() {
  Eigen::Matrix4cd H = xx_hamiltonian(1.0);
  ASSERT(H.isApprox(H.adjoint()));
  // XX + YY maps |01> <-> |10> with amplitude 2 and annihilates |00>, |11>
  ASSERT(is_close(H(1, 2), 2.0, H(2, 1)));
  ASSERT(H.col(0).isZero() && H.col(3).isZero());

  Eigen::Matrix4cd Hi = ising_hamiltonian(1.0, 0.0);
  ASSERT(is_close(Hi(0, 0), -1.0, Hi(3, 3)));
  ASSERT(is_close(Hi(1, 1), 1.0, Hi(2, 2)));

  Eigen::Matrix4cd U = evolution_operator(H, 0.1, EvolutionType::Real);
  ASSERT((U * U.adjoint()).isApprox(Eigen::Matrix4cd::Identity()));

  ASSERT(is_close(xx_reference_energy(1.0), -4.0/std::numbers::pi));
  ASSERT(is_close_eps(1e-10, ising_reference_energy(1.0, 1.0), -4.0/std::numbers::pi));
  ASSERT(is_close_eps(1e-10, ising_reference_energy(1.0, 0.0), -1.0));
  ASSERT(is_close(heisenberg_reference_energy(1.0), 1.0 - 4.0*std::numbers::ln2));

  TEBDConfig config = quiet_config("xxz");
  config.delta = 0.5;
  ASSERT(!reference_energy(config).has_value());

  return true;
}

bool test_config() {
  TEBDConfig config = TEBDConfig::from_string(R"({"model": "ising", "g": 0.5, "bond_dimensions": [4, 8], "time_steps": [0.05], "verbose": false})");
  ASSERT(config.model == "ising");
  ASSERT(is_close(config.g, 0.5));
  ASSERT(config.bond_dimensions == std::vector<uint32_t>({4, 8}));
  ASSERT(config.time_steps.size() == 1);
  ASSERT(config.trotter_order == 2);

  TEBDConfig reread = TEBDConfig::from_string(config.to_string());
  ASSERT(reread.to_string() == config.to_string());

  ASSERT_THROWS(TEBDConfig::from_string(R"({"model": "potts"})"), std::invalid_argument);
  ASSERT_THROWS(TEBDConfig::from_string(R"({"bond_dimensions": [16, 8]})"), std::invalid_argument);
  ASSERT_THROWS(TEBDConfig::from_string(R"({"time_steps": [0.01, 0.1]})"), std::invalid_argument);
  ASSERT_THROWS(TEBDConfig::from_string(R"({"trotter_order": 3})"), std::invalid_argument);
  ASSERT_THROWS(TEBDConfig::from_string(R"({"evolution": "complex"})"), std::invalid_argument);
  ASSERT_THROWS(TEBDConfig::from_string(R"({"bond_dimension": 8})"), std::runtime_error);
  ASSERT_THROWS(TEBDConfig::from_file("nonexistent_config.json"), std::runtime_error);

  return true;
}

bool test_product_state() {
  Eigen::VectorXcd zero(2);
  zero << 1.0, 0.0;
  Eigen::VectorXcd plus(2);
  plus << 1.0, 1.0;

  InfiniteMPS mps = InfiniteMPS::product_state(zero, plus);
  ASSERT(mps.bond_dimension(0) == 1 && mps.bond_dimension(1) == 1);
  ASSERT(is_close(mps.entanglement_entropy(0), 0.0));

  Eigen::MatrixXcd rho_a = mps.one_site_density_matrix(0);
  Eigen::MatrixXcd rho_b = mps.one_site_density_matrix(1);
  ASSERT(is_close(rho_a(0, 0), 1.0));
  ASSERT(is_close(rho_b(0, 1), 0.5, rho_b(1, 0), rho_b(0, 0)));

  // <Z_A X_B> on bond 0 and <X_B Z_A> on bond 1
  Eigen::Matrix4cd ZX = Eigen::kroneckerProduct(gates::X::value, gates::Z::value);
  Eigen::Matrix4cd XZ = Eigen::kroneckerProduct(gates::Z::value, gates::X::value);
  ASSERT(is_close(mps.expectation(0, ZX), 1.0));
  ASSERT(is_close(mps.expectation(1, XZ), 1.0));
  ASSERT(is_close(mps.canonical_error(), 0.0));

  ASSERT_THROWS(mps.two_site_density_matrix(2), std::invalid_argument);
  ASSERT_THROWS(mps.apply_two_site_gate(0, Eigen::Matrix2cd::Identity(), 4), std::invalid_argument);
  ASSERT_THROWS(InfiniteMPS::random(2, 0), std::invalid_argument);

  return true;
}

bool test_canonicalize() {
  InfiniteMPS mps = InfiniteMPS::random(2, 6);
  ASSERT(mps.canonical_error() < 1e-6, fmt::format("Canonical error after initialization: {}", mps.canonical_error()));

  // Non-unitary gates break the canonical form
  Eigen::Matrix4cd H = xx_hamiltonian(1.0);
  for (size_t k = 0; k < 5; k++) {
    mps.apply_two_site_gate(0, evolution_operator(H, 0.5, EvolutionType::Imaginary), 6);
    mps.apply_two_site_gate(1, evolution_operator(H, 0.5, EvolutionType::Imaginary), 6);
  }

  std::array<Eigen::MatrixXcd, 2> rho = {mps.two_site_density_matrix(0), mps.two_site_density_matrix(1)};
  mps.canonicalize();

  ASSERT(mps.canonical_error() < 1e-6, fmt::format("Canonical error after canonicalize: {}", mps.canonical_error()));
  for (uint32_t bond = 0; bond < 2; bond++) {
    Eigen::MatrixXcd rho_ = mps.two_site_density_matrix(bond);
    ASSERT(is_density_matrix(rho_));
    ASSERT((rho[bond] - rho_).norm() < 1e-6, fmt::format("Density matrix on bond {} changed by {}", bond, (rho[bond] - rho_).norm()));

    std::vector<double> sv = mps.singular_values(bond);
    double total = 0.0;
    for (double s : sv) {
      total += s*s;
    }
    ASSERT(is_close_eps(1e-8, total, 1.0));
    ASSERT(std::is_sorted(sv.rbegin(), sv.rend()));
  }

  return true;
}

bool test_xx_ground_state() {
  TEBDConfig config = quiet_config("xx");
  config.bond_dimensions = {8, 16};
  config.time_steps = {0.1, 0.01};

  InfiniteTEBD tebd(config);
  std::vector<StageResult> results = tebd.run();
  ASSERT(results.size() == 4);

  double E = results.back().energy;
  double E0 = tebd.exact_energy().value();
  ASSERT(std::abs(E - E0) < 1e-2, fmt::format("E = {}, E0 = {}", E, E0));
  // Variational
  ASSERT(E > E0 - 1e-6);
  ASSERT(tebd.state().bond_dimension(0) <= 16);
  ASSERT(tebd.state().entanglement_entropy(0) > 0.1);

  return true;
}

bool test_ising_ground_state() {
  TEBDConfig config = quiet_config("ising");
  config.g = 0.5;
  config.bond_dimensions = {8};
  config.time_steps = {0.1, 0.01};

  InfiniteTEBD tebd(config);
  std::vector<StageResult> results = tebd.run();

  double E = results.back().energy;
  double E0 = ising_reference_energy(1.0, 0.5);
  ASSERT(std::abs(E - E0) < 1e-3, fmt::format("E = {}, E0 = {}", E, E0));

  return true;
}

bool test_tebd_step() {
  Eigen::VectorXcd zero(2);
  zero << 1.0, 0.0;

  // |00...> is annihilated by XX + YY, so real-time evolution leaves it unchanged
  InfiniteMPS mps = InfiniteMPS::product_state(zero, zero);
  Eigen::Matrix4cd H = xx_hamiltonian(1.0);

  for (size_t k = 0; k < 20; k++) {
    TEBDStepResult result = tebd_step(mps, H, 8, 0.05, EvolutionType::Real, 1);
    ASSERT(is_close(result.energy, 0.0));
    for (const auto& rho : result.density_matrices) {
      ASSERT(is_density_matrix(rho));
      ASSERT(is_close(rho(0, 0), 1.0));
    }
  }
  ASSERT(mps.bond_dimension(0) == 1);

  // A Neel state is not an eigenstate, but real-time evolution keeps it normalized
  Eigen::VectorXcd one(2);
  one << 0.0, 1.0;
  InfiniteMPS neel = InfiniteMPS::product_state(zero, one);
  double E = neel.energy(H);
  for (size_t k = 0; k < 20; k++) {
    TEBDStepResult result = tebd_step(neel, H, 16, 0.01, EvolutionType::Real, 2);
    for (const auto& rho : result.density_matrices) {
      ASSERT(is_density_matrix(rho));
    }
    ASSERT(is_close_eps(1e-3, result.energy, E), fmt::format("Energy drifted from {} to {}", E, result.energy));
  }
  ASSERT(neel.entanglement_entropy(0) > 0.0);

  ASSERT_THROWS(tebd_step(neel, H, 16, 0.01, EvolutionType::Real, 3), std::invalid_argument);

  return true;
}

bool test_save_load() {
  InfiniteMPS mps = InfiniteMPS::random(2, 4);
  Eigen::Matrix4cd H = heisenberg_hamiltonian(1.0);
  tebd_step(mps, H, 4, 0.1, EvolutionType::Imaginary);

  std::string path = "test_itebd_checkpoint.eve";
  mps.save(path);
  InfiniteMPS loaded = InfiniteMPS::load(path);
  std::remove(path.c_str());

  ASSERT(loaded.physical_dim() == 2);
  for (uint32_t bond = 0; bond < 2; bond++) {
    ASSERT(loaded.bond_dimension(bond) == mps.bond_dimension(bond));
    ASSERT(loaded.two_site_density_matrix(bond).isApprox(mps.two_site_density_matrix(bond), 1e-8));
  }
  ASSERT(is_close(loaded.energy(H), mps.energy(H)));
  ASSERT(is_close(loaded.truncation_error(), mps.truncation_error()));

  std::vector<char> bytes = mps.serialize();
  bytes.resize(bytes.size()/2);
  ASSERT_THROWS(loaded.deserialize(bytes), std::runtime_error);
  ASSERT_THROWS(InfiniteMPS::load("nonexistent_checkpoint.eve"), std::runtime_error);

  return true;
}

bool test_stage_not_converged() {
  TEBDConfig config = quiet_config("xx");
  config.bond_dimensions = {4, 6};
  config.time_steps = {0.1, 0.05};
  config.max_steps = 5;
  config.measure_interval = 2;
  config.energy_tolerance = 0.0;

  InfiniteTEBD tebd(config);
  StageResult result = tebd.run_stage(4, 0.1);
  ASSERT(!result.converged);
  ASSERT(result.steps == 5);
  ASSERT(std::isfinite(result.energy));

  // Unconverged stages do not stop the schedule
  std::vector<StageResult> results = tebd.run();
  ASSERT(results.size() == 4);
  for (const auto& r : results) {
    ASSERT(!r.converged);
    ASSERT(r.steps == 5, fmt::format("Stage chi = {}, dt = {} ran {} steps.", r.chi, r.dt, r.steps));
  }
  ASSERT(results.back().chi == 6 && is_close(results.back().dt, 0.05));

  return true;
}

bool test_real_time_stage() {
  TEBDConfig config = quiet_config("xx");
  config.bond_dimensions = {8};
  config.time_steps = {0.05};
  config.max_steps = 6;
  config.measure_interval = 2;
  // Larger than any energy change of a bounded two-site Hamiltonian
  config.energy_tolerance = 10.0;

  TEBDConfig imaginary = config;
  InfiniteTEBD imaginary_tebd(imaginary);
  StageResult result = imaginary_tebd.run_stage(8, 0.05);
  ASSERT(result.converged && result.steps == 2);

  config.evolution = "real";
  InfiniteTEBD tebd(config);
  double E = tebd.state().energy(tebd.hamiltonian());
  result = tebd.run_stage(16, 0.05);
  ASSERT(result.converged);
  ASSERT(result.steps == 6, fmt::format("Real-time stage stopped after {} steps.", result.steps));
  ASSERT(is_close_eps(1e-1, result.energy, E), fmt::format("Energy drifted from {} to {}", E, result.energy));

  return true;
}

bool test_environment_iteration_cap() {
  InfiniteMPS mps = InfiniteMPS::random(2, 4);

  // Leave the canonical form so the environments are nontrivial
  Eigen::Matrix4cd H = heisenberg_hamiltonian(1.0);
  for (size_t k = 0; k < 3; k++) {
    mps.apply_two_site_gate(0, evolution_operator(H, 0.5, EvolutionType::Imaginary), 4);
    mps.apply_two_site_gate(1, evolution_operator(H, 0.5, EvolutionType::Imaginary), 4);
  }

  InfiniteMPSOptions options = mps.get_options();
  options.environment_max_iterations = 1;
  options.environment_tolerance = 0.0;
  mps.set_options(options);
  ASSERT(mps.get_options().environment_max_iterations == 1);

  for (uint32_t bond = 0; bond < 2; bond++) {
    Eigen::MatrixXcd rho = mps.two_site_density_matrix(bond);
    ASSERT(rho.rows() == 4 && rho.cols() == 4);
    ASSERT(is_density_matrix(rho));

    Eigen::MatrixXcd rho1 = mps.one_site_density_matrix(bond);
    ASSERT(is_density_matrix(rho1));
  }
  ASSERT(std::isfinite(mps.energy(H)));

  return true;
}

bool test_run_checkpoint() {
  std::string path = "test_itebd_run_checkpoint.eve";
  std::remove(path.c_str());

  TEBDConfig config = quiet_config("heisenberg");
  config.bond_dimensions = {4};
  config.time_steps = {0.1};
  config.max_steps = 20;
  config.checkpoint = path;

  InfiniteTEBD tebd(config);
  tebd.run();

  InfiniteMPS loaded = InfiniteMPS::load(path);
  std::remove(path.c_str());

  const InfiniteMPS& mps = tebd.state();
  for (uint32_t bond = 0; bond < 2; bond++) {
    ASSERT(loaded.bond_dimension(bond) == mps.bond_dimension(bond));
    ASSERT(loaded.two_site_density_matrix(bond).isApprox(mps.two_site_density_matrix(bond), 1e-8));
  }
  ASSERT(is_close(loaded.energy(tebd.hamiltonian()), mps.energy(tebd.hamiltonian())));

  // No checkpoint when the path is empty
  config.checkpoint = "";
  InfiniteTEBD unsaved(config);
  unsaved.run();
  ASSERT_THROWS(InfiniteMPS::load(path), std::runtime_error);

  return true;
}

int main(int argc, char *argv[]) {
  Random::seed_rng(314);

  std::map<std::string, TestResult> tests;
  std::set<std::string> test_names;

  bool run_all = (argc == 1);

  if (!run_all) {
    for (int i = 1; i < argc; i++) {
      test_names.insert(argv[i]);
    }
  }

  ADD_TEST(test_hamiltonians);
  ADD_TEST(test_config);
  ADD_TEST(test_product_state);
  ADD_TEST(test_canonicalize);
  ADD_TEST(test_tebd_step);
  ADD_TEST(test_save_load);
  ADD_TEST(test_stage_not_converged);
  ADD_TEST(test_real_time_stage);
  ADD_TEST(test_environment_iteration_cap);
  ADD_TEST(test_run_checkpoint);
  ADD_TEST(test_xx_ground_state);
  ADD_TEST(test_ising_ground_state);

  return report_tests(tests);
}
