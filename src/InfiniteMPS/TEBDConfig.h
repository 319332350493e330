#pragma once

#include <string>
#include <vector>
#include <cstdint>

struct TEBDConfig {
  // One of xx, xxz, heisenberg, ising
  std::string model = "xx";
  double J = 1.0;
  double delta = 1.0;
  double g = 1.0;

  // imaginary or real
  std::string evolution = "imaginary";

  // Stages run over every (chi, dt) pair: chi ascending in the outer loop, dt descending in the inner loop
  std::vector<uint32_t> bond_dimensions = {8, 16};
  std::vector<double> time_steps = {0.1, 0.01};

  uint32_t max_steps = 2000;
  uint32_t measure_interval = 10;
  double energy_tolerance = 1e-8;
  uint32_t trotter_order = 2;
  // 0 disables
  uint32_t canonicalize_interval = 10;

  double environment_tolerance = 1e-12;
  uint32_t environment_max_iterations = 5000;
  double sv_threshold = 1e-10;

  uint32_t initial_bond_dimension = 2;
  // 0 leaves the generator unseeded
  uint32_t seed = 0;
  // Empty disables
  std::string checkpoint = "";
  bool verbose = true;

  void validate() const;

  static TEBDConfig from_file(const std::string& path);
  static TEBDConfig from_string(const std::string& json);
  std::string to_string() const;
};
