#pragma once

#include <Eigen/Dense>

#include <optional>
#include <string>

struct TEBDConfig;

enum class EvolutionType { Real, Imaginary };

EvolutionType parse_evolution_type(const std::string& s);
std::string evolution_type_to_string(EvolutionType type);

// Two-site Hamiltonians on |s_b s_a>, site a being the low bit.
Eigen::Matrix4cd xx_hamiltonian(double J);
Eigen::Matrix4cd xxz_hamiltonian(double J, double delta);
Eigen::Matrix4cd heisenberg_hamiltonian(double J);
Eigen::Matrix4cd ising_hamiltonian(double J, double g);

// exp(-i H dt) for real time, exp(-H dt) for imaginary time.
Eigen::Matrix4cd evolution_operator(const Eigen::Matrix4cd& H, double dt, EvolutionType type);

// Ground state energies per site in the thermodynamic limit
double xx_reference_energy(double J);
double heisenberg_reference_energy(double J);
double ising_reference_energy(double J, double g);

Eigen::Matrix4cd make_hamiltonian(const TEBDConfig& config);
std::optional<double> reference_energy(const TEBDConfig& config);
