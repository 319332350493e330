#pragma once

#include <vector>
#include <variant>
#include <utility>
#include <Eigen/Dense>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "Random.hpp"
#include "Support.hpp"

namespace quantumcircuit_utils {
  template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
  template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

bool qargs_unique(const Qubits& qubits);
void validate_qargs(const Qubits& qubits, uint32_t num_qubits);

Eigen::MatrixXcd haar_unitary(uint32_t num_qubits);

Eigen::MatrixXcd full_circuit_unitary(const Eigen::MatrixXcd &gate, const Qubits &qubits, uint32_t total_qubits);

// True if A = e^{i phi} B for some phi.
bool equal_up_to_phase(const Eigen::MatrixXcd& A, const Eigen::MatrixXcd& B, double tol=1e-8);
