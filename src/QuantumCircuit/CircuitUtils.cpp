#include "CircuitUtils.h"

#include <unordered_set>
#include <fmt/format.h>
#include <fmt/ranges.h>

bool qargs_unique(const Qubits& qubits) {
  std::unordered_set<uint32_t> unique;
  for (auto const &q : qubits) {
    if (unique.count(q) > 0) {
      return false;
    }
    unique.insert(q);
  }

  return true;
}

void validate_qargs(const Qubits& qubits, uint32_t num_qubits) {
  for (auto const q : qubits) {
    if (q >= num_qubits) {
      throw std::invalid_argument(fmt::format("Qubits {} outside of acceptable range for circuit with {} qubits.", qubits, num_qubits));
    }
  }

  if (!qargs_unique(qubits)) {
    throw std::invalid_argument(fmt::format("Qubits {} are not unique.", qubits));
  }
}

Eigen::MatrixXcd haar_unitary(uint32_t num_qubits) {
  Eigen::MatrixXcd z = Eigen::MatrixXcd::Zero(1u << num_qubits, 1u << num_qubits);

  for (uint32_t r = 0; r < z.rows(); r++) {
    for (uint32_t c = 0; c < z.cols(); c++) {
      z(r, c) = std::complex<double>(randn(), randn());
    }
  }

  Eigen::MatrixXcd q, r;
  Eigen::HouseholderQR<Eigen::MatrixXcd> qr(z);

  q = qr.householderQ();
  r = qr.matrixQR().triangularView<Eigen::Upper>();

  Eigen::MatrixXcd d = Eigen::MatrixXcd::Zero(1u << num_qubits, 1u << num_qubits);
  d.diagonal() = r.diagonal().cwiseQuotient(r.diagonal().cwiseAbs());

  return q * d;
}

Eigen::MatrixXcd full_circuit_unitary(const Eigen::MatrixXcd &gate, const Qubits &qubits, uint32_t total_qubits) {
  if (total_qubits < qubits.size()) {
    throw std::invalid_argument("Too many qubits provided for gate.");
  }

  if (!((1u << qubits.size()) == gate.rows() && (1u << qubits.size()) == gate.cols())) {
    throw std::invalid_argument(fmt::format("Gate of shape {}x{} has invalid dimensions for qubits {}.", gate.rows(), gate.cols(), qubits));
  }

  uint32_t s = 1u << total_qubits;
  uint32_t h = 1u << qubits.size();

  Eigen::MatrixXcd full_gate = Eigen::MatrixXcd::Zero(s, s);
  for (uint32_t i = 0; i < s; i++) {
    // Bits of i on the gate support, packed so that qubits[k] is bit k
    uint32_t r = 0;
    for (uint32_t k = 0; k < qubits.size(); k++) {
      uint32_t x = (i >> qubits[k]) & 1u;
      r |= (x << k);
    }

    for (uint32_t c = 0; c < h; c++) {
      uint32_t j = i;
      for (uint32_t k = 0; k < qubits.size(); k++) {
        uint32_t x = (c >> k) & 1u;
        j = (j & ~(1u << qubits[k])) | (x << qubits[k]);
      }

      full_gate(i, j) = gate(r, c);
    }
  }

  return full_gate;
}

bool equal_up_to_phase(const Eigen::MatrixXcd& A, const Eigen::MatrixXcd& B, double tol) {
  if (A.rows() != B.rows() || A.cols() != B.cols()) {
    return false;
  }

  // Fix the phase from the largest entry of B
  Eigen::Index r, c;
  B.cwiseAbs().maxCoeff(&r, &c);
  if (std::abs(B(r, c)) < tol) {
    return A.norm() < tol;
  }

  std::complex<double> phase = A(r, c) / B(r, c);
  if (std::abs(std::abs(phase) - 1.0) > tol) {
    return false;
  }

  return (A - phase * B).norm() < tol;
}
