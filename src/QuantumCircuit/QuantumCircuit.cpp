#include "QuantumCircuit.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <queue>
#include <algorithm>

std::string QuantumCircuit::to_string() const {
  std::string s = "";
  for (auto const &inst : instructions) {
    s += fmt::format("{}\n", inst);
  }

  return s;
}

uint32_t QuantumCircuit::length() const {
  return instructions.size();
}

size_t QuantumCircuit::get_num_measurements() const {
  return std::ranges::count_if(instructions, [](const Instruction& inst) { return !instruction_is_unitary(inst); });
}

size_t QuantumCircuit::count_gates(const std::string& label) const {
  size_t n = 0;
  for (auto const &inst : instructions) {
    if (auto gate = std::get_if<std::shared_ptr<Gate>>(&inst)) {
      if ((*gate)->label() == label) {
        n++;
      }
    }
  }

  return n;
}

bool QuantumCircuit::is_unitary() const {
  return std::ranges::all_of(instructions, instruction_is_unitary);
}

bool QuantumCircuit::is_clifford() const {
  for (auto const& inst : instructions) {
    bool valid = std::visit(quantumcircuit_utils::overloaded {
      [](const std::shared_ptr<Gate>& gate) { return gate->is_clifford(); },
      [](const Measurement& m) { return true; }
    }, inst);

    if (!valid) {
      return false;
    }
  }

  return true;
}

void QuantumCircuit::validate_instruction(const Instruction& inst) const {
  std::visit(quantumcircuit_utils::overloaded {
    [&](const std::shared_ptr<Gate>& gate) {
      if (gate == nullptr) {
        throw std::invalid_argument("Cannot add a null gate to a QuantumCircuit.");
      }
      validate_qargs(gate->qubits, num_qubits);
    },
    [&](const Measurement& m) {
      validate_qargs(m.qubits, num_qubits);
      if (m.cbit >= num_cbits) {
        throw std::invalid_argument(fmt::format("Invalid classical bit {} passed to QuantumCircuit with {} classical bits.", m.cbit, num_cbits));
      }
    }
  }, inst);
}

void QuantumCircuit::add_instruction(const Instruction& inst) {
  validate_instruction(inst);
  instructions.push_back(inst);
}

void QuantumCircuit::add_measurement(const Measurement& m) {
  add_instruction(m);
}

void QuantumCircuit::add_gate(const std::shared_ptr<Gate> &gate) {
  add_instruction(gate);
}

void QuantumCircuit::add_gate(const std::string& name, const Qubits& qubits, const std::vector<double>& params) {
  add_gate(make_gate(name, qubits, params));
}

void QuantumCircuit::add_gate(const Eigen::MatrixXcd& gate, const Qubits& qubits, const std::string& label) {
  add_gate(std::make_shared<MatrixGate>(gate, qubits, label));
}

void QuantumCircuit::append(const QuantumCircuit& other) {
  if (num_qubits != other.num_qubits) {
    throw std::invalid_argument(fmt::format("Cannot append QuantumCircuit with {} qubits to QuantumCircuit with {} qubits.", other.num_qubits, num_qubits));
  }

  num_cbits = std::max(num_cbits, other.num_cbits);
  for (auto const &inst : other.instructions) {
    add_instruction(copy_instruction(inst));
  }
}

void QuantumCircuit::append(const Instruction& inst) {
  add_instruction(copy_instruction(inst));
}

QuantumCircuit QuantumCircuit::adjoint() const {
  if (!is_unitary()) {
    throw std::invalid_argument("Cannot take the adjoint of a QuantumCircuit containing measurements.");
  }

  QuantumCircuit qc(num_qubits, num_cbits);
  for (auto it = instructions.rbegin(); it != instructions.rend(); ++it) {
    qc.add_gate(std::get<std::shared_ptr<Gate>>(*it)->adjoint());
  }

  return qc;
}

Eigen::MatrixXcd QuantumCircuit::to_matrix() const {
  if (num_qubits > 15) {
    throw std::runtime_error("Cannot convert QuantumCircuit with n > 15 qubits to matrix.");
  }

  Eigen::MatrixXcd Q = Eigen::MatrixXcd::Identity(1u << num_qubits, 1u << num_qubits);

  uint32_t p = num_qubits;
  for (auto const &inst : instructions) {
    std::visit(quantumcircuit_utils::overloaded {
      [&Q, p](const std::shared_ptr<Gate>& gate) { Q = full_circuit_unitary(gate->define(), gate->qubits, p) * Q; },
      [](const Measurement& m) { throw std::invalid_argument("Cannot convert measurement to matrix."); }
    }, inst);
  }

  return Q;
}

CircuitDAG QuantumCircuit::to_dag() const {
  CircuitDAG dag(length());

  std::vector<std::queue<size_t>> covers(num_qubits);
  std::vector<Qubits> supports(length());

  for (size_t i = 0; i < length(); i++) {
    const Instruction& inst = instructions[i];
    dag.set_val(i, copy_instruction(inst));

    supports[i] = get_instruction_support(inst);
    for (uint32_t q : supports[i]) {
      covers[q].push(i);
    }
  }

  for (size_t i = 0; i < length(); i++) {
    for (uint32_t q : supports[i]) {
      covers[q].pop();
      if (covers[q].size() > 0) {
        dag.add_edge(i, covers[q].front());
      }
    }
  }

  return dag;
}

QuantumCircuit QuantumCircuit::from_dag(const CircuitDAG& dag, uint32_t num_qubits, uint32_t num_cbits) {
  QuantumCircuit qc(num_qubits, num_cbits);
  for (uint32_t i : dag.topological_order()) {
    qc.add_instruction(copy_instruction(dag.get_val(i)));
  }

  return qc;
}
