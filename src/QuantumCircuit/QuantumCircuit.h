#pragma once

#include "CircuitUtils.h"
#include "Instructions.hpp"
#include "Graph.hpp"

#include <iostream>

#include <fmt/format.h>

// --- Definitions for QuantumCircuit --- //

// Vertex i holds instruction i; an edge i -> j means j is the next instruction
// acting on one of the qubits of i.
using CircuitDAG = DirectedGraph<Instruction>;

class QuantumCircuit {
  private:
    uint32_t num_qubits;
    uint32_t num_cbits;

  public:
    std::vector<Instruction> instructions;

    QuantumCircuit() : num_qubits(0), num_cbits(0) {}

    QuantumCircuit(uint32_t num_qubits, uint32_t num_cbits=0) : num_qubits(num_qubits), num_cbits(num_cbits) {}

    QuantumCircuit(const QuantumCircuit& qc) : num_qubits(qc.num_qubits), num_cbits(qc.num_cbits) {
      append(qc);
    }

    QuantumCircuit& operator=(const QuantumCircuit& qc) {
      if (this != &qc) {
        num_qubits = qc.num_qubits;
        num_cbits = qc.num_cbits;
        instructions.clear();
        append(qc);
      }
      return *this;
    }

    uint32_t get_num_qubits() const {
      return num_qubits;
    }

    uint32_t get_num_cbits() const {
      return num_cbits;
    }

    std::string to_string() const;
    friend std::ostream& operator<<(std::ostream& stream, const QuantumCircuit& qc) {
      stream << qc.to_string();
      return stream;
    }

    uint32_t length() const;
    size_t get_num_measurements() const;
    size_t count_gates(const std::string& label) const;

    bool is_unitary() const;
    bool is_clifford() const;

    void validate_instruction(const Instruction& inst) const;

    void add_instruction(const Instruction& inst);
    void add_measurement(const Measurement& m);
    void add_measurement(uint32_t qubit, uint32_t cbit) {
      add_measurement(Measurement(qubit, cbit));
    }

    void add_gate(const std::string& name, const Qubits& qubits, const std::vector<double>& params={});
    void add_gate(const std::shared_ptr<Gate> &gate);
    void add_gate(const Eigen::MatrixXcd& gate, const Qubits& qubits, const std::string& label="U");

    void id(uint32_t q) {
      add_gate("id", {q});
    }

    void h(uint32_t q) {
      add_gate("h", {q});
    }

    void x(uint32_t q) {
      add_gate("x", {q});
    }

    void y(uint32_t q) {
      add_gate("y", {q});
    }

    void z(uint32_t q) {
      add_gate("z", {q});
    }

    void s(uint32_t q) {
      add_gate("s", {q});
    }

    void sd(uint32_t q) {
      add_gate("sd", {q});
    }

    void sx(uint32_t q) {
      add_gate("sx", {q});
    }

    void sxd(uint32_t q) {
      add_gate("sxd", {q});
    }

    void t(uint32_t q) {
      add_gate("t", {q});
    }

    void td(uint32_t q) {
      add_gate("td", {q});
    }

    void rx(uint32_t q, double theta) {
      add_gate("rx", {q}, {theta});
    }

    void ry(uint32_t q, double theta) {
      add_gate("ry", {q}, {theta});
    }

    void rz(uint32_t q, double theta) {
      add_gate("rz", {q}, {theta});
    }

    void cx(uint32_t q1, uint32_t q2) {
      add_gate("cx", {q1, q2});
    }

    void cy(uint32_t q1, uint32_t q2) {
      add_gate("cy", {q1, q2});
    }

    void cz(uint32_t q1, uint32_t q2) {
      add_gate("cz", {q1, q2});
    }

    void swap(uint32_t q1, uint32_t q2) {
      add_gate("swap", {q1, q2});
    }

    void measure(uint32_t q, uint32_t c) {
      add_measurement(q, c);
    }

    void append(const QuantumCircuit& other);
    void append(const Instruction& inst);

    QuantumCircuit adjoint() const;

    Eigen::MatrixXcd to_matrix() const;

    CircuitDAG to_dag() const;
    static QuantumCircuit from_dag(const CircuitDAG& dag, uint32_t num_qubits, uint32_t num_cbits=0);
};

template <>
struct fmt::formatter<QuantumCircuit> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const QuantumCircuit& qc, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", qc.to_string());
  }
};
