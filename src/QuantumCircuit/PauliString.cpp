#include "PauliString.hpp"
#include "Instructions.hpp"
#include "QuantumCircuit.h"

void PauliString::evolve(const Gate& gate) {
  auto symbolic = dynamic_cast<const SymbolicGate*>(&gate);
  if (symbolic == nullptr || !symbolic->is_clifford()) {
    throw std::invalid_argument(fmt::format("Gate \"{}\" is not a Clifford gate; cannot evolve PauliString.", gate.label()));
  }

  for (auto q : gate.qubits) {
    if (q >= num_qubits) {
      throw std::invalid_argument(fmt::format("Gate on qubits {} does not fit a PauliString with {} qubits.", gate.qubits, num_qubits));
    }
  }

  const Qubits& q = gate.qubits;
  switch (symbolic->type) {
    case SymbolicGate::GateLabel::I:
      break;
    case SymbolicGate::GateLabel::H:
      h(q[0]);
      break;
    case SymbolicGate::GateLabel::X:
      x(q[0]);
      break;
    case SymbolicGate::GateLabel::Y:
      y(q[0]);
      break;
    case SymbolicGate::GateLabel::Z:
      z(q[0]);
      break;
    case SymbolicGate::GateLabel::S:
      s(q[0]);
      break;
    case SymbolicGate::GateLabel::Sd:
      sd(q[0]);
      break;
    case SymbolicGate::GateLabel::SX:
      sx(q[0]);
      break;
    case SymbolicGate::GateLabel::SXd:
      sxd(q[0]);
      break;
    case SymbolicGate::GateLabel::CX:
      cx(q[0], q[1]);
      break;
    case SymbolicGate::GateLabel::CY:
      cy(q[0], q[1]);
      break;
    case SymbolicGate::GateLabel::CZ:
      cz(q[0], q[1]);
      break;
    case SymbolicGate::GateLabel::SWAP:
      swap(q[0], q[1]);
      break;
    default:
      throw std::invalid_argument(fmt::format("Invalid instruction \"{}\" provided to PauliString.evolve.", gate.label()));
  }
}

void PauliString::evolve(const QuantumCircuit& qc) {
  if (qc.get_num_qubits() != num_qubits) {
    throw std::invalid_argument(fmt::format("Cannot evolve a PauliString with {} qubits with a QuantumCircuit with {} qubits.", num_qubits, qc.get_num_qubits()));
  }

  for (auto const &inst : qc.instructions) {
    std::visit(quantumcircuit_utils::overloaded{
      [this](const std::shared_ptr<Gate>& gate) {
        evolve(*gate);
      },
      [](const Measurement& m) {
        throw std::invalid_argument("Cannot evolve a PauliString through a measurement.");
      }
    }, inst);
  }
}
