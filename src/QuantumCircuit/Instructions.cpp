#include "Instructions.hpp"

std::shared_ptr<Gate> make_gate(const std::string& name, const Qubits& qubits, const std::vector<double>& params) {
  if (auto axis = RotationGate::parse_axis(name)) {
    if (params.size() != 1) {
      throw std::invalid_argument(fmt::format("Rotation gate {} expects one angle; received {}.", name, params.size()));
    }
    return std::make_shared<RotationGate>(axis.value(), qubits, params[0]);
  }

  if (params.size() != 0) {
    throw std::invalid_argument(fmt::format("Gate {} does not take parameters; received {}.", name, params));
  }

  return std::make_shared<SymbolicGate>(name, qubits);
}

Instruction copy_instruction(const Instruction& inst) {
  return std::visit(quantumcircuit_utils::overloaded {
    [](const std::shared_ptr<Gate>& gate) {
      return Instruction(gate->clone());
    },
    [](const Measurement& m) {
      return Instruction(Measurement(m.qubit(), m.cbit));
    }
  }, inst);
}

Qubits get_instruction_support(const Instruction& inst) {
  return std::visit(quantumcircuit_utils::overloaded {
    [](const std::shared_ptr<Gate>& gate) {
      return gate->qubits;
    },
    [](const Measurement& m) {
      return m.qubits;
    }
  }, inst);
}

bool instruction_is_unitary(const Instruction& inst) {
  return std::holds_alternative<std::shared_ptr<Gate>>(inst);
}

std::string instruction_to_string(const Instruction& inst) {
  return std::visit(quantumcircuit_utils::overloaded {
    [](const std::shared_ptr<Gate>& gate) {
      std::vector<double> params = gate->params();
      if (params.empty()) {
        return fmt::format("{} {}", gate->label(), gate->qubits);
      }
      return fmt::format("{}({}) {}", gate->label(), fmt::join(params, ", "), gate->qubits);
    },
    [](const Measurement& m) {
      return fmt::format("measure {} -> {}", m.qubit(), m.cbit);
    }
  }, inst);
}
