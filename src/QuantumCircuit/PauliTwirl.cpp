#include "PauliTwirl.h"
#include "Logger.hpp"
#include "Serialization.hpp"

#include <algorithm>
#include <numeric>

template <>
struct glz::meta<TwirlConfig> {
  using T = TwirlConfig;
  static constexpr auto value = glz::object(
    "gates", &T::gates,
    "seed", &T::seed,
    "keep_identities", &T::keep_identities,
    "num_randomizations", &T::num_randomizations
  );
};

TwirlConfig TwirlConfig::from_string(const std::string& json) {
  TwirlConfig config;
  from_json(config, json, "TwirlConfig");

  if (config.num_randomizations == 0) {
    throw std::invalid_argument("TwirlConfig.num_randomizations must be positive.");
  }

  return config;
}

TwirlConfig TwirlConfig::from_file(const std::string& path) {
  return TwirlConfig::from_string(read_text_file(path));
}

namespace {
  // Copy of the gate acting on qubits 0..k-1
  std::shared_ptr<Gate> localize(const Gate& gate) {
    Qubits local(gate.num_qubits);
    std::iota(local.begin(), local.end(), 0);

    std::shared_ptr<Gate> g = gate.clone();
    g->qubits = local;
    return g;
  }

  std::string gate_key(const Gate& gate) {
    std::string key = gate.label();
    if (auto matrix_gate = dynamic_cast<const MatrixGate*>(&gate)) {
      const Eigen::MatrixXcd& data = matrix_gate->data;
      for (Eigen::Index i = 0; i < data.size(); i++) {
        key += fmt::format(" {:.12g},{:.12g}", data(i).real(), data(i).imag());
      }
    } else {
      key += fmt::format("{}", gate.params());
    }
    return key;
  }
}

std::vector<TwirlPair> TwirlTable::clifford_pairs(const SymbolicGate& gate) {
  std::shared_ptr<Gate> local = localize(gate);

  std::vector<TwirlPair> pairs;
  for (const auto& before : PauliString::all_paulis(gate.num_qubits)) {
    PauliString after = before;
    after.evolve(*local);
    pairs.push_back({before, after});
  }

  return pairs;
}

std::vector<TwirlPair> TwirlTable::search_pairs(const Gate& gate) {
  Eigen::MatrixXcd U = gate.define();
  std::vector<PauliString> paulis = PauliString::all_paulis(gate.num_qubits);

  std::vector<TwirlPair> pairs;
  for (const auto& before : paulis) {
    Eigen::MatrixXcd Ub = U * before.to_matrix();
    for (const auto& after : paulis) {
      if (equal_up_to_phase(after.to_matrix() * Ub, U)) {
        pairs.push_back({before, after});
      }
    }
  }

  return pairs;
}

TwirlTable TwirlTable::build(const Gate& gate) {
  if (gate.num_qubits == 0 || gate.num_qubits > 2) {
    throw std::invalid_argument(fmt::format("Can only build twirl tables for one- and two-qubit gates; gate {} acts on {} qubits.", gate.label(), gate.num_qubits));
  }

  TwirlTable table;
  auto symbolic = dynamic_cast<const SymbolicGate*>(&gate);
  if (symbolic && symbolic->is_clifford()) {
    table.entries = clifford_pairs(*symbolic);
  } else {
    table.entries = search_pairs(gate);
  }

  Logger::log_info(fmt::format("Built twirl table with {} entries for gate {}.", table.size(), gate.label()));

  return table;
}

bool TwirlTable::contains(const PauliString& before, const PauliString& after) const {
  return std::ranges::any_of(entries, [&](const TwirlPair& pair) {
    return pair.before.same_paulis(before) && pair.after.same_paulis(after);
  });
}

const TwirlPair& TwirlTable::sample() const {
  if (entries.empty()) {
    throw std::runtime_error("Cannot sample from an empty twirl table.");
  }

  return entries[randi(0, entries.size())];
}

PauliTwirl::PauliTwirl(const TwirlConfig& config) : config(config) {
  if (config.seed != 0) {
    Random::seed_rng(config.seed);
  }
}

bool PauliTwirl::targets(const Gate& gate) const {
  return std::ranges::find(config.gates, gate.label()) != config.gates.end();
}

const TwirlTable& PauliTwirl::table_for(const Gate& gate) {
  std::string key = gate_key(gate);
  auto it = tables.find(key);
  if (it == tables.end()) {
    it = tables.emplace(key, TwirlTable::build(*localize(gate))).first;
  }

  return it->second;
}

void PauliTwirl::add_pauli_layer(QuantumCircuit& qc, const PauliString& p, const Qubits& qubits) const {
  for (size_t j = 0; j < qubits.size(); j++) {
    Pauli pj = p.to_pauli(j);
    if (pj == Pauli::I && !config.keep_identities) {
      continue;
    }

    switch (pj) {
      case Pauli::I:
        qc.id(qubits[j]);
        break;
      case Pauli::X:
        qc.x(qubits[j]);
        break;
      case Pauli::Y:
        qc.y(qubits[j]);
        break;
      case Pauli::Z:
        qc.z(qubits[j]);
        break;
    }
  }
}

QuantumCircuit PauliTwirl::apply(const QuantumCircuit& qc) {
  CircuitDAG dag = qc.to_dag();

  QuantumCircuit twirled(qc.get_num_qubits(), qc.get_num_cbits());
  size_t num_twirled = 0;
  for (uint32_t i : dag.topological_order()) {
    const Instruction& inst = dag.get_val(i);

    auto gate = std::get_if<std::shared_ptr<Gate>>(&inst);
    if (gate == nullptr || !targets(**gate)) {
      twirled.append(inst);
      continue;
    }

    const TwirlPair& pair = table_for(**gate).sample();
    add_pauli_layer(twirled, pair.before, (*gate)->qubits);
    twirled.append(inst);
    add_pauli_layer(twirled, pair.after, (*gate)->qubits);
    num_twirled++;
  }

  Logger::log_info(fmt::format("Twirled {} of {} instructions.", num_twirled, qc.length()));

  return twirled;
}

std::vector<QuantumCircuit> PauliTwirl::randomize(const QuantumCircuit& qc, size_t num_randomizations) {
  std::vector<QuantumCircuit> circuits;
  for (size_t k = 0; k < num_randomizations; k++) {
    circuits.push_back(apply(qc));
  }

  return circuits;
}
