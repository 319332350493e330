#pragma once

#include "QuantumCircuit.h"
#include "PauliString.hpp"

#include <map>

struct TwirlConfig {
  // Labels of the gates to twirl
  std::vector<std::string> gates = {"cx"};
  // 0 leaves the generator unseeded
  uint32_t seed = 0;
  bool keep_identities = false;
  uint32_t num_randomizations = 1;

  static TwirlConfig from_file(const std::string& path);
  static TwirlConfig from_string(const std::string& json);
};

// after * G * before = e^{i phi} G
struct TwirlPair {
  PauliString before;
  PauliString after;
};

// Pauli pairs leaving a one- or two-qubit gate invariant up to a global phase.
// Pauli indices refer to positions in gate.qubits.
class TwirlTable {
  public:
    static TwirlTable build(const Gate& gate);

    const std::vector<TwirlPair>& pairs() const {
      return entries;
    }

    size_t size() const {
      return entries.size();
    }

    bool contains(const PauliString& before, const PauliString& after) const;

    const TwirlPair& sample() const;

  private:
    std::vector<TwirlPair> entries;

    static std::vector<TwirlPair> clifford_pairs(const SymbolicGate& gate);
    static std::vector<TwirlPair> search_pairs(const Gate& gate);
};

// Replaces every targeted gate G with [before layer, G, after layer], walking the
// circuit DAG in topological order.
class PauliTwirl {
  public:
    PauliTwirl(const TwirlConfig& config);

    bool targets(const Gate& gate) const;
    const TwirlTable& table_for(const Gate& gate);

    QuantumCircuit apply(const QuantumCircuit& qc);
    std::vector<QuantumCircuit> randomize(const QuantumCircuit& qc, size_t num_randomizations);

  private:
    TwirlConfig config;
    std::map<std::string, TwirlTable> tables;

    void add_pauli_layer(QuantumCircuit& qc, const PauliString& p, const Qubits& qubits) const;
};
