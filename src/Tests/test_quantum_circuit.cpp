#include "tests.hpp"

#include "QuantumCircuit.h"
#include "PauliString.hpp"
#include "QASM.h"
#include "Random.hpp"

#include <numeric>
#include <numbers>

QuantumCircuit random_clifford_circuit(uint32_t nqb, size_t depth) {
  const std::vector<std::string> one_qubit = {"h", "x", "y", "z", "s", "sd", "sx", "sxd"};
  const std::vector<std::string> two_qubit = {"cx", "cy", "cz", "swap"};

  QuantumCircuit qc(nqb);
  for (size_t i = 0; i < depth; i++) {
    if (randi(0, 2) == 0) {
      qc.add_gate(one_qubit[randi(0, one_qubit.size())], {randi(0, nqb)});
    } else {
      uint32_t q1 = randi(0, nqb);
      uint32_t q2 = randi(0, nqb - 1);
      if (q2 >= q1) {
        q2++;
      }
      qc.add_gate(two_qubit[randi(0, two_qubit.size())], {q1, q2});
    }
  }

  return qc;
}

QuantumCircuit random_unitary_circuit(uint32_t nqb, size_t depth) {
  QuantumCircuit qc(nqb);
  for (size_t i = 0; i < depth; i++) {
    uint32_t q = randi(0, nqb - 1);
    qc.add_gate(haar_unitary(2), {q, q + 1});
    qc.rz(randi(0, nqb), 2.0*std::numbers::pi*randf());
    qc.t(randi(0, nqb));
  }

  return qc;
}

bool test_circuit_dag() {
  constexpr size_t nqb = 8;
  QuantumCircuit qc(nqb, 1);
  qc.add_gate(haar_unitary(2), {0, 1});
  qc.add_gate(haar_unitary(2), {2, 3});
  qc.add_gate(haar_unitary(2), {1, 2});
  qc.measure(0, 0);

  CircuitDAG dag = qc.to_dag();

  std::vector<std::set<size_t>> expected = {
    {2, 3},
    {2},
    {},
    {},
  };

  for (size_t i = 0; i < qc.length(); i++) {
    for (size_t j = 0; j < qc.length(); j++) {
      if (expected[i].contains(j)) {
        ASSERT(dag.contains_edge(i, j), fmt::format("Missing edge {} -> {}\n{}", i, j, dag.to_string()));
      } else {
        ASSERT(!dag.contains_edge(i, j), fmt::format("Unexpected edge {} -> {}\n{}", i, j, dag.to_string()));
      }
    }
  }

  return true;
}

bool test_dag_roundtrip() {
  for (size_t k = 0; k < 10; k++) {
    QuantumCircuit qc = random_unitary_circuit(5, 8);
    QuantumCircuit qc_ = QuantumCircuit::from_dag(qc.to_dag(), qc.get_num_qubits());

    ASSERT(qc.length() == qc_.length());
    ASSERT(qc.to_string() == qc_.to_string(), fmt::format("{}\n!=\n{}", qc, qc_));
    ASSERT(qc.to_matrix().isApprox(qc_.to_matrix()));
  }

  return true;
}

bool test_circuit_unitary() {
  QuantumCircuit qc(2);
  qc.h(0);
  qc.cx(0, 1);

  Eigen::VectorXcd psi = qc.to_matrix().col(0);
  double r = 1.0/std::sqrt(2.0);
  ASSERT(is_close(psi(0), r, psi(3)), fmt::format("psi = {}, {}, {}, {}", psi(0), psi(1), psi(2), psi(3)));
  ASSERT(is_close(psi(1), 0.0, psi(2)));

  QuantumCircuit qc2 = random_unitary_circuit(4, 6);
  QuantumCircuit qc3 = qc2;
  qc3.append(qc2.adjoint());
  ASSERT(qc3.to_matrix().isApprox(Eigen::MatrixXcd::Identity(16, 16)));
  ASSERT(qc3.length() == 2*qc2.length());

  ASSERT(!qc2.is_clifford());
  ASSERT(random_clifford_circuit(4, 20).is_clifford());

  return true;
}

bool test_invalid_instructions() {
  QuantumCircuit qc(3, 1);
  ASSERT_THROWS(qc.cx(0, 0), std::invalid_argument);
  ASSERT_THROWS(qc.h(3), std::invalid_argument);
  ASSERT_THROWS(qc.measure(0, 1), std::invalid_argument);
  ASSERT_THROWS(qc.add_gate("ccx", {0, 1, 2}), std::invalid_argument);
  ASSERT_THROWS(qc.add_gate(haar_unitary(2), {0}), std::invalid_argument);
  ASSERT(qc.length() == 0);

  return true;
}

bool test_pauli_multiplication() {
  for (size_t k = 0; k < 50; k++) {
    uint32_t nqb = randi(1, 5);
    PauliString p1 = PauliString::rand(nqb);
    PauliString p2 = PauliString::rand(nqb);

    PauliString p3 = p1 * p2;
    ASSERT(p3.to_matrix().isApprox(p1.to_matrix() * p2.to_matrix()),
        fmt::format("{} * {} = {}", p1, p2, p3));

    bool commutes = (p1.to_matrix() * p2.to_matrix()).isApprox(p2.to_matrix() * p1.to_matrix());
    ASSERT(p1.commutes(p2) == commutes);
  }

  PauliString x("XI");
  PauliString z("ZI");
  ASSERT(x * z == PauliString("-iYI"));
  ASSERT((-x).to_matrix().isApprox(-x.to_matrix()));
  ASSERT((x * z).same_paulis(PauliString("YI")));

  return true;
}

bool test_pauli_conjugation() {
  const std::vector<std::string> gates = {"h", "x", "y", "z", "s", "sd", "sx", "sxd", "cx", "cy", "cz", "swap"};
  constexpr uint32_t nqb = 3;

  for (const auto& name : gates) {
    for (size_t k = 0; k < 20; k++) {
      size_t r = SymbolicGate::num_qubits_for_gate(SymbolicGate::parse_gate(name));
      Qubits qubits = (r == 1) ? Qubits{randi(0, nqb)} : Qubits{2, 0};
      auto gate = make_gate(name, qubits);

      PauliString p = PauliString::rand(nqb);
      PauliString q = p;
      q.evolve(*gate);

      Eigen::MatrixXcd U = full_circuit_unitary(gate->define(), qubits, nqb);
      Eigen::MatrixXcd expected = U * p.to_matrix() * U.adjoint();
      ASSERT(q.to_matrix().isApprox(expected), fmt::format("{} {}: {} -> {}", name, qubits, p, q));
    }
  }

  QuantumCircuit qc = random_clifford_circuit(nqb, 30);
  Eigen::MatrixXcd U = qc.to_matrix();
  PauliString p = PauliString::rand(nqb);
  PauliString q = p;
  q.evolve(qc);
  ASSERT(q.to_matrix().isApprox(U * p.to_matrix() * U.adjoint()));

  return true;
}

bool test_qasm_roundtrip() {
  QuantumCircuit qc(3, 2);
  qc.id(0);
  qc.h(0);
  qc.x(1);
  qc.y(2);
  qc.z(0);
  qc.s(1);
  qc.sd(2);
  qc.sx(0);
  qc.sxd(1);
  qc.t(2);
  qc.td(0);
  qc.rx(1, 0.25);
  qc.ry(2, -std::numbers::pi/3.0);
  qc.rz(0, 1e-3);
  qc.cx(0, 1);
  qc.cy(1, 2);
  qc.cz(2, 0);
  qc.swap(0, 2);
  qc.measure(0, 0);
  qc.measure(2, 1);

  std::string qasm = to_qasm(qc);
  ASSERT(qasm.rfind("OPENQASM 2.0;", 0) == 0);
  ASSERT(qasm.find("sdg q[2];") != std::string::npos, qasm);
  ASSERT(qasm.find("measure q[2] -> c[1];") != std::string::npos, qasm);

  QuantumCircuit qc_ = parse_qasm(qasm);
  ASSERT(qc_.get_num_qubits() == 3);
  ASSERT(qc_.get_num_cbits() == 2);
  ASSERT(qc.to_string() == qc_.to_string(), fmt::format("{}\n!=\n{}", qc, qc_));
  ASSERT(qc_.get_num_measurements() == 2);

  QuantumCircuit unitary(2);
  unitary.add_gate(haar_unitary(2), {0, 1});
  ASSERT_THROWS(to_qasm(unitary), std::invalid_argument);

  return true;
}

bool test_qasm_parse() {
  std::string source =
    "OPENQASM 2.0;\n"
    "include \"qelib1.inc\";\n"
    "// Bell pair\n"
    "qreg q[2];\n"
    "creg c[2];\n"
    "h q[0]; cx q[0],q[1]; // entangle\n"
    "barrier q[0],q[1];\n"
    "rz(-3*pi/4) q[1];\n"
    "U1 q[0];\n";

  ASSERT_THROWS(parse_qasm(source), std::runtime_error);

  source.erase(source.find("U1 q[0];\n"));
  source += "measure q[0] -> c[0];\nmeasure q[1] -> c[1];\n";
  QuantumCircuit qc = parse_qasm(source);

  ASSERT(qc.get_num_qubits() == 2);
  ASSERT(qc.length() == 5, qc.to_string());
  ASSERT(qc.count_gates("cx") == 1);
  ASSERT(qc.count_gates("rz") == 1);
  ASSERT(qc.get_num_measurements() == 2);

  auto gate = std::get<std::shared_ptr<Gate>>(qc.instructions[2]);
  ASSERT(is_close(gate->params()[0], -3.0*std::numbers::pi/4.0));

  return true;
}

bool test_qasm_errors() {
  std::string header = "OPENQASM 2.0;\nqreg q[2];\n";

  auto error_message = [](const std::string& source) -> std::string {
    try {
      parse_qasm(source);
    } catch (const std::runtime_error& e) {
      return e.what();
    }
    return "";
  };

  std::string message = error_message(header + "ccx q[0],q[1],q[1];\n");
  ASSERT(message.find("line 3") != std::string::npos, message);
  ASSERT(message.find("ccx") != std::string::npos, message);

  ASSERT(!error_message(header + "h q[0]\n").empty());
  ASSERT(!error_message(header + "h q[2];\n").empty());
  ASSERT(!error_message(header + "cx q[0],q[0];\n").empty());
  ASSERT(!error_message(header + "measure q[0] -> c[0];\n").empty());
  ASSERT(!error_message("OPENQASM 3.0;\nqreg q[2];\n").empty());
  ASSERT(!error_message("OPENQASM 2.0;\nh q[0];\n").empty());
  ASSERT(!error_message("OPENQASM 2.0;\n").empty());
  ASSERT(error_message(header + "cx q[0],q[1];\n").empty());

  // Register sizes and indices must fit in 32 bits
  message = error_message("OPENQASM 2.0;\nqreg q[4294967298];\n");
  ASSERT(message.find("line 2") != std::string::npos, message);
  ASSERT(message.find("out of range") != std::string::npos, message);
  ASSERT(!error_message("OPENQASM 2.0;\nqreg q[100000000000000000000000];\n").empty());
  ASSERT(!error_message(header + "h q[4294967296];\n").empty());

  return true;
}

bool test_qasm_angle() {
  ASSERT(is_close(parse_qasm_angle("0.5"), 0.5));
  ASSERT(is_close(parse_qasm_angle("pi"), std::numbers::pi));
  ASSERT(is_close(parse_qasm_angle("pi/2"), std::numbers::pi/2.0));
  ASSERT(is_close(parse_qasm_angle("-3*pi/4"), -3.0*std::numbers::pi/4.0));
  ASSERT(is_close(parse_qasm_angle(" 2 * pi "), 2.0*std::numbers::pi));
  ASSERT(is_close(parse_qasm_angle("1e-3"), 1e-3));

  ASSERT_THROWS(parse_qasm_angle(""), std::invalid_argument);
  ASSERT_THROWS(parse_qasm_angle("theta"), std::invalid_argument);
  ASSERT_THROWS(parse_qasm_angle("pi/0"), std::invalid_argument);

  return true;
}

int main(int argc, char *argv[]) {
  Random::seed_rng(314);

  std::map<std::string, TestResult> tests;
  std::set<std::string> test_names;

  bool run_all = (argc == 1);

  if (!run_all) {
    for (int i = 1; i < argc; i++) {
      test_names.insert(argv[i]);
    }
  }

  ADD_TEST(test_circuit_dag);
  ADD_TEST(test_dag_roundtrip);
  ADD_TEST(test_circuit_unitary);
  ADD_TEST(test_invalid_instructions);
  ADD_TEST(test_pauli_multiplication);
  ADD_TEST(test_pauli_conjugation);
  ADD_TEST(test_qasm_roundtrip);
  ADD_TEST(test_qasm_parse);
  ADD_TEST(test_qasm_errors);
  ADD_TEST(test_qasm_angle);

  return report_tests(tests);
}
