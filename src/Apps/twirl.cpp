#include "PauliTwirl.h"
#include "QASM.h"
#include "Logger.hpp"

#include <fmt/format.h>

#include <iostream>

// out.qasm -> out_k.qasm
static std::string randomization_path(const std::string& path, size_t k) {
  size_t dot = path.rfind('.');
  size_t slash = path.find_last_of("/\\");
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return fmt::format("{}_{}", path, k);
  }
  return fmt::format("{}_{}{}", path.substr(0, dot), k, path.substr(dot));
}

int main(int argc, char *argv[]) {
  if (argc != 4) {
    std::cerr << fmt::format("Usage: {} <config.json> <in.qasm> <out.qasm>\n", argv[0]);
    return 1;
  }

  try {
    TwirlConfig config = TwirlConfig::from_file(argv[1]);
    QuantumCircuit qc = parse_qasm_file(argv[2]);

    PauliTwirl twirl(config);
    std::vector<QuantumCircuit> circuits = twirl.randomize(qc, config.num_randomizations);

    std::string output = argv[3];
    for (size_t k = 0; k < circuits.size(); k++) {
      std::string path = circuits.size() == 1 ? output : randomization_path(output, k);
      write_qasm_file(circuits[k], path);
      fmt::print("Wrote randomization {} ({} instructions, originally {}) to {}\n", k, circuits[k].length(), qc.length(), path);
    }
  } catch (const std::exception& e) {
    std::cerr << fmt::format("Error: {}\n", e.what());
    Logger::log_error(e.what());
    return 1;
  }

  return 0;
}
