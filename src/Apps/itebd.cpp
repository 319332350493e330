#include "TEBD.h"
#include "Logger.hpp"

#include <fmt/format.h>

#include <iostream>

int main(int argc, char *argv[]) {
  if (argc != 2) {
    std::cerr << fmt::format("Usage: {} <config.json>\n", argv[0]);
    return 1;
  }

  try {
    TEBDConfig config = TEBDConfig::from_file(argv[1]);
    Logger::log_info(fmt::format("Starting iTEBD with config {}: {}", argv[1], config.to_string()));

    InfiniteTEBD tebd(config);
    std::vector<StageResult> results = tebd.run();

    size_t num_converged = 0;
    for (const auto& result : results) {
      if (result.converged) {
        num_converged++;
      }
    }

    if (config.verbose) {
      fmt::print("{} of {} stages converged. Final state: {}\n", num_converged, results.size(), tebd.state().to_string());
    }
  } catch (const std::exception& e) {
    std::cerr << fmt::format("Error: {}\n", e.what());
    Logger::log_error(e.what());
    return 1;
  }

  return 0;
}
