#include "TEBDConfig.h"
#include "Hamiltonians.h"
#include "Serialization.hpp"

#include <algorithm>
#include <functional>
#include <fmt/ranges.h>

template <>
struct glz::meta<TEBDConfig> {
  using T = TEBDConfig;
  static constexpr auto value = glz::object(
    "model", &T::model,
    "J", &T::J,
    "delta", &T::delta,
    "g", &T::g,
    "evolution", &T::evolution,
    "bond_dimensions", &T::bond_dimensions,
    "time_steps", &T::time_steps,
    "max_steps", &T::max_steps,
    "measure_interval", &T::measure_interval,
    "energy_tolerance", &T::energy_tolerance,
    "trotter_order", &T::trotter_order,
    "canonicalize_interval", &T::canonicalize_interval,
    "environment_tolerance", &T::environment_tolerance,
    "environment_max_iterations", &T::environment_max_iterations,
    "sv_threshold", &T::sv_threshold,
    "initial_bond_dimension", &T::initial_bond_dimension,
    "seed", &T::seed,
    "checkpoint", &T::checkpoint,
    "verbose", &T::verbose
  );
};

void TEBDConfig::validate() const {
  make_hamiltonian(*this);
  parse_evolution_type(evolution);

  if (bond_dimensions.empty() || time_steps.empty()) {
    throw std::invalid_argument("TEBDConfig requires at least one bond dimension and one time step.");
  }

  if (std::ranges::any_of(bond_dimensions, [](uint32_t chi) { return chi == 0; })) {
    throw std::invalid_argument(fmt::format("Bond dimensions must be positive: {}.", bond_dimensions));
  }

  if (!std::ranges::is_sorted(bond_dimensions)) {
    throw std::invalid_argument(fmt::format("Bond dimensions must be ascending: {}.", bond_dimensions));
  }

  if (std::ranges::any_of(time_steps, [](double dt) { return dt <= 0.0; })) {
    throw std::invalid_argument(fmt::format("Time steps must be positive: {}.", time_steps));
  }

  if (!std::ranges::is_sorted(time_steps, std::greater<double>())) {
    throw std::invalid_argument(fmt::format("Time steps must be descending: {}.", time_steps));
  }

  if (trotter_order != 1 && trotter_order != 2) {
    throw std::invalid_argument(fmt::format("Trotter order must be 1 or 2; received {}.", trotter_order));
  }

  if (measure_interval == 0 || max_steps == 0) {
    throw std::invalid_argument("measure_interval and max_steps must be positive.");
  }

  if (initial_bond_dimension == 0) {
    throw std::invalid_argument("initial_bond_dimension must be positive.");
  }
}

TEBDConfig TEBDConfig::from_string(const std::string& json) {
  TEBDConfig config;
  from_json(config, json, "TEBDConfig");
  config.validate();
  return config;
}

TEBDConfig TEBDConfig::from_file(const std::string& path) {
  return TEBDConfig::from_string(read_text_file(path));
}

std::string TEBDConfig::to_string() const {
  std::string buffer;
  auto write_error = glz::write_json(*this, buffer);
  if (write_error) {
    throw std::runtime_error(fmt::format("Error writing TEBDConfig to json: \n{}", glz::format_error(write_error, buffer)));
  }
  return buffer;
}
