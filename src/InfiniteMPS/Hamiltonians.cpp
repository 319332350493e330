#include "Hamiltonians.h"
#include "TEBDConfig.h"
#include "Instructions.hpp"

#include <unsupported/Eigen/MatrixFunctions>
#include <unsupported/Eigen/KroneckerProduct>

#include <numbers>
#include <fmt/format.h>

EvolutionType parse_evolution_type(const std::string& s) {
  if (s == "real") {
    return EvolutionType::Real;
  } else if (s == "imaginary") {
    return EvolutionType::Imaginary;
  }

  throw std::invalid_argument(fmt::format("Invalid evolution type \"{}\"; must be \"real\" or \"imaginary\".", s));
}

std::string evolution_type_to_string(EvolutionType type) {
  return type == EvolutionType::Real ? "real" : "imaginary";
}

static Eigen::Matrix4cd two_site(const Eigen::Matrix2cd& a, const Eigen::Matrix2cd& b) {
  return Eigen::kroneckerProduct(b, a);
}

Eigen::Matrix4cd xx_hamiltonian(double J) {
  return J*(two_site(gates::X::value, gates::X::value) + two_site(gates::Y::value, gates::Y::value));
}

Eigen::Matrix4cd xxz_hamiltonian(double J, double delta) {
  return xx_hamiltonian(J) + J*delta*two_site(gates::Z::value, gates::Z::value);
}

Eigen::Matrix4cd heisenberg_hamiltonian(double J) {
  return xxz_hamiltonian(J, 1.0);
}

// The transverse field is split evenly between the two bonds touching each site.
Eigen::Matrix4cd ising_hamiltonian(double J, double g) {
  return -J*two_site(gates::Z::value, gates::Z::value)
    - (g/2.0)*(two_site(gates::X::value, gates::I::value) + two_site(gates::I::value, gates::X::value));
}

Eigen::Matrix4cd evolution_operator(const Eigen::Matrix4cd& H, double dt, EvolutionType type) {
  constexpr std::complex<double> i(0.0, 1.0);
  Eigen::Matrix4cd exponent = (type == EvolutionType::Real) ? Eigen::Matrix4cd(-i*dt*H) : Eigen::Matrix4cd(-dt*H);
  return exponent.exp();
}

double xx_reference_energy(double J) {
  return -4.0*std::abs(J)/std::numbers::pi;
}

double heisenberg_reference_energy(double J) {
  if (J < 0) {
    // Ferromagnet
    return J;
  }
  return J*(1.0 - 4.0*std::numbers::ln2);
}

double ising_reference_energy(double J, double g) {
  // Composite Simpson's rule on [-pi, pi]
  constexpr size_t n = 4096;
  const double h = 2.0*std::numbers::pi/n;

  auto f = [J, g](double k) { return std::sqrt(std::max(0.0, J*J + g*g - 2.0*J*g*std::cos(k))); };

  double s = f(-std::numbers::pi) + f(std::numbers::pi);
  for (size_t j = 1; j < n; j++) {
    double k = -std::numbers::pi + j*h;
    s += (j % 2 ? 4.0 : 2.0)*f(k);
  }

  return -(h/3.0)*s/(2.0*std::numbers::pi);
}

Eigen::Matrix4cd make_hamiltonian(const TEBDConfig& config) {
  if (config.model == "xx") {
    return xx_hamiltonian(config.J);
  } else if (config.model == "xxz") {
    return xxz_hamiltonian(config.J, config.delta);
  } else if (config.model == "heisenberg") {
    return heisenberg_hamiltonian(config.J);
  } else if (config.model == "ising") {
    return ising_hamiltonian(config.J, config.g);
  }

  throw std::invalid_argument(fmt::format("Invalid model \"{}\"; must be one of xx, xxz, heisenberg, ising.", config.model));
}

std::optional<double> reference_energy(const TEBDConfig& config) {
  if (config.model == "xx") {
    return xx_reference_energy(config.J);
  } else if (config.model == "heisenberg") {
    return heisenberg_reference_energy(config.J);
  } else if (config.model == "ising") {
    return ising_reference_energy(config.J, config.g);
  } else if (config.model == "xxz") {
    if (config.delta == 0.0) {
      return xx_reference_energy(config.J);
    } else if (config.delta == 1.0) {
      return heisenberg_reference_energy(config.J);
    }
    return std::nullopt;
  }

  throw std::invalid_argument(fmt::format("Invalid model \"{}\"; must be one of xx, xxz, heisenberg, ising.", config.model));
}
