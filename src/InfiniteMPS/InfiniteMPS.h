#pragma once

#include <Eigen/Dense>

#include <memory>
#include <vector>
#include <string>
#include <complex>

struct InfiniteMPSOptions {
  // Singular values at or below this are dropped; their inverses are set to zero
  double sv_threshold = 1e-10;
  double environment_tolerance = 1e-12;
  uint32_t environment_max_iterations = 5000;
};

class InfiniteMPSImpl;

// Translation-invariant MPS with a two-site unit cell in Vidal form,
//   ... Gamma_A lambda_0 Gamma_B lambda_1 Gamma_A lambda_0 Gamma_B lambda_1 ...
// Bond 0 joins site A to site B, bond 1 joins site B to the next A.
class InfiniteMPS {
  public:
    std::unique_ptr<InfiniteMPSImpl> impl;

    InfiniteMPS();
    ~InfiniteMPS();

    InfiniteMPS(const InfiniteMPS& other);
    InfiniteMPS& operator=(const InfiniteMPS& other);
    InfiniteMPS(InfiniteMPS&& other) noexcept;
    InfiniteMPS& operator=(InfiniteMPS&& other) noexcept;

    // Random complex tensors with uniform singular values, then canonicalized.
    static InfiniteMPS random(uint32_t physical_dim, uint32_t bond_dimension, const InfiniteMPSOptions& options={});
    // Bond dimension 1 state |a>|b>|a>|b>...
    static InfiniteMPS product_state(const Eigen::VectorXcd& local_a, const Eigen::VectorXcd& local_b, const InfiniteMPSOptions& options={});

    const InfiniteMPSOptions& get_options() const;
    void set_options(const InfiniteMPSOptions& options);

    uint32_t physical_dim() const;
    uint32_t bond_dimension(uint32_t bond) const;
    std::vector<double> singular_values(uint32_t bond) const;
    double entanglement_entropy(uint32_t bond) const;

    // Applies a d^2 x d^2 gate (site a the low index) across a bond and truncates
    // the bond to at most max_bond_dimension. Returns the truncation error.
    double apply_two_site_gate(uint32_t bond, const Eigen::MatrixXcd& gate, uint32_t max_bond_dimension);

    double truncation_error() const;
    void reset_truncation_error();

    // Dominant fixed points of the unit-cell transfer map starting at the given bond's left
    // site, as matrices over the bond index of the preceding bond.
    Eigen::MatrixXcd right_environment(uint32_t bond) const;
    Eigen::MatrixXcd left_environment(uint32_t bond) const;

    void canonicalize();
    // Deviation of both bonds from the left and right canonical conditions.
    double canonical_error() const;

    Eigen::MatrixXcd two_site_density_matrix(uint32_t bond) const;
    Eigen::MatrixXcd one_site_density_matrix(uint32_t site) const;

    std::complex<double> expectation(uint32_t bond, const Eigen::MatrixXcd& op) const;
    // Energy per site of a translation-invariant two-site Hamiltonian.
    double energy(const Eigen::MatrixXcd& H) const;

    std::string to_string() const;

    std::vector<char> serialize() const;
    void deserialize(const std::vector<char>& bytes);

    void save(const std::string& path) const;
    static InfiniteMPS load(const std::string& path);
};
