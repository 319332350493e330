#include "InfiniteMPS.h"
#include "Logger.hpp"
#include "Random.hpp"
#include "Serialization.hpp"

#include <array>
#include <cmath>
#include <stdexcept>

#include <fmt/ranges.h>
#include <itensor/all.h>

#include <glaze/glaze.hpp>

using namespace itensor;

// Plain checkpoint records. Tensors are stored as (left, physical, right) arrays, left index fastest.
struct TensorData {
  std::vector<uint32_t> shape;
  std::vector<double> re;
  std::vector<double> im;
};

struct InfiniteMPSData {
  uint32_t physical_dim;
  InfiniteMPSOptions options;
  std::vector<TensorData> gammas;
  std::vector<std::vector<double>> lambdas;
  double truncation_error;
};

template <>
struct glz::meta<InfiniteMPSOptions> {
  using T = InfiniteMPSOptions;
  static constexpr auto value = glz::object(
    "sv_threshold", &T::sv_threshold,
    "environment_tolerance", &T::environment_tolerance,
    "environment_max_iterations", &T::environment_max_iterations
  );
};

template <>
struct glz::meta<TensorData> {
  using T = TensorData;
  static constexpr auto value = glz::object(
    "shape", &T::shape,
    "re", &T::re,
    "im", &T::im
  );
};

template <>
struct glz::meta<InfiniteMPSData> {
  using T = InfiniteMPSData;
  static constexpr auto value = glz::object(
    "physical_dim", &T::physical_dim,
    "options", &T::options,
    "gammas", &T::gammas,
    "lambdas", &T::lambdas,
    "truncation_error", &T::truncation_error
  );
};

static uint32_t combined_dim(const std::vector<Index>& idxs) {
  uint32_t d = 1u;
  for (const auto& idx : idxs) {
    d *= dim(idx);
  }
  return d;
}

// Row and column numbers enumerate idxs1 and idxs2 with the first index fastest.
static void fill_assignments(std::vector<IndexVal>& assignments, size_t offset, const std::vector<Index>& idxs, uint32_t z) {
  for (size_t i = 0; i < idxs.size(); i++) {
    uint32_t d = dim(idxs[i]);
    assignments[offset + i] = (idxs[i] = (z % d) + 1u);
    z /= d;
  }
}

ITensor matrix_to_tensor(const Eigen::MatrixXcd& matrix, const std::vector<Index>& idxs1, const std::vector<Index>& idxs2) {
  uint32_t dim1 = combined_dim(idxs1);
  uint32_t dim2 = combined_dim(idxs2);

  if ((dim1 != matrix.rows()) || (dim2 != matrix.cols())) {
    throw std::runtime_error(fmt::format("Dimension mismatch in matrix ({}x{}) and provided indices ({}x{})!", matrix.rows(), matrix.cols(), dim1, dim2));
  }

  std::vector<Index> idxs = idxs1;
  idxs.insert(idxs.end(), idxs2.begin(), idxs2.end());

  ITensor tensor(idxs);

  std::vector<IndexVal> assignments(idxs.size());
  for (uint32_t z1 = 0; z1 < dim1; z1++) {
    for (uint32_t z2 = 0; z2 < dim2; z2++) {
      fill_assignments(assignments, 0, idxs1, z1);
      fill_assignments(assignments, idxs1.size(), idxs2, z2);
      tensor.set(assignments, matrix(z1, z2));
    }
  }

  return tensor;
}

Eigen::MatrixXcd tensor_to_matrix(const ITensor& tensor, const std::vector<Index>& idxs1, const std::vector<Index>& idxs2) {
  uint32_t dim1 = combined_dim(idxs1);
  uint32_t dim2 = combined_dim(idxs2);

  if (static_cast<size_t>(order(tensor)) != idxs1.size() + idxs2.size()) {
    throw std::runtime_error(fmt::format("tensor_to_matrix given {} indices for a tensor of order {}.", idxs1.size() + idxs2.size(), order(tensor)));
  }

  Eigen::MatrixXcd data(dim1, dim2);
  std::vector<IndexVal> assignments(idxs1.size() + idxs2.size());
  for (uint32_t z1 = 0; z1 < dim1; z1++) {
    for (uint32_t z2 = 0; z2 < dim2; z2++) {
      fill_assignments(assignments, 0, idxs1, z1);
      fill_assignments(assignments, idxs1.size(), idxs2, z2);
      data(z1, z2) = eltC(tensor, assignments);
    }
  }

  return data;
}

static ITensor diagonal_tensor(const std::vector<double>& values, const Index& i1, const Index& i2) {
  ITensor tensor(i1, i2);
  for (size_t k = 0; k < values.size(); k++) {
    tensor.set(i1=k+1, i2=k+1, values[k]);
  }
  return tensor;
}

static std::vector<double> diagonal_values(const ITensor& lambda) {
  auto idxs = inds(lambda);
  size_t N = dim(idxs[0]);
  std::vector<double> values(N);
  for (size_t i = 0; i < N; i++) {
    values[i] = elt(lambda, static_cast<int>(i+1), static_cast<int>(i+1));
  }
  return values;
}

// Multiplies every slice of tensor along idx by the matching entry of values.
static ITensor scale_index(const ITensor& tensor, const Index& idx, const std::vector<double>& values) {
  Index tmp = sim(idx);
  ITensor scaled = tensor * diagonal_tensor(values, idx, tmp);
  scaled.replaceInds({tmp}, {idx});
  return scaled;
}

class InfiniteMPSImpl {
  public:
    uint32_t d = 0;
    InfiniteMPSOptions options;

    // gammas[0] = Gamma_A(R_1, s_0, L_0), gammas[1] = Gamma_B(R_0, s_1, L_1)
    // lambdas[k] = lambda_k(L_k, R_k)
    std::array<Index, 2> sites;
    std::array<Index, 2> left_indices;
    std::array<Index, 2> right_indices;
    std::array<ITensor, 2> gammas;
    std::array<ITensor, 2> lambdas;

    double accumulated_truncation_error = 0.0;

    InfiniteMPSImpl()=default;

    InfiniteMPSImpl(uint32_t d, const std::array<uint32_t, 2>& chi, const InfiniteMPSOptions& options) : d(d), options(options), accumulated_truncation_error(0.0) {
      if (d < 2) {
        throw std::invalid_argument(fmt::format("Physical dimension must be at least 2, got {}.", d));
      }

      for (uint32_t k = 0; k < 2; k++) {
        if (chi[k] == 0) {
          throw std::invalid_argument("Bond dimension must be positive.");
        }

        sites[k] = Index(d, fmt::format("Site,n={}", k));
        left_indices[k] = Index(chi[k], fmt::format("Link,L,b={}", k));
        right_indices[k] = Index(chi[k], fmt::format("Link,R,b={}", k));
      }

      for (uint32_t k = 0; k < 2; k++) {
        uint32_t o = 1 - k;
        gammas[k] = ITensor(right_indices[o], sites[k], left_indices[k]);
        lambdas[k] = diagonal_tensor(std::vector<double>(chi[k], 1.0/std::sqrt(chi[k])), left_indices[k], right_indices[k]);
      }
    }

    static void check_bond(uint32_t bond) {
      if (bond > 1) {
        throw std::invalid_argument(fmt::format("Bond {} out of range; the unit cell has bonds 0 and 1.", bond));
      }
    }

    uint32_t bond_dimension(uint32_t bond) const {
      check_bond(bond);
      return dim(left_indices[bond]);
    }

    std::vector<double> singular_values(uint32_t bond) const {
      check_bond(bond);
      return diagonal_values(lambdas[bond]);
    }

    double entanglement_entropy(uint32_t bond) const {
      std::vector<double> sv = singular_values(bond);
      double total = 0.0;
      for (double s : sv) {
        total += s*s;
      }

      double S = 0.0;
      for (double s : sv) {
        double p = s*s/total;
        if (p > 1e-16) {
          S -= p * std::log(p);
        }
      }

      return S;
    }

    ITensor inverse_lambda(const ITensor& lambda) const {
      auto inv = [&](Real r) {
        if (r > options.sv_threshold) {
          return 1.0/r;
        } else {
          return 0.0;
        }
      };

      return apply(lambda, inv);
    }

    double apply_two_site_gate(uint32_t bond, const Eigen::MatrixXcd& gate, uint32_t max_bond_dimension) {
      check_bond(bond);
      uint32_t a = bond;
      uint32_t b = 1 - bond;
      uint32_t o = 1 - bond;

      if (gate.rows() != d*d || gate.cols() != d*d) {
        throw std::invalid_argument(fmt::format("Two-site gate must be {}x{}, got {}x{}.", d*d, d*d, gate.rows(), gate.cols()));
      }

      if (max_bond_dimension == 0) {
        throw std::invalid_argument("Maximum bond dimension must be positive.");
      }

      Index p = sim(left_indices[o]);
      ITensor lambda_left = lambdas[o];
      lambda_left.replaceInds({left_indices[o]}, {p});

      ITensor theta = lambda_left * gammas[a];
      theta *= lambdas[bond];
      theta *= gammas[b];
      theta *= lambdas[o];

      ITensor G = matrix_to_tensor(gate, {prime(sites[a]), prime(sites[b])}, {sites[a], sites[b]});
      theta = noPrime(G * theta);

      std::vector<Index> u_inds{p, sites[a]};
      std::vector<Index> v_inds{sites[b], right_indices[o]};

      ITensor U, S, V;
      try {
        std::tie(U, S, V) = svd(theta, u_inds, v_inds,
            {"Cutoff=",options.sv_threshold,"MaxDim=",static_cast<int>(max_bond_dimension),
             "LeftTags=",fmt::format("Link,L,b={}", bond),
             "RightTags=",fmt::format("Link,R,b={}", bond)});
      } catch (const std::runtime_error& e) {
        uint32_t r = randi();
        std::string filename = fmt::format("svd_error{:05}.eve", r % 100000);
        Logger::log_error(fmt::format("SVD failed on bond {} (seed = {}): {}. Dumping state to {}.", bond, Random::get_seed(), e.what(), filename));
        write_bytes(filename, serialize());
        throw;
      }

      double truncerr = sqr(norm(U*S*V - theta)/norm(theta));
      accumulated_truncation_error += truncerr;

      S /= norm(S);

      ITensor gamma_a = U * inverse_lambda(lambda_left);
      ITensor gamma_b = V * inverse_lambda(lambdas[o]);

      left_indices[bond] = commonIndex(U, S);
      right_indices[bond] = commonIndex(V, S);

      gammas[a] = gamma_a;
      gammas[b] = gamma_b;
      lambdas[bond] = S;

      return truncerr;
    }

    // Unit cell Gamma_a lambda_bond Gamma_b lambda_o with indices (left, s_a, s_b, R_o),
    // where left is a copy of R_o.
    ITensor cell(uint32_t bond, Index& left) const {
      uint32_t a = bond;
      uint32_t b = 1 - bond;
      uint32_t o = 1 - bond;

      left = sim(right_indices[o]);
      ITensor gamma_a = gammas[a];
      gamma_a.replaceInds({right_indices[o]}, {left});

      ITensor C = gamma_a * lambdas[bond];
      C *= gammas[b];
      C *= lambdas[o];
      return C;
    }

    // Power iteration on the unit-cell transfer map. Returns E(R_o, R_o').
    ITensor right_fixed_point(uint32_t bond, const ITensor& C, const Index& left) const {
      Index r = right_indices[1 - bond];
      ITensor Cdag = dag(C);
      Cdag.replaceInds({left, r}, {prime(left), prime(r)});

      ITensor E = toDense(delta(r, prime(r)));
      E /= norm(E);

      for (uint32_t i = 0; i < options.environment_max_iterations; i++) {
        ITensor next = C * E;
        next *= Cdag;
        next.replaceInds({left, prime(left)}, {r, prime(r)});
        next /= norm(next);

        double diff = norm(next - E);
        E = next;
        if (diff < options.environment_tolerance) {
          return E;
        }
      }

      Logger::log_warning(fmt::format("Right environment on bond {} did not converge in {} iterations.", bond, options.environment_max_iterations));
      return E;
    }

    // Returns F(left, left').
    ITensor left_fixed_point(uint32_t bond, const ITensor& C, const Index& left) const {
      uint32_t o = 1 - bond;
      Index r = right_indices[o];
      ITensor Cdag = dag(C);
      Cdag.replaceInds({left, r}, {prime(left), prime(r)});

      std::vector<double> lambda_sq = diagonal_values(lambdas[o]);
      for (auto& s : lambda_sq) {
        s = s*s;
      }

      ITensor F = diagonal_tensor(lambda_sq, left, prime(left));
      F /= norm(F);

      for (uint32_t i = 0; i < options.environment_max_iterations; i++) {
        ITensor next = F * C;
        next *= Cdag;
        next.replaceInds({r, prime(r)}, {left, prime(left)});
        next /= norm(next);

        double diff = norm(next - F);
        F = next;
        if (diff < options.environment_tolerance) {
          return F;
        }
      }

      Logger::log_warning(fmt::format("Left environment on bond {} did not converge in {} iterations.", bond, options.environment_max_iterations));
      return F;
    }

    Eigen::MatrixXcd right_environment(uint32_t bond) const {
      check_bond(bond);
      Index left;
      ITensor C = cell(bond, left);
      ITensor E = right_fixed_point(bond, C, left);
      Index r = right_indices[1 - bond];
      return tensor_to_matrix(E, {r}, {prime(r)});
    }

    Eigen::MatrixXcd left_environment(uint32_t bond) const {
      check_bond(bond);
      Index left;
      ITensor C = cell(bond, left);
      ITensor F = left_fixed_point(bond, C, left);
      return tensor_to_matrix(F, {left}, {prime(left)});
    }

    void canonicalize() {
      Index left;
      ITensor C = cell(0, left);
      Index r = right_indices[1];

      ITensor E = right_fixed_point(0, C, left);
      ITensor F = left_fixed_point(0, C, left);

      // Right fixed point E = X X^dag and left fixed point G = Y^dag Y, with G the transpose of F
      Eigen::MatrixXcd Er = tensor_to_matrix(E, {r}, {prime(r)});
      Eigen::MatrixXcd G = tensor_to_matrix(F, {left}, {prime(left)}).transpose();
      Er = 0.5*(Er + Er.adjoint()).eval();
      G = 0.5*(G + G.adjoint()).eval();

      Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> right_solver(Er);
      Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> left_solver(G);
      if (right_solver.info() != Eigen::Success || left_solver.info() != Eigen::Success) {
        throw std::runtime_error("Eigendecomposition of the MPS environments failed during canonicalization.");
      }

      Eigen::VectorXd Dr = right_solver.eigenvalues().cwiseMax(0.0).cwiseSqrt();
      Eigen::VectorXd Dl = left_solver.eigenvalues().cwiseMax(0.0).cwiseSqrt();

      Eigen::MatrixXcd X = right_solver.eigenvectors() * Dr.cast<std::complex<double>>().asDiagonal();
      Eigen::MatrixXcd Y = Dl.cast<std::complex<double>>().asDiagonal() * left_solver.eigenvectors().adjoint();

      Eigen::JacobiSVD<Eigen::MatrixXcd> decomposition(Y * X, Eigen::ComputeThinU | Eigen::ComputeThinV);
      Eigen::VectorXd S = decomposition.singularValues();
      if (S.norm() == 0.0) {
        throw std::runtime_error("Degenerate MPS environments encountered during canonicalization.");
      }
      S /= S.norm();

      uint32_t k = 0;
      while (k < S.size() && S(k) > options.sv_threshold) {
        k++;
      }

      // Theta = U^dag Y C X V spans lambda_1 Gamma_A lambda_0 Gamma_B lambda_1
      if (k == 0) {
        throw std::runtime_error("No singular values above threshold during canonicalization.");
      }

      Eigen::MatrixXcd P = decomposition.matrixU().leftCols(k).adjoint() * Y;
      Eigen::MatrixXcd Q = X * decomposition.matrixV().leftCols(k);

      Index p(k, "Link,R,b=1");
      Index q(k, "Link,L,b=1");

      ITensor theta = matrix_to_tensor(P, {p}, {left}) * C;
      theta *= matrix_to_tensor(Q, {r}, {q});

      std::vector<Index> u_inds{p, sites[0]};
      std::vector<Index> v_inds{sites[1], q};
      auto [U0, S0, V0] = svd(theta, u_inds, v_inds,
          {"Cutoff=",options.sv_threshold,
           "LeftTags=","Link,L,b=0",
           "RightTags=","Link,R,b=0"});

      S0 /= norm(S0);

      std::vector<double> s1(S.data(), S.data() + k);
      std::vector<double> s1_inv(k);
      for (uint32_t i = 0; i < k; i++) {
        s1_inv[i] = 1.0/s1[i];
      }

      left_indices[0] = commonIndex(U0, S0);
      right_indices[0] = commonIndex(V0, S0);
      left_indices[1] = q;
      right_indices[1] = p;

      gammas[0] = scale_index(U0, p, s1_inv);
      gammas[1] = scale_index(V0, q, s1_inv);
      lambdas[0] = S0;
      lambdas[1] = diagonal_tensor(s1, q, p);
    }

    double canonical_error() const {
      double error = 0.0;
      for (uint32_t bond = 0; bond < 2; bond++) {
        uint32_t chi = dim(right_indices[1 - bond]);

        Eigen::MatrixXcd E = right_environment(bond);
        E /= E.norm();
        Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(chi, chi)/std::sqrt(chi);
        error += (E - I).norm();

        Eigen::MatrixXcd F = left_environment(bond);
        F /= F.norm();
        std::vector<double> sv = diagonal_values(lambdas[1 - bond]);
        Eigen::VectorXd lambda_sq(sv.size());
        for (size_t i = 0; i < sv.size(); i++) {
          lambda_sq(i) = sv[i]*sv[i];
        }
        lambda_sq /= lambda_sq.norm();
        Eigen::MatrixXcd L = lambda_sq.cast<std::complex<double>>().asDiagonal();
        error += (F - L).norm();
      }

      return error;
    }

    Eigen::MatrixXcd two_site_density_matrix(uint32_t bond) const {
      check_bond(bond);
      uint32_t a = bond;
      uint32_t b = 1 - bond;

      Index left;
      ITensor C = cell(bond, left);
      ITensor E = right_fixed_point(bond, C, left);
      ITensor F = left_fixed_point(bond, C, left);

      ITensor rho = F * C;
      rho *= E;
      rho *= dag(prime(C));

      Eigen::MatrixXcd data = tensor_to_matrix(rho, {sites[a], sites[b]}, {prime(sites[a]), prime(sites[b])});
      std::complex<double> tr = data.trace();
      if (std::abs(tr) == 0.0) {
        throw std::runtime_error(fmt::format("Two-site density matrix on bond {} has zero trace.", bond));
      }

      return data / tr;
    }

    Eigen::MatrixXcd one_site_density_matrix(uint32_t site) const {
      check_bond(site);
      Eigen::MatrixXcd rho = two_site_density_matrix(site);

      Eigen::MatrixXcd reduced = Eigen::MatrixXcd::Zero(d, d);
      for (uint32_t i = 0; i < d; i++) {
        for (uint32_t j = 0; j < d; j++) {
          for (uint32_t k = 0; k < d; k++) {
            reduced(i, j) += rho(i + d*k, j + d*k);
          }
        }
      }

      return reduced;
    }

    std::complex<double> expectation(uint32_t bond, const Eigen::MatrixXcd& op) const {
      if (op.rows() != d*d || op.cols() != d*d) {
        throw std::invalid_argument(fmt::format("Two-site operator must be {}x{}, got {}x{}.", d*d, d*d, op.rows(), op.cols()));
      }

      Eigen::MatrixXcd rho = two_site_density_matrix(bond);
      return (rho * op).trace();
    }

    double energy(const Eigen::MatrixXcd& H) const {
      return 0.5*(expectation(0, H).real() + expectation(1, H).real());
    }

    InfiniteMPSData to_data() const {
      InfiniteMPSData data;
      data.physical_dim = d;
      data.options = options;
      data.truncation_error = accumulated_truncation_error;

      for (uint32_t k = 0; k < 2; k++) {
        uint32_t o = 1 - k;
        Index l = right_indices[o];
        Index r = left_indices[k];
        Eigen::MatrixXcd M = tensor_to_matrix(gammas[k], {l, sites[k]}, {r});

        TensorData t;
        t.shape = {static_cast<uint32_t>(dim(l)), d, static_cast<uint32_t>(dim(r))};
        for (Eigen::Index j = 0; j < M.cols(); j++) {
          for (Eigen::Index i = 0; i < M.rows(); i++) {
            t.re.push_back(M(i, j).real());
            t.im.push_back(M(i, j).imag());
          }
        }

        data.gammas.push_back(t);
        data.lambdas.push_back(diagonal_values(lambdas[k]));
      }

      return data;
    }

    void from_data(const InfiniteMPSData& data) {
      if (data.gammas.size() != 2 || data.lambdas.size() != 2) {
        throw std::runtime_error("InfiniteMPS checkpoint must contain two Gamma and two lambda tensors.");
      }

      std::array<uint32_t, 2> chi = {static_cast<uint32_t>(data.lambdas[0].size()), static_cast<uint32_t>(data.lambdas[1].size())};
      for (uint32_t k = 0; k < 2; k++) {
        const TensorData& t = data.gammas[k];
        std::vector<uint32_t> expected = {chi[1 - k], data.physical_dim, chi[k]};
        if (t.shape != expected) {
          throw std::runtime_error(fmt::format("Gamma tensor {} has shape {}, expected {}.", k, t.shape, expected));
        }

        if (t.re.size() != t.im.size() || t.re.size() != static_cast<size_t>(expected[0])*expected[1]*expected[2]) {
          throw std::runtime_error(fmt::format("Gamma tensor {} has {} entries, expected {}.", k, t.re.size(), expected[0]*expected[1]*expected[2]));
        }
      }

      InfiniteMPSImpl impl(data.physical_dim, chi, data.options);
      for (uint32_t k = 0; k < 2; k++) {
        const TensorData& t = data.gammas[k];
        Eigen::MatrixXcd M(t.shape[0]*t.shape[1], t.shape[2]);
        size_t n = 0;
        for (Eigen::Index j = 0; j < M.cols(); j++) {
          for (Eigen::Index i = 0; i < M.rows(); i++) {
            M(i, j) = std::complex<double>(t.re[n], t.im[n]);
            n++;
          }
        }

        uint32_t o = 1 - k;
        impl.gammas[k] = matrix_to_tensor(M, {impl.right_indices[o], impl.sites[k]}, {impl.left_indices[k]});
        impl.lambdas[k] = diagonal_tensor(data.lambdas[k], impl.left_indices[k], impl.right_indices[k]);
      }
      impl.accumulated_truncation_error = data.truncation_error;

      *this = impl;
    }

    std::vector<char> serialize() const {
      return to_beve(to_data(), "InfiniteMPS");
    }

    void deserialize(const std::vector<char>& bytes) {
      InfiniteMPSData data;
      from_beve(data, bytes, "InfiniteMPS");
      from_data(data);
    }
};

InfiniteMPS::InfiniteMPS() : impl(std::make_unique<InfiniteMPSImpl>()) {}

InfiniteMPS::~InfiniteMPS()=default;

InfiniteMPS::InfiniteMPS(const InfiniteMPS& other) : impl(std::make_unique<InfiniteMPSImpl>(*other.impl)) {}

InfiniteMPS& InfiniteMPS::operator=(const InfiniteMPS& other) {
  if (this != &other) {
    impl = std::make_unique<InfiniteMPSImpl>(*other.impl);
  }
  return *this;
}

InfiniteMPS::InfiniteMPS(InfiniteMPS&& other) noexcept=default;
InfiniteMPS& InfiniteMPS::operator=(InfiniteMPS&& other) noexcept=default;

InfiniteMPS InfiniteMPS::random(uint32_t physical_dim, uint32_t bond_dimension, const InfiniteMPSOptions& options) {
  InfiniteMPS mps;
  mps.impl = std::make_unique<InfiniteMPSImpl>(physical_dim, std::array<uint32_t, 2>{bond_dimension, bond_dimension}, options);

  for (uint32_t k = 0; k < 2; k++) {
    uint32_t o = 1 - k;
    Index l = mps.impl->right_indices[o];
    Index s = mps.impl->sites[k];
    Index r = mps.impl->left_indices[k];

    Eigen::MatrixXcd M(dim(l)*dim(s), dim(r));
    for (Eigen::Index i = 0; i < M.rows(); i++) {
      for (Eigen::Index j = 0; j < M.cols(); j++) {
        M(i, j) = std::complex<double>(randn(), randn());
      }
    }

    mps.impl->gammas[k] = matrix_to_tensor(M, {l, s}, {r});
  }

  mps.canonicalize();
  Logger::log_info(fmt::format("Initialized random InfiniteMPS with d = {}, chi = {}.", physical_dim, mps.bond_dimension(0)));
  return mps;
}

InfiniteMPS InfiniteMPS::product_state(const Eigen::VectorXcd& local_a, const Eigen::VectorXcd& local_b, const InfiniteMPSOptions& options) {
  if (local_a.size() != local_b.size()) {
    throw std::invalid_argument(fmt::format("Local states have mismatched dimensions {} and {}.", local_a.size(), local_b.size()));
  }

  if (local_a.norm() == 0.0 || local_b.norm() == 0.0) {
    throw std::invalid_argument("Local states must be nonzero.");
  }

  InfiniteMPS mps;
  uint32_t d = local_a.size();
  mps.impl = std::make_unique<InfiniteMPSImpl>(d, std::array<uint32_t, 2>{1, 1}, options);

  std::array<Eigen::VectorXcd, 2> local = {local_a.normalized(), local_b.normalized()};
  for (uint32_t k = 0; k < 2; k++) {
    uint32_t o = 1 - k;
    mps.impl->gammas[k] = matrix_to_tensor(local[k], {mps.impl->right_indices[o], mps.impl->sites[k]}, {mps.impl->left_indices[k]});
  }

  return mps;
}

const InfiniteMPSOptions& InfiniteMPS::get_options() const {
  return impl->options;
}

void InfiniteMPS::set_options(const InfiniteMPSOptions& options) {
  impl->options = options;
}

uint32_t InfiniteMPS::physical_dim() const {
  return impl->d;
}

uint32_t InfiniteMPS::bond_dimension(uint32_t bond) const {
  return impl->bond_dimension(bond);
}

std::vector<double> InfiniteMPS::singular_values(uint32_t bond) const {
  return impl->singular_values(bond);
}

double InfiniteMPS::entanglement_entropy(uint32_t bond) const {
  return impl->entanglement_entropy(bond);
}

double InfiniteMPS::apply_two_site_gate(uint32_t bond, const Eigen::MatrixXcd& gate, uint32_t max_bond_dimension) {
  return impl->apply_two_site_gate(bond, gate, max_bond_dimension);
}

double InfiniteMPS::truncation_error() const {
  return impl->accumulated_truncation_error;
}

void InfiniteMPS::reset_truncation_error() {
  impl->accumulated_truncation_error = 0.0;
}

Eigen::MatrixXcd InfiniteMPS::right_environment(uint32_t bond) const {
  return impl->right_environment(bond);
}

Eigen::MatrixXcd InfiniteMPS::left_environment(uint32_t bond) const {
  return impl->left_environment(bond);
}

void InfiniteMPS::canonicalize() {
  impl->canonicalize();
}

double InfiniteMPS::canonical_error() const {
  return impl->canonical_error();
}

Eigen::MatrixXcd InfiniteMPS::two_site_density_matrix(uint32_t bond) const {
  return impl->two_site_density_matrix(bond);
}

Eigen::MatrixXcd InfiniteMPS::one_site_density_matrix(uint32_t site) const {
  return impl->one_site_density_matrix(site);
}

std::complex<double> InfiniteMPS::expectation(uint32_t bond, const Eigen::MatrixXcd& op) const {
  return impl->expectation(bond, op);
}

double InfiniteMPS::energy(const Eigen::MatrixXcd& H) const {
  return impl->energy(H);
}

std::string InfiniteMPS::to_string() const {
  std::vector<uint32_t> chi = {bond_dimension(0), bond_dimension(1)};
  std::vector<double> S = {entanglement_entropy(0), entanglement_entropy(1)};
  return fmt::format("InfiniteMPS(d = {}, chi = {}, entropy = {::.6f})", physical_dim(), chi, S);
}

std::vector<char> InfiniteMPS::serialize() const {
  return impl->serialize();
}

void InfiniteMPS::deserialize(const std::vector<char>& bytes) {
  impl->deserialize(bytes);
}

void InfiniteMPS::save(const std::string& path) const {
  write_bytes(path, serialize());
  Logger::log_info(fmt::format("Saved InfiniteMPS checkpoint to {}.", path));
}

InfiniteMPS InfiniteMPS::load(const std::string& path) {
  InfiniteMPS mps;
  mps.deserialize(read_bytes(path));
  return mps;
}
