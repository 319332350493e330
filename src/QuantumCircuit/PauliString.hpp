#pragma once

#include <unsupported/Eigen/KroneckerProduct>
#include <iostream>
#include <array>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "CircuitUtils.h"
#include "Random.hpp"

enum Pauli {
  I, X, Z, Y
};

// Exponent of i picked up when multiplying single-qubit Paulis with xz bits xz1 and xz2.
constexpr int compute_phase(uint8_t xz1, uint8_t xz2) {
  bool x1 = (xz1 >> 0u) & 1u;
  bool z1 = (xz1 >> 1u) & 1u;
  bool x2 = (xz2 >> 0u) & 1u;
  bool z2 = (xz2 >> 1u) & 1u;
  if (!x1 && !z1) {
    return 0;
  } else if (x1 && z1) {
    if (z2) {
      return x2 ? 0 : 1;
    } else {
      return x2 ? -1 : 0;
    }
  } else if (x1 && !z1) {
    if (z2) {
      return x2 ? 1 : -1;
    } else {
      return 0;
    }
  } else {
    if (x2) {
      return z2 ? -1 : 1;
    } else {
      return 0;
    }
  }
}

constexpr std::array<int, 16> generate_phase_table() {
  std::array<int, 16> table;
  for (uint8_t xz1 = 0; xz1 < 4; xz1++) {
    for (uint8_t xz2 = 0; xz2 < 4; xz2++) {
      table[xz2 + (xz1 << 2u)] = compute_phase(xz1, xz2);
    }
  }

  return table;
}

constexpr static int multiplication_phase(uint8_t xz1, uint8_t xz2) {
  constexpr auto results = generate_phase_table();
  return results[xz2 + (xz1 << 2u)];
}

static inline char pauli_to_char(Pauli p) {
  switch (p) {
    case Pauli::I: return 'I';
    case Pauli::X: return 'X';
    case Pauli::Y: return 'Y';
    case Pauli::Z: return 'Z';
  }

  throw std::runtime_error("Unreachable.");
}

class QuantumCircuit;
class Gate;

using binary_word = uint32_t;

struct BitString {
  uint32_t num_bits;
  std::vector<binary_word> bits;

  BitString()=default;

  BitString(uint32_t num_bits) : num_bits(num_bits) {
    size_t width = num_bits / binary_word_size() + static_cast<bool>(num_bits % binary_word_size());
    bits = std::vector<binary_word>(width, 0);
  }

  static inline constexpr size_t binary_word_size() {
    return 8u*sizeof(binary_word);
  }

  inline bool get(uint32_t i) const {
    binary_word word = bits[i / binary_word_size()];
    uint32_t bit_ind = i % binary_word_size();

    return (word >> bit_ind) & 1u;
  }

  inline void set(uint32_t i, bool v) {
    uint32_t word_ind = i / binary_word_size();
    uint32_t bit_ind = i % binary_word_size();

    bits[word_ind] = (bits[word_ind] & ~(1u << bit_ind)) | (static_cast<binary_word>(v) << bit_ind);
  }

  uint32_t size() const {
    return bits.size();
  }

  BitString operator^(const BitString& other) const {
    if (size() != other.size()) {
      throw std::invalid_argument(fmt::format("Tried to perform ^ on BitStrings of unequal length: {} and {}", size(), other.size()));
    }

    BitString new_bits(num_bits);
    for (size_t i = 0; i < size(); i++) {
      new_bits.bits[i] = bits[i] ^ other.bits[i];
    }

    return new_bits;
  }
};

// n-qubit Pauli operator i^phase * P_0 ... P_{n-1}. Conjugation methods map
// P -> U P U^dagger in place.
class PauliString {
  public:
    uint32_t num_qubits;
    uint8_t phase;

    // Bits are interleaved as x0 z0 x1 z1 ..., sixteen qubits per word.
    BitString bit_string;

    PauliString()=default;
    PauliString(uint32_t num_qubits) : num_qubits(num_qubits), phase(0) {
      if (num_qubits == 0) {
        throw std::invalid_argument("Cannot create a 0-qubit PauliString.");
      }
      bit_string = BitString(2u * num_qubits);
    }

    static uint32_t process_pauli_string(const std::string& paulis) {
      std::string s = paulis;
      parse_phase(s);
      return s.size();
    }

    static inline uint8_t parse_phase(std::string& s) {
      if (s.rfind("+i", 0) == 0) {
        s = s.substr(2);
        return 1;
      } else if (s.rfind("+", 0) == 0) {
        s = s.substr(1);
        return 0;
      } else if (s.rfind("-i", 0) == 0) {
        s = s.substr(2);
        return 3;
      } else if (s.rfind("-", 0) == 0) {
        s = s.substr(1);
        return 2;
      }

      return 0;
    }

    PauliString(const std::string& paulis) : PauliString(process_pauli_string(paulis)) {
      std::string s = paulis;
      phase = parse_phase(s);

      for (size_t i = 0; i < num_qubits; i++) {
        if (s[i] == 'I') {
          set_op(i, Pauli::I);
        } else if (s[i] == 'X') {
          set_op(i, Pauli::X);
        } else if (s[i] == 'Y') {
          set_op(i, Pauli::Y);
        } else if (s[i] == 'Z') {
          set_op(i, Pauli::Z);
        } else {
          throw std::invalid_argument(fmt::format("Invalid string {} used to create PauliString; character {} not recognized.", paulis, s[i]));
        }
      }
    }

    PauliString(const std::vector<Pauli>& paulis, uint8_t phase=0) : PauliString(paulis.size()) {
      for (size_t i = 0; i < paulis.size(); i++) {
        set_op(i, paulis[i]);
      }

      set_r(phase);
    }

    // Uniformly random non-identity Pauli with a random phase.
    static PauliString rand(uint32_t num_qubits) {
      PauliString p(num_qubits);

      for (uint32_t j = 0; j < num_qubits; j++) {
        p.set_op(j, static_cast<Pauli>(randi(0, 4)));
      }

      p.set_r(randi(0, 4));

      for (uint32_t j = 0; j < num_qubits; j++) {
        if (p.get_xz(j)) {
          return p;
        }
      }

      return PauliString::rand(num_qubits);
    }

    // The 4^n Paulis with phase +1, ordered with qubit 0 as the fastest index.
    static std::vector<PauliString> all_paulis(uint32_t num_qubits) {
      std::vector<PauliString> paulis;
      uint32_t n = 1u << (2u * num_qubits);
      for (uint32_t k = 0; k < n; k++) {
        PauliString p(num_qubits);
        for (uint32_t j = 0; j < num_qubits; j++) {
          p.set_op(j, static_cast<Pauli>((k >> (2u*j)) & 3u));
        }
        paulis.push_back(p);
      }

      return paulis;
    }

    static uint8_t get_multiplication_phase(const PauliString& p1, const PauliString& p2) {
      uint8_t s = p1.get_r() + p2.get_r();

      for (uint32_t j = 0; j < p1.num_qubits; j++) {
        s += multiplication_phase(p1.get_xz(j), p2.get_xz(j));
      }

      return s;
    }

    PauliString operator*(const PauliString& other) const {
      if (num_qubits != other.num_qubits) {
        throw std::invalid_argument(fmt::format("Multiplying PauliStrings with {} qubits and {} qubits do not match.", num_qubits, other.num_qubits));
      }

      PauliString p(num_qubits);

      p.set_r(PauliString::get_multiplication_phase(*this, other));
      p.bit_string = bit_string ^ other.bit_string;

      return p;
    }

    bool operator==(const PauliString &rhs) const {
      if (num_qubits != rhs.num_qubits) {
        return false;
      }

      if (get_r() != rhs.get_r()) {
        return false;
      }

      for (uint32_t i = 0; i < num_qubits; i++) {
        if (get_xz(i) != rhs.get_xz(i)) {
          return false;
        }
      }

      return true;
    }

    bool operator!=(const PauliString &rhs) const {
      return !(this->operator==(rhs));
    }

    // Equal as operators up to the phase.
    bool same_paulis(const PauliString& rhs) const {
      return num_qubits == rhs.num_qubits && to_pauli() == rhs.to_pauli();
    }

    friend std::ostream& operator<< (std::ostream& stream, const PauliString& p) {
      stream << p.to_string_ops();
      return stream;
    }

    Eigen::Matrix2cd to_matrix(uint32_t i) const {
      Eigen::Matrix2cd g;
      switch (to_pauli(i)) {
        case Pauli::I:
          g << 1, 0, 0, 1;
          break;
        case Pauli::X:
          g << 0, 1, 1, 0;
          break;
        case Pauli::Y:
          g << 0, std::complex<double>(0.0, -1.0), std::complex<double>(0.0, 1.0), 0;
          break;
        case Pauli::Z:
          g << 1, 0, 0, -1;
          break;
      }

      return g;
    }

    // Qubit 0 is the least significant bit of the matrix index.
    Eigen::MatrixXcd to_matrix() const {
      Eigen::MatrixXcd g = to_matrix(0);

      for (uint32_t i = 1; i < num_qubits; i++) {
        Eigen::MatrixXcd gi = to_matrix(i);
        Eigen::MatrixXcd g0 = g;
        g = Eigen::kroneckerProduct(gi, g0);
      }

      return sign() * g;
    }

    Pauli to_pauli(uint32_t i) const {
      return static_cast<Pauli>(get_xz(i));
    }

    std::vector<Pauli> to_pauli() const {
      std::vector<Pauli> paulis(num_qubits);
      for (uint32_t i = 0; i < num_qubits; i++) {
        paulis[i] = to_pauli(i);
      }
      return paulis;
    }

    inline static std::string phase_to_string(uint8_t phase) {
      if (phase == 0) {
        return "+";
      } else if (phase == 1) {
        return "+i";
      } else if (phase == 2) {
        return "-";
      } else if (phase == 3) {
        return "-i";
      }

      throw std::runtime_error("Invalid phase bits passed to phase_to_string.");
    }

    std::string to_string_ops() const {
      std::string s = phase_to_string(phase);

      for (uint32_t i = 0; i < num_qubits; i++) {
        s += pauli_to_char(to_pauli(i));
      }

      return s;
    }

    // Conjugates by every gate of a Clifford circuit.
    void evolve(const QuantumCircuit& qc);
    void evolve(const Gate& gate);

    void s(uint32_t a) {
      uint8_t xza = get_xz(a);
      bool xa = (xza >> 0u) & 1u;
      bool za = (xza >> 1u) & 1u;

      constexpr uint8_t s_phase_lookup[] = {0, 0, 0, 2};
      set_r(phase + s_phase_lookup[xza]);
      set_z(a, xa != za);
    }

    void sd(uint32_t a) {
      s(a);
      s(a);
      s(a);
    }

    void h(uint32_t a) {
      uint8_t xza = get_xz(a);
      bool xa = (xza >> 0u) & 1u;
      bool za = (xza >> 1u) & 1u;

      constexpr uint8_t h_phase_lookup[] = {0, 0, 0, 2};
      set_r(phase + h_phase_lookup[xza]);
      set_x(a, za);
      set_z(a, xa);
    }

    // Pauli conjugation only flips the sign of anticommuting factors.
    void x(uint32_t a) {
      if (get_z(a)) {
        set_r(phase + 2);
      }
    }

    void y(uint32_t a) {
      if (get_x(a) != get_z(a)) {
        set_r(phase + 2);
      }
    }

    void z(uint32_t a) {
      if (get_x(a)) {
        set_r(phase + 2);
      }
    }

    void sx(uint32_t a) {
      sd(a);
      h(a);
      sd(a);
    }

    void sxd(uint32_t a) {
      s(a);
      h(a);
      s(a);
    }

    void cx(uint32_t a, uint32_t b) {
      uint8_t xza = get_xz(a);
      bool xa = (xza >> 0u) & 1u;
      bool za = (xza >> 1u) & 1u;

      uint8_t xzb = get_xz(b);
      bool xb = (xzb >> 0u) & 1u;
      bool zb = (xzb >> 1u) & 1u;

      uint8_t bitcode = xzb + (xza << 2);

      constexpr uint8_t cx_phase_lookup[] = {0, 0, 0, 0, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0, 0, 2};
      set_r(phase + cx_phase_lookup[bitcode]);
      set_x(b, xa != xb);
      set_z(a, za != zb);
    }

    void cy(uint32_t a, uint32_t b) {
      sd(b);
      cx(a, b);
      s(b);
    }

    void cz(uint32_t a, uint32_t b) {
      h(b);
      cx(a, b);
      h(b);
    }

    void swap(uint32_t a, uint32_t b) {
      Pauli pa = to_pauli(a);
      set_op(a, to_pauli(b));
      set_op(b, pa);
    }

    bool commutes_at(const PauliString& p, uint32_t i) const {
      uint8_t xz1 = get_xz(i);
      uint8_t xz2 = p.get_xz(i);
      return xz1 == 0 || xz2 == 0 || xz1 == xz2;
    }

    bool commutes(const PauliString& p) const {
      if (num_qubits != p.num_qubits) {
        throw std::invalid_argument(fmt::format("p = {} has {} qubits and q = {} has {} qubits; cannot check commutation.", p.to_string_ops(), p.num_qubits, to_string_ops(), num_qubits));
      }

      uint32_t anticommuting_indices = 0u;
      for (uint32_t i = 0; i < num_qubits; i++) {
        if (!commutes_at(p, i)) {
          anticommuting_indices++;
        }
      }

      return anticommuting_indices % 2 == 0;
    }

    inline std::complex<double> sign() const {
      constexpr std::complex<double> i(0.0, 1.0);
      constexpr std::complex<double> signs[] = {1.0, i, -1.0, -i};
      return signs[phase];
    }

    inline bool get_x(uint32_t i) const {
      return bit_string.get(2*i);
    }

    inline bool get_z(uint32_t i) const {
      return bit_string.get(2*i + 1);
    }

    // Both bits of site i, x in bit 0 and z in bit 1.
    inline uint8_t get_xz(uint32_t i) const {
      uint32_t bit_ind = 2u*(i % 16u);
      return (bit_string.bits[i / 16u] >> bit_ind) & 3u;
    }

    inline uint8_t get_r() const {
      return phase;
    }

    inline void set_x(uint32_t i, bool v) {
      bit_string.set(2*i, v);
    }

    inline void set_z(uint32_t i, bool v) {
      bit_string.set(2*i + 1, v);
    }

    inline void set_r(uint8_t v) {
      phase = v & 0b11;
    }

    inline void set_op(size_t i, Pauli p) {
      uint8_t xz = static_cast<uint8_t>(p);
      set_x(i, xz & 1u);
      set_z(i, (xz >> 1u) & 1u);
    }
};

namespace fmt {
  template <>
  struct formatter<PauliString> {
    constexpr auto parse(format_parse_context& ctx) const -> decltype(ctx.begin()) {
      return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const PauliString& ps, FormatContext& ctx) const -> decltype(ctx.out()) {
      return fmt::format_to(ctx.out(), "{}", ps.to_string_ops());
    }
  };
}
