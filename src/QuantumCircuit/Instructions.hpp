#pragma once

#include <Eigen/Dense>

#include <unordered_set>
#include <unordered_map>
#include <vector>
#include <variant>
#include <complex>
#include <memory>
#include <string>
#include <cctype>
#include <optional>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "CircuitUtils.h"

// --- Definitions for gates/measurements --- //

namespace gates {
  constexpr double sqrt2i_ = 0.707106781186547524400844362104849;
  constexpr std::complex<double> i_ = std::complex<double>(0.0, 1.0);

  struct I { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << 1.0, 0.0, 0.0, 1.0).finished(); };
  struct H { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << sqrt2i_, sqrt2i_, sqrt2i_, -sqrt2i_).finished(); };
  struct X { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << 0.0, 1.0, 1.0, 0.0).finished(); };
  struct Y { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << 0.0, -i_, i_, 0.0).finished(); };
  struct Z { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << 1.0, 0.0, 0.0, -1.0).finished(); };

  struct S { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << 1.0, 0.0, 0.0, i_).finished(); };
  struct Sd { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << 1.0, 0.0, 0.0, -i_).finished(); };
  struct SX { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << (1.0 + i_)/2.0, (1.0 - i_)/2.0, (1.0 - i_)/2.0, (1.0 + i_)/2.0).finished(); };
  struct SXd { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << (1.0 - i_)/2.0, (1.0 + i_)/2.0, (1.0 + i_)/2.0, (1.0 - i_)/2.0).finished(); };

  struct T { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << 1.0, 0.0, 0.0, sqrt2i_*(1.0 + i_)).finished(); };
  struct Td { static inline const Eigen::Matrix2cd value = (Eigen::Matrix2cd() << 1.0, 0.0, 0.0, sqrt2i_*(1.0 - i_)).finished(); };

  // Two-qubit matrices act on |q1 q0>, with qubits[0] the low bit; qubits[0] is the control.
  struct CX { static inline const Eigen::Matrix4cd value = (Eigen::Matrix4cd() << 1, 0, 0, 0,
                                                                                  0, 0, 0, 1,
                                                                                  0, 0, 1, 0,
                                                                                  0, 1, 0, 0).finished(); };
  struct CY { static inline const Eigen::Matrix4cd value = (Eigen::Matrix4cd() << 1, 0, 0, 0,
                                                                                  0, 0, 0, -i_,
                                                                                  0, 0, 1, 0,
                                                                                  0, i_, 0, 0).finished(); };
  struct CZ { static inline const Eigen::Matrix4cd value = (Eigen::Matrix4cd() << 1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1, 0, 0, 0, 0, -1).finished(); };
  struct SWAP { static inline const Eigen::Matrix4cd value = (Eigen::Matrix4cd() << 1, 0, 0, 0, 0, 0, 1, 0, 0, 1, 0, 0, 0, 0, 0, 1).finished(); };
}

class Gate {
  public:
    Qubits qubits;
    uint32_t num_qubits;

    Gate(const Qubits& qubits)
      : qubits(qubits), num_qubits(qubits.size()) {
        if (!qargs_unique(qubits)) {
          throw std::invalid_argument(fmt::format("Qubits {} provided to gate not unique.", qubits));
        }
      }

    virtual ~Gate()=default;

    // Angles are bound at construction; only rotation gates carry one.
    virtual uint32_t num_params() const=0;

    virtual std::vector<double> params() const {
      return {};
    }

    virtual std::string label() const=0;

    virtual Eigen::MatrixXcd define() const=0;

    virtual std::shared_ptr<Gate> adjoint() const=0;

    virtual bool is_clifford() const=0;

    virtual std::shared_ptr<Gate> clone() const=0;
};

class SymbolicGate : public Gate {
  public:
    enum GateLabel {
      I, H, X, Y, Z, S, Sd, SX, SXd, T, Td, CX, CY, CZ, SWAP
    };

  private:
    inline static const std::unordered_set<SymbolicGate::GateLabel> non_clifford_gates = {
      SymbolicGate::GateLabel::T, SymbolicGate::GateLabel::Td
    };

    inline static const std::unordered_map<SymbolicGate::GateLabel, SymbolicGate::GateLabel> adjoint_map = {
      {SymbolicGate::GateLabel::S, SymbolicGate::GateLabel::Sd},
      {SymbolicGate::GateLabel::Sd, SymbolicGate::GateLabel::S},
      {SymbolicGate::GateLabel::SX, SymbolicGate::GateLabel::SXd},
      {SymbolicGate::GateLabel::SXd, SymbolicGate::GateLabel::SX},
      {SymbolicGate::GateLabel::T, SymbolicGate::GateLabel::Td},
      {SymbolicGate::GateLabel::Td, SymbolicGate::GateLabel::T},
    };

    static bool str_equal_ci(const std::string& a, const char* b) {
      size_t i = 0;
      for (; i < a.size() && b[i]; i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
          return false;
        }
      }
      return i == a.size() && b[i] == '\0';
    }

  public:
    static std::optional<SymbolicGate::GateLabel> try_parse_gate(const std::string& name) {
      if (str_equal_ci(name, "id") || str_equal_ci(name, "i")) {
        return SymbolicGate::GateLabel::I;
      } else if (str_equal_ci(name, "h")) {
        return SymbolicGate::GateLabel::H;
      } else if (str_equal_ci(name, "x")) {
        return SymbolicGate::GateLabel::X;
      } else if (str_equal_ci(name, "y")) {
        return SymbolicGate::GateLabel::Y;
      } else if (str_equal_ci(name, "z")) {
        return SymbolicGate::GateLabel::Z;
      } else if (str_equal_ci(name, "s")) {
        return SymbolicGate::GateLabel::S;
      } else if (str_equal_ci(name, "sd") || str_equal_ci(name, "sdg")) {
        return SymbolicGate::GateLabel::Sd;
      } else if (str_equal_ci(name, "sx")) {
        return SymbolicGate::GateLabel::SX;
      } else if (str_equal_ci(name, "sxd") || str_equal_ci(name, "sxdg")) {
        return SymbolicGate::GateLabel::SXd;
      } else if (str_equal_ci(name, "t")) {
        return SymbolicGate::GateLabel::T;
      } else if (str_equal_ci(name, "td") || str_equal_ci(name, "tdg")) {
        return SymbolicGate::GateLabel::Td;
      } else if (str_equal_ci(name, "cx") || str_equal_ci(name, "cnot")) {
        return SymbolicGate::GateLabel::CX;
      } else if (str_equal_ci(name, "cy")) {
        return SymbolicGate::GateLabel::CY;
      } else if (str_equal_ci(name, "cz")) {
        return SymbolicGate::GateLabel::CZ;
      } else if (str_equal_ci(name, "swap")) {
        return SymbolicGate::GateLabel::SWAP;
      }

      return std::nullopt;
    }

    static SymbolicGate::GateLabel parse_gate(const std::string& name) {
      auto type = try_parse_gate(name);
      if (!type) {
        throw std::invalid_argument(fmt::format("Unknown gate {}.", name));
      }
      return type.value();
    }

    static const char* type_to_string(SymbolicGate::GateLabel g) {
      switch (g) {
        case SymbolicGate::GateLabel::I:
          return "id";
        case SymbolicGate::GateLabel::H:
          return "h";
        case SymbolicGate::GateLabel::X:
          return "x";
        case SymbolicGate::GateLabel::Y:
          return "y";
        case SymbolicGate::GateLabel::Z:
          return "z";
        case SymbolicGate::GateLabel::S:
          return "s";
        case SymbolicGate::GateLabel::Sd:
          return "sd";
        case SymbolicGate::GateLabel::SX:
          return "sx";
        case SymbolicGate::GateLabel::SXd:
          return "sxd";
        case SymbolicGate::GateLabel::T:
          return "t";
        case SymbolicGate::GateLabel::Td:
          return "td";
        case SymbolicGate::GateLabel::CX:
          return "cx";
        case SymbolicGate::GateLabel::CY:
          return "cy";
        case SymbolicGate::GateLabel::CZ:
          return "cz";
        case SymbolicGate::GateLabel::SWAP:
          return "swap";
      }

      throw std::runtime_error("Invalid gate type.");
    }

    static size_t num_qubits_for_gate(SymbolicGate::GateLabel g) {
      switch (g) {
        case SymbolicGate::GateLabel::CX:
        case SymbolicGate::GateLabel::CY:
        case SymbolicGate::GateLabel::CZ:
        case SymbolicGate::GateLabel::SWAP:
          return 2;
        default:
          return 1;
      }
    }

    static Eigen::MatrixXcd to_data(SymbolicGate::GateLabel g) {
      switch (g) {
        case SymbolicGate::GateLabel::I:
          return gates::I::value;
        case SymbolicGate::GateLabel::H:
          return gates::H::value;
        case SymbolicGate::GateLabel::X:
          return gates::X::value;
        case SymbolicGate::GateLabel::Y:
          return gates::Y::value;
        case SymbolicGate::GateLabel::Z:
          return gates::Z::value;
        case SymbolicGate::GateLabel::S:
          return gates::S::value;
        case SymbolicGate::GateLabel::Sd:
          return gates::Sd::value;
        case SymbolicGate::GateLabel::SX:
          return gates::SX::value;
        case SymbolicGate::GateLabel::SXd:
          return gates::SXd::value;
        case SymbolicGate::GateLabel::T:
          return gates::T::value;
        case SymbolicGate::GateLabel::Td:
          return gates::Td::value;
        case SymbolicGate::GateLabel::CX:
          return gates::CX::value;
        case SymbolicGate::GateLabel::CY:
          return gates::CY::value;
        case SymbolicGate::GateLabel::CZ:
          return gates::CZ::value;
        case SymbolicGate::GateLabel::SWAP:
          return gates::SWAP::value;
      }

      throw std::runtime_error("Invalid gate type.");
    }

    SymbolicGate::GateLabel type;

    SymbolicGate(SymbolicGate::GateLabel type, const Qubits& qubits) : Gate(qubits), type(type) {
      if (num_qubits_for_gate(type) != qubits.size()) {
        throw std::invalid_argument(fmt::format("Gate {} acts on {} qubits; received {}.", type_to_string(type), num_qubits_for_gate(type), qubits));
      }
    }

    SymbolicGate(const std::string& name, const Qubits& qubits) : SymbolicGate(parse_gate(name), qubits) { }

    virtual bool is_clifford() const override {
      return !SymbolicGate::non_clifford_gates.contains(type);
    }

    virtual uint32_t num_params() const override {
      return 0;
    }

    virtual std::string label() const override {
      return type_to_string(type);
    }

    virtual Eigen::MatrixXcd define() const override {
      return to_data(type);
    }

    virtual std::shared_ptr<Gate> adjoint() const override {
      SymbolicGate::GateLabel new_type = type;
      if (SymbolicGate::adjoint_map.contains(type)) {
        new_type = SymbolicGate::adjoint_map.at(type);
      }

      return std::make_shared<SymbolicGate>(new_type, qubits);
    }

    virtual std::shared_ptr<Gate> clone() const override {
      return std::make_shared<SymbolicGate>(type, qubits);
    }
};

class MatrixGate : public Gate {
  public:
    Eigen::MatrixXcd data;
    std::string label_str;

    MatrixGate(const Eigen::MatrixXcd& data, const Qubits& qubits, const std::string& label_str)
      : Gate(qubits), data(data), label_str(label_str) {
      uint32_t dim = 1u << qubits.size();
      if (data.rows() != dim || data.cols() != dim) {
        throw std::invalid_argument(fmt::format("Matrix of shape {}x{} cannot act on qubits {}.", data.rows(), data.cols(), qubits));
      }
    }

    MatrixGate(const Eigen::MatrixXcd& data, const Qubits& qubits)
      : MatrixGate(data, qubits, "U") {}

    virtual uint32_t num_params() const override {
      return 0;
    }

    virtual std::string label() const override {
      return label_str;
    }

    virtual Eigen::MatrixXcd define() const override {
      return data;
    }

    virtual std::shared_ptr<Gate> adjoint() const override {
      return std::make_shared<MatrixGate>(data.adjoint(), qubits, label_str + "d");
    }

    virtual bool is_clifford() const override {
      // Twirled by matrix search instead
      return false;
    }

    virtual std::shared_ptr<Gate> clone() const override {
      return std::make_shared<MatrixGate>(data, qubits, label_str);
    }
};

class RotationGate : public Gate {
  public:
    enum Axis { X, Y, Z };

    Axis axis;
    double theta;

    RotationGate(Axis axis, const Qubits& qubits, double theta) : Gate(qubits), axis(axis), theta(theta) {
      if (qubits.size() != 1) {
        throw std::invalid_argument(fmt::format("{} gate can only have a single qubit. Passed {}.", label(), qubits.size()));
      }
    }

    static std::optional<Axis> parse_axis(const std::string& name) {
      if (name == "rx" || name == "Rx" || name == "RX") {
        return Axis::X;
      } else if (name == "ry" || name == "Ry" || name == "RY") {
        return Axis::Y;
      } else if (name == "rz" || name == "Rz" || name == "RZ") {
        return Axis::Z;
      }

      return std::nullopt;
    }

    virtual uint32_t num_params() const override {
      return 1;
    }

    virtual std::vector<double> params() const override {
      return {theta};
    }

    virtual std::string label() const override {
      switch (axis) {
        case Axis::X: return "rx";
        case Axis::Y: return "ry";
        case Axis::Z: return "rz";
      }
      return "r";
    }

    virtual Eigen::MatrixXcd define() const override {
      Eigen::MatrixXcd gate = Eigen::MatrixXcd::Zero(2, 2);

      double c = std::cos(theta/2);
      double s = std::sin(theta/2);
      if (axis == Axis::X) {
        gate << std::complex<double>(c, 0), std::complex<double>(0, -s),
                std::complex<double>(0, -s), std::complex<double>(c, 0);
      } else if (axis == Axis::Y) {
        gate << std::complex<double>(c, 0), std::complex<double>(-s, 0),
                std::complex<double>(s, 0), std::complex<double>(c, 0);
      } else {
        gate << std::complex<double>(c, -s), std::complex<double>(0.0, 0.0),
                std::complex<double>(0.0, 0.0), std::complex<double>(c, s);
      }

      return gate;
    }

    virtual bool is_clifford() const override {
      return false;
    }

    virtual std::shared_ptr<Gate> adjoint() const override {
      return std::make_shared<RotationGate>(axis, qubits, -theta);
    }

    virtual std::shared_ptr<Gate> clone() const override {
      return std::make_shared<RotationGate>(axis, qubits, theta);
    }
};

// Builds a SymbolicGate or RotationGate from its name.
std::shared_ptr<Gate> make_gate(const std::string& name, const Qubits& qubits, const std::vector<double>& params={});

// Computational-basis measurement of one qubit, stored into one classical bit.
struct Measurement {
  Qubits qubits;
  uint32_t cbit;

  Measurement(uint32_t qubit, uint32_t cbit) : qubits({qubit}), cbit(cbit) {}

  uint32_t qubit() const {
    return qubits[0];
  }
};

typedef std::variant<std::shared_ptr<Gate>, Measurement> Instruction;

Instruction copy_instruction(const Instruction& inst);
Qubits get_instruction_support(const Instruction& inst);
bool instruction_is_unitary(const Instruction& inst);
std::string instruction_to_string(const Instruction& inst);

template <>
struct fmt::formatter<Instruction> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const Instruction& inst, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", instruction_to_string(inst));
  }
};
