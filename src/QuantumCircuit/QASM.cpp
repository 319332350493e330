#include "QASM.h"
#include "Logger.hpp"

#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <numbers>
#include <limits>

namespace {
  std::string trim(const std::string& s) {
    auto l = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    if (l >= r) {
      return "";
    }
    return std::string(l, r);
  }

  std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> tokens;
    std::stringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
      tokens.push_back(trim(token));
    }
    return tokens;
  }

  std::string to_qasm_name(const std::string& label) {
    if (label == "sd") {
      return "sdg";
    } else if (label == "sxd") {
      return "sxdg";
    } else if (label == "td") {
      return "tdg";
    }
    return label;
  }

  struct QASMError : public std::runtime_error {
    QASMError(size_t line, const std::string& statement, const std::string& reason)
      : std::runtime_error(fmt::format("QASM parse error on line {} (\"{}\"): {}", line, statement, reason)) {}
  };

  struct Register {
    std::string name;
    uint32_t size;
  };

  // name[size] or name[index]
  std::pair<std::string, uint32_t> parse_indexed(const std::string& s) {
    auto l = s.find('[');
    auto r = s.find(']');
    if (l == std::string::npos || r == std::string::npos || r < l + 2 || r != s.size() - 1) {
      throw std::invalid_argument(fmt::format("expected name[index], got \"{}\"", s));
    }

    std::string name = trim(s.substr(0, l));
    std::string index = s.substr(l + 1, r - l - 1);
    if (name.empty() || !std::all_of(index.begin(), index.end(), [](unsigned char c) { return std::isdigit(c); })) {
      throw std::invalid_argument(fmt::format("expected name[index], got \"{}\"", s));
    }

    // 20 or more digits overflow unsigned long long
    unsigned long long value = index.size() < 20 ? std::stoull(index) : std::numeric_limits<unsigned long long>::max();
    if (value > std::numeric_limits<uint32_t>::max()) {
      throw std::invalid_argument(fmt::format("index {} in \"{}\" is out of range", index, s));
    }

    return {name, static_cast<uint32_t>(value)};
  }

  uint32_t resolve(const std::optional<Register>& reg, const std::string& arg, const char* kind) {
    if (!reg) {
      throw std::invalid_argument(fmt::format("{} used before its register was declared", kind));
    }

    auto [name, index] = parse_indexed(arg);
    if (name != reg->name) {
      throw std::invalid_argument(fmt::format("unknown {} register \"{}\"", kind, name));
    }
    if (index >= reg->size) {
      throw std::invalid_argument(fmt::format("{} index {} out of range for register {}[{}]", kind, index, reg->name, reg->size));
    }

    return index;
  }
}

std::string to_qasm(const QuantumCircuit& qc) {
  std::string s = "OPENQASM 2.0;\ninclude \"qelib1.inc\";\n";
  s += fmt::format("qreg q[{}];\n", qc.get_num_qubits());

  if (qc.get_num_cbits() > 0) {
    s += fmt::format("creg c[{}];\n", qc.get_num_cbits());
  }

  for (auto const& inst : qc.instructions) {
    s += std::visit(quantumcircuit_utils::overloaded {
      [](const std::shared_ptr<Gate>& gate) -> std::string {
        if (dynamic_cast<const MatrixGate*>(gate.get())) {
          throw std::invalid_argument(fmt::format("Matrix gate \"{}\" has no OpenQASM 2.0 representation.", gate->label()));
        }

        std::vector<std::string> args;
        for (auto q : gate->qubits) {
          args.push_back(fmt::format("q[{}]", q));
        }

        std::vector<double> params = gate->params();
        std::string name = to_qasm_name(gate->label());
        if (params.empty()) {
          return fmt::format("{} {};\n", name, fmt::join(args, ","));
        } else {
          return fmt::format("{}({}) {};\n", name, fmt::join(params, ","), fmt::join(args, ","));
        }
      },
      [](const Measurement& m) -> std::string {
        return fmt::format("measure q[{}] -> c[{}];\n", m.qubit(), m.cbit);
      }
    }, inst);
  }

  return s;
}

void write_qasm_file(const QuantumCircuit& qc, const std::string& path) {
  std::string source = to_qasm(qc);

  std::ofstream out(path);
  if (!out.is_open()) {
    throw std::runtime_error(fmt::format("Cannot open {} for writing.", path));
  }

  out << source;
  if (!out) {
    throw std::runtime_error(fmt::format("Failed to write QASM to {}.", path));
  }
}

double parse_qasm_angle(const std::string& expr) {
  std::string s = trim(expr);
  double sign = 1.0;
  while (!s.empty() && (s[0] == '-' || s[0] == '+')) {
    if (s[0] == '-') {
      sign = -sign;
    }
    s = trim(s.substr(1));
  }

  if (s.empty()) {
    throw std::invalid_argument(fmt::format("Empty angle expression \"{}\".", expr));
  }

  auto parse_factor = [&expr](const std::string& token) {
    std::string t = trim(token);
    if (t == "pi") {
      return std::numbers::pi;
    }

    size_t pos = 0;
    double value;
    try {
      value = std::stod(t, &pos);
    } catch (const std::logic_error&) {
      throw std::invalid_argument(fmt::format("Invalid token \"{}\" in angle expression \"{}\".", t, expr));
    }

    if (pos != t.size()) {
      throw std::invalid_argument(fmt::format("Invalid token \"{}\" in angle expression \"{}\".", t, expr));
    }
    return value;
  };

  // Products and quotients evaluated left to right
  double value = 1.0;
  char op = '*';
  size_t start = 0;
  for (size_t i = 0; i <= s.size(); i++) {
    if (i == s.size() || s[i] == '*' || s[i] == '/') {
      double factor = parse_factor(s.substr(start, i - start));
      if (op == '*') {
        value *= factor;
      } else {
        if (factor == 0.0) {
          throw std::invalid_argument(fmt::format("Division by zero in angle expression \"{}\".", expr));
        }
        value /= factor;
      }

      if (i < s.size()) {
        op = s[i];
      }
      start = i + 1;
    }
  }

  return sign * value;
}

QuantumCircuit parse_qasm(const std::string& source) {
  std::optional<Register> qreg;
  std::optional<Register> creg;
  std::vector<Instruction> instructions;

  std::stringstream stream(source);
  std::string line;
  size_t line_number = 0;
  while (std::getline(stream, line)) {
    line_number++;

    auto comment = line.find("//");
    if (comment != std::string::npos) {
      line = line.substr(0, comment);
    }

    line = trim(line);
    if (line.empty()) {
      continue;
    }

    if (line.back() != ';') {
      throw QASMError(line_number, line, "statement must end with ';'");
    }

    for (const auto& statement : split(line.substr(0, line.size() - 1), ';')) {
      if (statement.empty()) {
        continue;
      }

      try {
        if (statement.rfind("OPENQASM", 0) == 0) {
          std::string version = trim(statement.substr(8));
          if (version != "2.0") {
            throw std::invalid_argument(fmt::format("unsupported OpenQASM version {}", version));
          }
          continue;
        }

        if (statement.rfind("include", 0) == 0 || statement.rfind("barrier", 0) == 0) {
          continue;
        }

        if (statement.rfind("qreg", 0) == 0 || statement.rfind("creg", 0) == 0) {
          bool quantum = statement[0] == 'q';
          std::optional<Register>& reg = quantum ? qreg : creg;
          if (reg) {
            throw std::invalid_argument(fmt::format("only one {} declaration is supported", quantum ? "qreg" : "creg"));
          }

          auto [name, size] = parse_indexed(trim(statement.substr(4)));
          reg = Register{name, size};
          continue;
        }

        if (statement.rfind("measure", 0) == 0) {
          auto arrow = statement.find("->");
          if (arrow == std::string::npos) {
            throw std::invalid_argument("measure requires a target classical bit");
          }

          uint32_t q = resolve(qreg, trim(statement.substr(7, arrow - 7)), "qubit");
          uint32_t c = resolve(creg, trim(statement.substr(arrow + 2)), "classical bit");
          instructions.push_back(Measurement(q, c));
          continue;
        }

        // Gate application: name[(params)] args
        size_t name_end = statement.find_first_of(" (");
        if (name_end == std::string::npos) {
          throw std::invalid_argument("expected gate arguments");
        }

        std::string name = statement.substr(0, name_end);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });

        std::vector<double> params;
        std::string rest = statement.substr(name_end);
        if (trim(rest).rfind("(", 0) == 0) {
          rest = trim(rest);
          auto close = rest.find(')');
          if (close == std::string::npos) {
            throw std::invalid_argument("unterminated parameter list");
          }

          for (const auto& p : split(rest.substr(1, close - 1), ',')) {
            params.push_back(parse_qasm_angle(p));
          }
          rest = rest.substr(close + 1);
        }

        bool known = SymbolicGate::try_parse_gate(name).has_value() || RotationGate::parse_axis(name).has_value();
        if (!known || name == "i" || name == "cnot") {
          throw std::invalid_argument(fmt::format("unsupported gate \"{}\"", name));
        }

        Qubits qubits;
        for (const auto& arg : split(trim(rest), ',')) {
          qubits.push_back(resolve(qreg, arg, "qubit"));
        }

        instructions.push_back(make_gate(name, qubits, params));
      } catch (const std::logic_error& e) {
        throw QASMError(line_number, statement, e.what());
      }
    }
  }

  if (!qreg) {
    throw std::runtime_error("QASM parse error: no qreg declaration.");
  }

  QuantumCircuit qc(qreg->size, creg ? creg->size : 0);
  for (const auto& inst : instructions) {
    qc.add_instruction(inst);
  }

  Logger::log_info(fmt::format("Parsed QASM circuit with {} qubits and {} instructions.", qc.get_num_qubits(), qc.length()));

  return qc;
}

QuantumCircuit parse_qasm_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error(fmt::format("Cannot open QASM file {}.", path));
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_qasm(buffer.str());
}
