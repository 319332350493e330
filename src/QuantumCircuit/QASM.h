#pragma once

#include "QuantumCircuit.h"

#include <string>

// OpenQASM 2.0 subset: one qreg, at most one creg, the qelib1 gates
// id h x y z s sdg sx sxdg t tdg rx ry rz cx cy cz swap, measure and barrier.

std::string to_qasm(const QuantumCircuit& qc);
void write_qasm_file(const QuantumCircuit& qc, const std::string& path);

QuantumCircuit parse_qasm(const std::string& source);
QuantumCircuit parse_qasm_file(const std::string& path);

// Evaluates decimal literals and products/quotients involving pi, e.g. -3*pi/4.
double parse_qasm_angle(const std::string& expr);
