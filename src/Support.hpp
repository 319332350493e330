#pragma once

#include <vector>
#include <cstdint>

using Qubits = std::vector<uint32_t>;
