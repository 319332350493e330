#pragma once

#include <glaze/glaze.hpp>
#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

// File helpers around glaze. Every failure is reported as std::runtime_error
// carrying glz::format_error output.

static inline std::string read_text_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error(fmt::format("Cannot open {} for reading.", path));
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

template <class T>
void from_json(T& value, const std::string& buffer, const std::string& name) {
  auto parse_error = glz::read_json(value, buffer);
  if (parse_error) {
    throw std::runtime_error(fmt::format("Error reading {} from json: \n{}", name, glz::format_error(parse_error, buffer)));
  }
}

template <class T>
std::vector<char> to_beve(const T& value, const std::string& name) {
  std::vector<char> bytes;
  auto write_error = glz::write_beve(value, bytes);
  if (write_error) {
    throw std::runtime_error(fmt::format("Error writing {} to binary: \n{}", name, glz::format_error(write_error, bytes)));
  }
  return bytes;
}

template <class T>
void from_beve(T& value, const std::vector<char>& bytes, const std::string& name) {
  auto parse_error = glz::read_beve(value, bytes);
  if (parse_error) {
    throw std::runtime_error(fmt::format("Error reading {} from binary: \n{}", name, glz::format_error(parse_error, bytes)));
  }
}

static inline void write_bytes(const std::string& path, const std::vector<char>& bytes) {
  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error(fmt::format("Cannot open {} for writing.", path));
  }

  out.write(bytes.data(), bytes.size());
  if (!out) {
    throw std::runtime_error(fmt::format("Failed to write {} bytes to {}.", bytes.size(), path));
  }
}

static inline std::vector<char> read_bytes(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error(fmt::format("Cannot open {} for reading.", path));
  }

  return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
