#pragma once

#include <map>
#include <set>
#include <tuple>
#include <string>
#include <sstream>
#include <complex>
#include <chrono>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iostream>

#define GET_MACRO(_1, _2, NAME, ...) NAME
#define ASSERT(...) GET_MACRO(__VA_ARGS__, ASSERT_TWO_ARGS, ASSERT_ONE_ARG)(__VA_ARGS__)

#define ASSERT_ONE_ARG(x) if (!(x)) { return false; }

#define ASSERT_TWO_ARGS(x, y) \
  if (!(x)) {                 \
    std::cout << y << "\n";   \
    return false;             \
  }

// Passes when expression throws an exception of type E
#define ASSERT_THROWS(expression, E)  \
  {                                   \
    bool thrown = false;              \
    try {                             \
      expression;                     \
    } catch (const E&) {              \
      thrown = true;                  \
    }                                 \
    ASSERT(thrown, fmt::format("{} did not throw {}.", #expression, #E)); \
  }

template <>
struct fmt::formatter<std::complex<double>> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const std::complex<double>& c, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{} + {}i", c.real(), c.imag());
  }
};

template <typename T, typename V>
bool is_close_eps(double eps, T first, V second) {
  return std::abs(first - second) < eps;
}

template <typename T, typename V>
bool is_close(T first, V second) {
  return is_close_eps(1e-8, first, second);
}

template <typename T, typename V, typename... Args>
bool is_close_eps(double eps, T first, V second, Args... args) {
  if (!is_close_eps(eps, first, second)) {
    return false;
  } else {
    return is_close_eps(eps, first, args...);
  }
}

template <typename T, typename V, typename... Args>
bool is_close(T first, V second, Args... args) {
  if (!is_close(first, second)) {
    return false;
  } else {
    return is_close(first, args...);
  }
}

using TestResult = std::tuple<bool, int>;

#define ADD_TEST(x)                                                               \
if (run_all || test_names.contains(#x)) {                                         \
  auto start = std::chrono::high_resolution_clock::now();                         \
  bool passed = x();                                                              \
  auto stop = std::chrono::high_resolution_clock::now();                          \
  int duration = duration_cast<std::chrono::microseconds>(stop - start).count();  \
  tests[#x "()"] = std::make_tuple(passed, duration);                             \
}                                                                                 \

// Prints one line per test and returns the process exit code.
static inline int report_tests(const std::map<std::string, TestResult>& tests) {
  constexpr char green[] = "\033[1;32m";
  constexpr char black[] = "\033[0m";
  constexpr char red[] = "\033[1;31m";

  auto test_passed_str = [&](bool passed) {
    std::stringstream stream;
    if (passed) {
      stream << green << "PASSED" << black;
    } else {
      stream << red << "FAILED" << black;
    }

    return stream.str();
  };

  if (tests.size() == 0) {
    std::cout << "No tests to run.\n";
    return 0;
  }

  bool all_passed = true;
  double total_duration = 0.0;
  for (const auto& [name, result] : tests) {
    auto [passed, duration] = result;
    std::cout << fmt::format("{:>40}: {} ({:.2f} seconds)\n", name, test_passed_str(passed), duration/1e6);
    total_duration += duration;
    all_passed = all_passed && passed;
  }

  std::cout << fmt::format("Total duration: {:.2f} seconds\n", total_duration/1e6);
  return all_passed ? 0 : 1;
}
