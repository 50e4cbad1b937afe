/**
 * Taken and modified from our sister project Hyrise (https://github.com/hyrise/hyrise)
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "string.hpp"

/**
 * Assertions for the deployer. They replace std cassert/assert.h and keep failing in release builds where needed.
 *
 * --> Use Assert() for invariants that must hold in every build, e.g., a plan that starts with a mutating step:
 *
 *   Assert(!plan.empty(), "A deployment plan always holds at least one operation.");
 *
 * --> Use Fail() whenever an illegal code path is taken, e.g., in the default branch of a switch over an enum.
 *
 * --> Use AssertInput() and FailInput() to reject user input. The resulting InvalidInputException can be caught and
 *     reported to the caller without a stack of source locations.
 */

namespace stratus {

// Raised for malformed or inconsistent caller input.
class InvalidInputException : public std::runtime_error {
 public:
  explicit InvalidInputException(const std::string& what) : std::runtime_error(what) {}
};

namespace detail {

[[noreturn]] inline void Fail(const std::string& message) { throw std::logic_error(message); }

}  // namespace detail

#define Fail(message)                                                                                              \
  stratus::detail::Fail(stratus::TrimSourceFilePath(__FILE__) + ":" + std::to_string(__LINE__) + " " + (message)); \
  static_assert(true, "End macro call with a semicolon")

[[noreturn]] inline void FailInput(const std::string& message) {
  throw InvalidInputException(std::string("Error: Invalid input; ") + message);
}

}  // namespace stratus

#define Assert(expression, message)     \
  if (!static_cast<bool>(expression)) { \
    Fail(message);                      \
  }                                     \
  static_assert(true, "End macro call with a semicolon")

#define AssertInput(expression, message)                                            \
  if (!static_cast<bool>(expression)) {                                             \
    throw InvalidInputException(std::string("Error: Invalid input; ") + (message)); \
  }                                                                                 \
  static_assert(true, "End macro call with a semicolon")
