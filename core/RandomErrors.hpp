#pragma once

#include <stdexcept>
#include <string>

namespace core {

// A seed passed to SetSeed (or produced internally) is negative, not below
// the modulus, not an integer, or not finite.
class InvalidSeedError : public std::invalid_argument {
public:
  explicit InvalidSeedError(const std::string &what)
      : std::invalid_argument(what) {}
};

// A caller-supplied bound is out of range, e.g. NextRange(0).
class InvalidRangeError : public std::invalid_argument {
public:
  explicit InvalidRangeError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Generator parameters would push an intermediate value past 2^53, where
// doubles stop representing every integer exactly. A configuration defect.
class NumericOverflowError : public std::logic_error {
public:
  explicit NumericOverflowError(const std::string &what)
      : std::logic_error(what) {}
};

} // namespace core
