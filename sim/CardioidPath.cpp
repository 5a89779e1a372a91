#include "sim/CardioidPath.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>

CardioidPath::CardioidPath(const double radius, const double start,
                           const double finish, const bool closedLoop,
                           std::string name)
    : ParametricPath(std::move(name), start, finish, closedLoop),
      radius(radius) {
  if (!std::isfinite(radius)) {
    throw std::invalid_argument("cardioid radius must be finite");
  }
}

double CardioidPath::XFunc(const double t) const {
  const double c = std::cos(t);
  return radius * std::sin(t) * (1.0 + c);
}

double CardioidPath::YFunc(const double t) const {
  const double c = std::cos(t);
  return -radius * c * (1.0 + c);
}

std::string CardioidPath::ToString() const {
  std::string base = ParametricPath::ToString();
  base.pop_back(); // drop the closing brace
  return base + fmt::format(", radius: {}}}", radius);
}
