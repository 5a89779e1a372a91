#include "sim/Path.hpp"

#include "core/Log.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>

ParametricPath::ParametricPath(std::string name, const double start,
                               const double finish, const bool closedLoop)
    : name(std::move(name)), start(start), finish(finish),
      closedLoop(closedLoop) {
  if (!std::isfinite(start) || !std::isfinite(finish) || !(start < finish)) {
    LOG_ERROR("Path '{}' has invalid domain [{}, {}]", this->name, start,
              finish);
    throw std::invalid_argument(fmt::format(
        "path domain must satisfy start < finish, got [{}, {}]", start,
        finish));
  }
}

PathPoint ParametricPath::Evaluate(double t) const {
  if (!std::isfinite(t)) {
    throw std::out_of_range(
        fmt::format("path parameter must be finite, was {}", t));
  }
  if (t < start || t > finish) {
    if (!closedLoop) {
      throw std::out_of_range(fmt::format(
          "path parameter {} outside [{}, {}] of '{}'", t, start, finish,
          name));
    }
    const double length = finish - start;
    t = start + (t - start) - std::floor((t - start) / length) * length;
  }
  return PathPoint{XFunc(t), YFunc(t)};
}

std::string ParametricPath::ToString() const {
  return fmt::format("{}{{start: {}, finish: {}, closedLoop: {}}}", name,
                     start, finish, closedLoop);
}
