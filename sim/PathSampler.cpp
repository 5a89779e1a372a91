#include "sim/PathSampler.hpp"

#include <algorithm>
#include <stdexcept>

double RandomParameter(const ParametricPath &path, core::Random &rng) {
  const double start = path.GetStart();
  const double finish = path.GetFinish();
  // NextFloat() may return exactly 1.0; clamp against rounding past finish.
  return std::min(finish, start + rng.NextFloat() * (finish - start));
}

PathPoint RandomPointOnPath(const ParametricPath &path, core::Random &rng) {
  return path.Evaluate(RandomParameter(path, rng));
}

std::vector<PathPoint> SamplePathUniform(const ParametricPath &path,
                                         const int count) {
  if (count < 0) {
    throw std::invalid_argument("sample count must be zero or greater");
  }
  std::vector<PathPoint> points;
  points.reserve(static_cast<size_t>(count));
  const double start = path.GetStart();
  const double span = path.GetFinish() - start;
  for (int i = 0; i < count; ++i) {
    const double t =
        (count == 1) ? start
                     : (i == count - 1 ? path.GetFinish()
                                       : start + span * i / (count - 1));
    points.push_back(path.Evaluate(t));
  }
  return points;
}
