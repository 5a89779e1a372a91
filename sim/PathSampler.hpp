#pragma once

#include <vector>

#include "core/Random.hpp"
#include "sim/Path.hpp"

// Helpers for randomized initial conditions along a path. Each random helper
// consumes exactly one draw from `rng`.

// start + NextFloat() * (finish - start), always within the path domain.
double RandomParameter(const ParametricPath &path, core::Random &rng);

PathPoint RandomPointOnPath(const ParametricPath &path, core::Random &rng);

// `count` points at evenly spaced parameters from start to finish inclusive.
// A single point lands on the start. Throws std::invalid_argument if
// count < 0.
std::vector<PathPoint> SamplePathUniform(const ParametricPath &path,
                                         int count);
