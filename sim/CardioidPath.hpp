#pragma once

#include "core/Config.hpp"
#include "sim/Path.hpp"

// Heart shaped curve with its cusp at the origin.
//
//   x = a sin t (1 + cos t)
//   y = -a cos t (1 + cos t)
//
// By default the curve is open and its end points sit on the cusp, where the
// derivative is discontinuous.
class CardioidPath final : public ParametricPath {
public:
  explicit CardioidPath(double radius = cfg::kDefaultCardioidRadius,
                        double start = -cfg::kPi, double finish = cfg::kPi,
                        bool closedLoop = false,
                        std::string name = "Cardioid");

  double GetRadius() const { return radius; }

  std::string ToString() const override;

protected:
  double XFunc(double t) const override;
  double YFunc(double t) const override;

private:
  double radius;
};
