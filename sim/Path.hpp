#pragma once

#include <string>

// A point on a path in simulation coordinates.
struct PathPoint {
  double x = 0.0;
  double y = 0.0;
};

// A curve given by closed-form functions x(t), y(t) over [start, finish].
// Shape parameters are fixed at construction, so Evaluate() is a pure
// function and a path can be shared freely.
class ParametricPath {
public:
  virtual ~ParametricPath() = default;

  // For a closed loop, `t` outside [start, finish] wraps around the loop.
  // For an open path it throws std::out_of_range.
  PathPoint Evaluate(double t) const;

  double GetStart() const { return start; }
  double GetFinish() const { return finish; }
  bool IsClosedLoop() const { return closedLoop; }
  const std::string &GetName() const { return name; }

  virtual std::string ToString() const;

protected:
  // Throws std::invalid_argument unless start < finish, both finite.
  ParametricPath(std::string name, double start, double finish,
                 bool closedLoop);

  virtual double XFunc(double t) const = 0;
  virtual double YFunc(double t) const = 0;

private:
  std::string name;
  double start;
  double finish;
  bool closedLoop;
};
