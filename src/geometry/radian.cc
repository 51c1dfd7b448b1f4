#include "radian.h"

#include <limits>
#include <cmath>

namespace layup {
namespace geometry {

const double Radian::kPi = std::acos(-1);

bool Radian::IsEffectivelyZero(double radians) {
  return std::abs(radians) < std::numeric_limits<double>::epsilon();
}

double Radian::RadiansToDegrees(double radians) {
  return radians / kPi * 180.0;
}

double Radian::DegreesToRadians(double degrees) {
  return degrees / 180.0 * kPi;
}

double Radian::Normalise(double radians) {
  double wrapped = std::fmod(radians, 2 * kPi);
  if (wrapped < 0) {
    wrapped += 2 * kPi;
  }
  return wrapped;
}

}  // namespace geometry
}  // namespace layup
