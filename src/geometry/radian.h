#ifndef GEOMETRY_RADIAN_H_
#define GEOMETRY_RADIAN_H_

namespace layup {
namespace geometry {

class Radian {
 public:
  static const double kPi;
  static bool IsEffectivelyZero(double radians);
  static double RadiansToDegrees(double radians);
  static double DegreesToRadians(double degrees);

  // Wrap the given angle into [0, 2*pi).
  static double Normalise(double radians);
};

}  // namespace geometry
}  // namespace layup

#endif  // GEOMETRY_RADIAN_H_
