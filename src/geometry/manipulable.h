#ifndef GEOMETRY_MANIPULABLE_H_
#define GEOMETRY_MANIPULABLE_H_

#include <cstdint>

namespace layup {
namespace geometry {

class Point;

// Rigid planar transformations shared by everything that has a position on
// the board.
class Manipulable {
 public:
  virtual ~Manipulable() = default;

  // Mirror in the y-axis (x = 0).
  virtual void MirrorY() = 0;

  // Mirror in the x-axis (y = 0).
  virtual void MirrorX() = 0;

  virtual void Translate(const Point &offset) = 0;

  // Rotate anti-clockwise about the origin.
  virtual void Rotate(double theta_radians) = 0;
};

}  // namespace geometry
}  // namespace layup

#endif  // GEOMETRY_MANIPULABLE_H_
