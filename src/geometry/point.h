#ifndef GEOMETRY_POINT_H_
#define GEOMETRY_POINT_H_

#include <cstdint>
#include <ostream>
#include <string>

#include "manipulable.h"
#include "layup.pb.h"

namespace layup {
namespace geometry {

// A position on the board, in integer database units (nanometres).
class Point : public Manipulable {
 public:
  static bool CompareX(const Point &lhs, const Point &rhs);
  static bool CompareY(const Point &lhs, const Point &rhs);

  Point() : x_(0), y_(0) {}
  Point(const int64_t x, const int64_t y)
      : x_(x),
        y_(y) {}

  const int64_t &x() const { return x_; }
  const int64_t &y() const { return y_; }

  void set_x(const int64_t &x) { x_ = x; }
  void set_y(const int64_t &y) { y_ = y; }

  void MirrorY() override;
  void MirrorX() override;
  void Translate(const Point &offset) override;
  void Rotate(double theta_radians) override;

  std::string Describe() const;

  ::layup::proto::Point ToProto() const;
  static Point FromProto(const ::layup::proto::Point &point_pb);

  Point &operator+=(const Point &other);
  Point &operator-=(const Point &other);

 private:
  // So that gtest prints points readably.
  friend void PrintTo(const Point &point, std::ostream *os) {
    *os << point.Describe();
  }

  int64_t x_;
  int64_t y_;
};

Point operator+(const Point &lhs, const Point &rhs);
Point operator-(const Point &lhs, const Point &rhs);
Point operator-(const Point &rhs);

bool operator<(const Point &lhs, const Point &rhs);
bool operator==(const Point &lhs, const Point &rhs);
bool operator!=(const Point &lhs, const Point &rhs);

}  // namespace geometry

std::ostream &operator<<(std::ostream &os, const geometry::Point &point);

}  // namespace layup

#endif  // GEOMETRY_POINT_H_
