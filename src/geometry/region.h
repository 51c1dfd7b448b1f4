#ifndef GEOMETRY_REGION_H_
#define GEOMETRY_REGION_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>

#include "point.h"
#include "polygon.h"
#include "rectangle.h"

namespace layup {
namespace geometry {

// How one region relates to another. The numbering follows the convention
// that the receiver is "this" and the argument is "other".
enum class IntersectionType {
  kDisjoint = 0,
  // This region is entirely inside the other.
  kContainedBy = 1,
  // The other region is entirely inside this one.
  kContains = 2,
  // The boundaries cross.
  kOverlaps = 3
};

std::ostream &operator<<(std::ostream &os, const IntersectionType &type);

// An area on the board: any number of disjoint polygons, each with any number
// of holes. This is the boolean engine used for clipping; it wraps a
// Boost.Geometry multi-polygon in double-precision database units so that the
// intermediate results of unions and buffers do not accumulate rounding.
class Region {
 public:
  typedef boost::geometry::model::d2::point_xy<double> BoostPoint;
  typedef boost::geometry::model::polygon<BoostPoint> BoostPolygon;
  typedef boost::geometry::model::multi_polygon<BoostPolygon>
      BoostMultiPolygon;

  static Region FromPolygon(const Polygon &outline,
                            const std::vector<Polygon> &holes = {});
  static Region FromRectangle(const Rectangle &rectangle);

  // The union of all the given polygons.
  static Region FromPolygons(const std::vector<Polygon> &polygons);

  Region() = default;

  bool Empty() const;

  Region Intersection(const Region &other) const;
  Region Difference(const Region &other) const;
  Region Union(const Region &other) const;

  Region ConvexHull() const;

  // Grow the region outwards by the given distance. Corners are either
  // rounded (approximated with points_per_circle segments) or mitred.
  Region Expanded(int64_t distance,
                  bool round_corners,
                  int points_per_circle = 36) const;

  // Remove vertices that deviate from the outline by less than the tolerance.
  Region Defeatured(int64_t tolerance) const;

  IntersectionType Classify(const Region &other) const;

  bool Intersects(const Region &other) const;
  bool Intersects(const Rectangle &rectangle) const;
  bool Contains(const Point &point) const;

  const Rectangle GetBoundingBox() const;

  double Area() const;

  // One region per disjoint polygon.
  std::vector<Region> Split() const;

  // The outer boundary of each disjoint polygon.
  std::vector<Polygon> Outlines() const;

  // The holes of each disjoint polygon, flattened.
  std::vector<Polygon> Holes() const;

  std::string Describe() const;

 private:
  explicit Region(const BoostMultiPolygon &polygons)
      : polygons_(polygons) {}

  static BoostPolygon::ring_type ToRing(const Polygon &polygon);
  static Polygon FromRing(const BoostPolygon::ring_type &ring);

  BoostMultiPolygon polygons_;
};

}  // namespace geometry

std::ostream &operator<<(std::ostream &os, const geometry::Region &region);

}  // namespace layup

#endif  // GEOMETRY_REGION_H_
