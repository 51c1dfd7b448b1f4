#include "region.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <boost/geometry.hpp>
#include <boost/geometry/algorithms/buffer.hpp>
#include <boost/geometry/strategies/buffer.hpp>

namespace layup {
namespace geometry {

namespace bg = boost::geometry;

namespace {

// Areas below this fraction of the smaller operand are treated as numerical
// noise from the boolean engine.
constexpr double kRelativeAreaTolerance = 1e-9;

bool EffectivelyEqual(double lhs, double rhs, double scale) {
  return std::abs(lhs - rhs) <= kRelativeAreaTolerance * std::max(scale, 1.0);
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const IntersectionType &type) {
  switch (type) {
    case IntersectionType::kDisjoint:
      os << "disjoint";
      break;
    case IntersectionType::kContainedBy:
      os << "contained-by";
      break;
    case IntersectionType::kContains:
      os << "contains";
      break;
    case IntersectionType::kOverlaps:
      os << "overlaps";
      break;
  }
  return os;
}

Region::BoostPolygon::ring_type Region::ToRing(const Polygon &polygon) {
  BoostPolygon::ring_type ring;
  for (const Point &vertex : polygon.vertices()) {
    bg::append(ring, BoostPoint(vertex.x(), vertex.y()));
  }
  if (!polygon.vertices().empty()) {
    const Point &first = polygon.vertices().front();
    bg::append(ring, BoostPoint(first.x(), first.y()));
  }
  return ring;
}

Polygon Region::FromRing(const BoostPolygon::ring_type &ring) {
  Polygon polygon;
  // Rings are closed, so the last point repeats the first.
  for (size_t i = 0; i + 1 < ring.size(); ++i) {
    polygon.AddVertex(Point(std::llround(bg::get<0>(ring[i])),
                            std::llround(bg::get<1>(ring[i]))));
  }
  return polygon;
}

Region Region::FromPolygon(const Polygon &outline,
                           const std::vector<Polygon> &holes) {
  if (outline.Empty()) {
    return Region();
  }
  BoostPolygon polygon;
  polygon.outer() = ToRing(outline);
  for (const Polygon &hole : holes) {
    if (hole.Empty())
      continue;
    polygon.inners().push_back(ToRing(hole));
  }
  bg::correct(polygon);

  BoostMultiPolygon polygons;
  polygons.push_back(polygon);
  return Region(polygons);
}

Region Region::FromRectangle(const Rectangle &rectangle) {
  return FromPolygon(Polygon::FromRectangle(rectangle));
}

Region Region::FromPolygons(const std::vector<Polygon> &polygons) {
  Region united;
  for (const Polygon &polygon : polygons) {
    united = united.Union(FromPolygon(polygon));
  }
  return united;
}

bool Region::Empty() const {
  return polygons_.empty() || bg::area(polygons_) <= 0.0;
}

Region Region::Intersection(const Region &other) const {
  BoostMultiPolygon result;
  bg::intersection(polygons_, other.polygons_, result);
  return Region(result);
}

Region Region::Difference(const Region &other) const {
  BoostMultiPolygon result;
  bg::difference(polygons_, other.polygons_, result);
  return Region(result);
}

Region Region::Union(const Region &other) const {
  if (polygons_.empty())
    return other;
  if (other.polygons_.empty())
    return *this;
  BoostMultiPolygon result;
  bg::union_(polygons_, other.polygons_, result);
  return Region(result);
}

Region Region::ConvexHull() const {
  if (polygons_.empty())
    return Region();
  BoostPolygon hull;
  bg::convex_hull(polygons_, hull);
  bg::correct(hull);
  BoostMultiPolygon result;
  result.push_back(hull);
  return Region(result);
}

Region Region::Expanded(int64_t distance,
                        bool round_corners,
                        int points_per_circle) const {
  if (distance == 0 || polygons_.empty())
    return *this;

  bg::strategy::buffer::distance_symmetric<double> distance_strategy(
      static_cast<double>(distance));
  bg::strategy::buffer::side_straight side_strategy;
  bg::strategy::buffer::end_flat end_strategy;
  bg::strategy::buffer::point_circle point_strategy(points_per_circle);

  BoostMultiPolygon result;
  if (round_corners) {
    bg::strategy::buffer::join_round join_strategy(points_per_circle);
    bg::buffer(polygons_, result, distance_strategy, side_strategy,
               join_strategy, end_strategy, point_strategy);
  } else {
    bg::strategy::buffer::join_miter join_strategy;
    bg::buffer(polygons_, result, distance_strategy, side_strategy,
               join_strategy, end_strategy, point_strategy);
  }
  return Region(result);
}

Region Region::Defeatured(int64_t tolerance) const {
  if (tolerance <= 0)
    return *this;
  BoostMultiPolygon result;
  bg::simplify(polygons_, result, static_cast<double>(tolerance));
  bg::correct(result);
  return Region(result);
}

IntersectionType Region::Classify(const Region &other) const {
  if (Empty() || other.Empty() || !bg::intersects(polygons_, other.polygons_))
    return IntersectionType::kDisjoint;

  double this_area = Area();
  double other_area = other.Area();
  double common_area = Intersection(other).Area();
  double scale = std::min(this_area, other_area);

  // Touching along an edge or at a vertex shares no area.
  if (EffectivelyEqual(common_area, 0.0, scale))
    return IntersectionType::kDisjoint;
  if (EffectivelyEqual(common_area, other_area, scale))
    return IntersectionType::kContains;
  if (EffectivelyEqual(common_area, this_area, scale))
    return IntersectionType::kContainedBy;
  return IntersectionType::kOverlaps;
}

bool Region::Intersects(const Region &other) const {
  return Classify(other) != IntersectionType::kDisjoint;
}

bool Region::Intersects(const Rectangle &rectangle) const {
  // Degenerate rectangles (a zero-sized pad, say) are tested as points.
  if (rectangle.Width() == 0 || rectangle.Height() == 0) {
    return Contains(rectangle.centre());
  }
  bg::model::box<BoostPoint> box(
      BoostPoint(rectangle.lower_left().x(), rectangle.lower_left().y()),
      BoostPoint(rectangle.upper_right().x(), rectangle.upper_right().y()));
  return bg::intersects(polygons_, box);
}

bool Region::Contains(const Point &point) const {
  return bg::covered_by(BoostPoint(point.x(), point.y()), polygons_);
}

const Rectangle Region::GetBoundingBox() const {
  if (polygons_.empty())
    return Rectangle(Point(0, 0), Point(0, 0));
  bg::model::box<BoostPoint> box;
  bg::envelope(polygons_, box);
  return Rectangle(
      Point(std::llround(bg::get<bg::min_corner, 0>(box)),
            std::llround(bg::get<bg::min_corner, 1>(box))),
      Point(std::llround(bg::get<bg::max_corner, 0>(box)),
            std::llround(bg::get<bg::max_corner, 1>(box))));
}

double Region::Area() const {
  if (polygons_.empty())
    return 0.0;
  return bg::area(polygons_);
}

std::vector<Region> Region::Split() const {
  std::vector<Region> pieces;
  for (const BoostPolygon &polygon : polygons_) {
    BoostMultiPolygon piece;
    piece.push_back(polygon);
    pieces.push_back(Region(piece));
  }
  return pieces;
}

std::vector<Polygon> Region::Outlines() const {
  std::vector<Polygon> outlines;
  for (const BoostPolygon &polygon : polygons_) {
    outlines.push_back(FromRing(polygon.outer()));
  }
  return outlines;
}

std::vector<Polygon> Region::Holes() const {
  std::vector<Polygon> holes;
  for (const BoostPolygon &polygon : polygons_) {
    for (const auto &inner : polygon.inners()) {
      holes.push_back(FromRing(inner));
    }
  }
  return holes;
}

std::string Region::Describe() const {
  std::stringstream ss;
  ss << bg::wkt(polygons_);
  return ss.str();
}

}  // namespace geometry

std::ostream &operator<<(std::ostream &os, const geometry::Region &region) {
  os << region.Describe();
  return os;
}

}  // namespace layup
