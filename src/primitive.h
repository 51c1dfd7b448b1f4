#ifndef PRIMITIVE_H_
#define PRIMITIVE_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "geometry/polygon.h"
#include "geometry/rectangle.h"
#include "geometry/region.h"
#include "layup.pb.h"

namespace layup {

// A polygonal piece of copper (or a void cut out of copper) on one layer,
// belonging to one net. Traces and rectangles are stored as their outline
// polygons.
class Primitive {
 public:
  Primitive()
      : id_(0),
        is_void_(false) {}

  Primitive(const std::string &layer,
            const std::string &net,
            const geometry::Polygon &outline)
      : id_(0),
        layer_(layer),
        net_(net),
        outline_(outline),
        is_void_(false) {}

  // The area covered, with voids removed.
  geometry::Region AsRegion() const {
    return geometry::Region::FromPolygon(outline_, voids_);
  }

  const geometry::Rectangle GetBoundingBox() const {
    return outline_.GetBoundingBox();
  }

  void set_id(int64_t id) { id_ = id; }
  int64_t id() const { return id_; }

  void set_layer(const std::string &layer) { layer_ = layer; }
  const std::string &layer() const { return layer_; }

  void set_net(const std::string &net) { net_ = net; }
  const std::string &net() const { return net_; }

  void set_outline(const geometry::Polygon &outline) { outline_ = outline; }
  const geometry::Polygon &outline() const { return outline_; }

  void AddVoid(const geometry::Polygon &void_outline) {
    voids_.push_back(void_outline);
  }
  void ClearVoids() { voids_.clear(); }
  const std::vector<geometry::Polygon> &voids() const { return voids_; }

  void set_is_void(bool is_void) { is_void_ = is_void; }
  bool is_void() const { return is_void_; }

  std::string Describe() const;

  ::layup::proto::Primitive ToProto() const;
  static Primitive FromProto(const ::layup::proto::Primitive &primitive_pb);

 private:
  int64_t id_;
  std::string layer_;
  std::string net_;
  geometry::Polygon outline_;
  std::vector<geometry::Polygon> voids_;

  // Void primitives are negative shapes drawn as their own object, as opposed
  // to voids owned by a polygon.
  bool is_void_;
};

std::ostream &operator<<(std::ostream &os, const Primitive &primitive);

}  // namespace layup

#endif  // PRIMITIVE_H_
