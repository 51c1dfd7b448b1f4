#ifndef PADSTACK_INSTANCE_H_
#define PADSTACK_INSTANCE_H_

#include <cstdint>
#include <ostream>
#include <string>

#include "geometry/point.h"
#include "geometry/rectangle.h"
#include "layup.pb.h"

namespace layup {

// A placed via or component pin. The pad is modelled as a rectangle of the
// given size centred on the position.
class PadstackInstance {
 public:
  PadstackInstance()
      : id_(0),
        rotation_radians_(0.0),
        pad_width_(0),
        pad_height_(0),
        is_pin_(false) {}

  const geometry::Rectangle GetPadBox() const {
    return geometry::Rectangle::CentredAt(position_, pad_width_, pad_height_);
  }

  void set_id(int64_t id) { id_ = id; }
  int64_t id() const { return id_; }

  void set_name(const std::string &name) { name_ = name; }
  const std::string &name() const { return name_; }

  void set_net(const std::string &net) { net_ = net; }
  const std::string &net() const { return net_; }

  void set_padstack_definition(const std::string &definition) {
    padstack_definition_ = definition;
  }
  const std::string &padstack_definition() const {
    return padstack_definition_;
  }

  void set_position(const geometry::Point &position) { position_ = position; }
  const geometry::Point &position() const { return position_; }

  void set_rotation_radians(double rotation) { rotation_radians_ = rotation; }
  double rotation_radians() const { return rotation_radians_; }

  // The upper- and lower-most layers the padstack spans.
  void set_start_layer(const std::string &layer) { start_layer_ = layer; }
  const std::string &start_layer() const { return start_layer_; }
  void set_stop_layer(const std::string &layer) { stop_layer_ = layer; }
  const std::string &stop_layer() const { return stop_layer_; }

  void set_pad_size(uint64_t width, uint64_t height) {
    pad_width_ = width;
    pad_height_ = height;
  }
  uint64_t pad_width() const { return pad_width_; }
  uint64_t pad_height() const { return pad_height_; }

  void set_component(const std::string &component) { component_ = component; }
  const std::string &component() const { return component_; }

  void set_is_pin(bool is_pin) { is_pin_ = is_pin; }
  bool is_pin() const { return is_pin_; }

  std::string Describe() const;

  ::layup::proto::PadstackInstance ToProto() const;
  static PadstackInstance FromProto(
      const ::layup::proto::PadstackInstance &instance_pb);

 private:
  int64_t id_;
  std::string name_;
  std::string net_;
  std::string padstack_definition_;
  geometry::Point position_;
  double rotation_radians_;

  std::string start_layer_;
  std::string stop_layer_;

  uint64_t pad_width_;
  uint64_t pad_height_;

  // Empty for free vias.
  std::string component_;
  bool is_pin_;
};

std::ostream &operator<<(std::ostream &os, const PadstackInstance &instance);

}  // namespace layup

#endif  // PADSTACK_INSTANCE_H_
