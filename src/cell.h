#ifndef CELL_H_
#define CELL_H_

#include <memory>
#include <set>
#include <string>

#include "layout.h"
#include "layup.pb.h"

namespace layup {

class Cell {
 public:
  Cell() : is_black_box_(false) {}
  Cell(const std::string &name)
    : is_black_box_(false),
      name_(name) {}

  void set_name(const std::string &name) { name_ = name; }
  const std::string &name() const { return name_; }

  void set_description(const std::string &description) {
    description_ = description;
  }
  const std::string &description() const { return description_; }

  // The cells this one places instances of.
  std::set<Cell*> DirectAncestors() const;

  void SetLayout(Layout *layout) {
    layout_.reset(layout);
    layout->set_parent_cell(this);
  }
  Layout *layout() { return layout_.get(); }
  Layout *const layout() const { return layout_.get(); }

  // A black-box cell is placed by reference only; tools consuming the design
  // should not look inside it.
  void set_is_black_box(bool is_black_box) { is_black_box_ = is_black_box; }
  bool is_black_box() const { return is_black_box_; }

  // Instances name their template cells; the caller is responsible for
  // writing those too. Materials used by the stackup are included.
  ::layup::proto::Cell ToProto() const;

 private:
  bool is_black_box_;

  std::string name_;
  std::string description_;

  std::unique_ptr<Layout> layout_;
};

}  // namespace layup

#endif  // CELL_H_
