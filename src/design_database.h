#ifndef DESIGN_DATABASE_H_
#define DESIGN_DATABASE_H_

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "cell.h"
#include "physical_properties_database.h"
#include "layup.pb.h"

namespace layup {

// Owns the cells of a design and the material library their layouts refer to.
// Cells must not outlive the database.
class DesignDatabase {
 public:
  DesignDatabase() {}

  // Creates an empty cell with an empty layout. Returns nullptr if the name is
  // taken.
  Cell *AddCell(const std::string &name);

  // Takes ownership of the cell. Returns false (and does not take ownership)
  // if a cell of the same name exists.
  bool ConsumeCell(Cell *cell);

  // Destroys the named cell. Returns false if there is no such cell. Nothing
  // may still refer to it.
  bool DeleteCell(const std::string &name);

  Cell *FindCellOrDie(const std::string &name) const;
  Cell *FindCell(const std::string &name) const;

  // A deep copy of the source's layout under a new name. Instances in the copy
  // still refer to the same template cells.
  absl::StatusOr<Cell*> CloneCell(const Cell &source,
                                  const std::string &new_name);

  // `base` if no cell has that name, otherwise `base_1`, `base_2`, ...
  std::string UniqueCellName(const std::string &base) const;

  const std::map<std::string, std::unique_ptr<Cell>> &cells() const {
    return cells_;
  }

  PhysicalPropertiesDatabase &physical_db() { return physical_db_; }
  const PhysicalPropertiesDatabase &physical_db() const { return physical_db_; }

  // Writes the cell and every cell it places, dependencies first. Paths ending
  // in ".txt" or ".pbtxt" get text format, anything else binary.
  absl::Status WriteCell(const std::string &top_name,
                         const std::string &path) const;
  absl::Status WriteCell(const Cell &top, const std::string &path) const;

  ::layup::proto::Design ToDesign(const Cell &top) const;

  // Loads every cell in the file and returns the top cell. Cells whose names
  // are already taken are renamed. Materials in the file's stackups overwrite
  // those of the same name in the library.
  absl::StatusOr<Cell*> ReadCell(const std::string &path);
  absl::StatusOr<Cell*> LoadDesign(const ::layup::proto::Design &design_pb);

  std::string Describe() const;

 private:
  // Post-order walk of the instance hierarchy below top, top last.
  static std::vector<const Cell*> DependenciesFirst(const Cell &top);

  static bool IsTextFormatPath(const std::string &path);

  absl::StatusOr<std::unique_ptr<Cell>> LoadCell(
      const ::layup::proto::Cell &cell_pb,
      const std::map<std::string, Cell*> &loaded);

  PhysicalPropertiesDatabase physical_db_;

  std::map<std::string, std::unique_ptr<Cell>> cells_;
};

std::ostream &operator<<(std::ostream &os, const DesignDatabase &design_db);

}  // namespace layup

#endif  // DESIGN_DATABASE_H_
