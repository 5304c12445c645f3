#pragma once

/**
 * @file AlterGenerator.hpp
 * @brief Ordered ALTER TABLE statements turning one TableDesign into another.
 *
 * Statement order:
 * 1. table rename (later statements use the new name)
 * 2. dropped columns
 * 3. added columns
 * 4. per-column property changes, in the modified column order
 * 5. dropped, then added foreign keys
 * 6. dropped, then added non-primary indexes
 *
 * Columns, foreign keys and indexes are matched by name. A named foreign key
 * or index whose definition changed is dropped and added again. Foreign keys
 * without a name are matched by their definition.
 */

#include "TableDesign.hpp"
#include <string>
#include <vector>

namespace schemaforge {

class AlterGenerator {
public:
    // Uses modified.dialect; identical designs give an empty list
    static std::vector<std::string> generateAlterTable(const TableDesign& original,
                                                       const TableDesign& modified);
};

}  // namespace schemaforge
