#pragma once

#include "geoshard/scored_cell_set.hpp"
#include "geoshard/spatial_index.hpp"

#include <memory>

namespace geoshard {

/**
 * Discovers every cell at a storage level by flood-filling the spatial
 * index's neighbour graph from the cell containing (0, 0).
 *
 * The traversal keeps its frontier on the heap, so graphs with millions of
 * cells cost memory rather than call stack.
 */
class CellEnumerator {
public:
    explicit CellEnumerator(std::shared_ptr<const SpatialIndex> index = default_spatial_index());

    // All reachable cells with zero load. Throws ConfigurationError for a
    // level outside [0, 30] and BuildInvariantError if nothing is reachable.
    ScoredCellSet enumerate(int storage_level) const;

    // Number of cells a complete enumeration yields at `level`
    static size_t expected_cell_count(int level) noexcept;

private:
    std::shared_ptr<const SpatialIndex> index_;
};

} // namespace geoshard
