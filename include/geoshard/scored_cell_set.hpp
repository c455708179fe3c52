#pragma once

#include "geoshard/cell_id.hpp"

#include <cstddef>
#include <cstdint>
#include <map>

namespace geoshard {

/**
 * Ordered CellId -> load map covering the sphere at one storage level.
 *
 * Produced by CellEnumerator with every load at zero, filled in by a
 * LoadScorer and then read by the partitioner. Iteration is always in
 * ascending CellId order regardless of the order cells were inserted.
 */
class ScoredCellSet {
public:
    using Map = std::map<CellId, int64_t>;
    using const_iterator = Map::const_iterator;

    explicit ScoredCellSet(int storage_level) : storage_level_(storage_level) {}

    int storage_level() const noexcept { return storage_level_; }

    // Returns false when the cell was already present
    bool insert(CellId cell, int64_t load = 0);

    bool contains(CellId cell) const { return cells_.count(cell) != 0; }

    // Adds `amount` to an existing cell; throws BuildInvariantError for unknown cells
    void add_load(CellId cell, int64_t amount);

    // Overwrites the load of an existing cell; throws BuildInvariantError for unknown cells
    void set_load(CellId cell, int64_t load);

    int64_t load(CellId cell) const;

    int64_t total_load() const noexcept;

    size_t size() const noexcept { return cells_.size(); }
    bool empty() const noexcept { return cells_.empty(); }

    const Map& cells() const noexcept { return cells_; }
    const_iterator begin() const noexcept { return cells_.begin(); }
    const_iterator end() const noexcept { return cells_.end(); }

private:
    int storage_level_;
    Map cells_;
};

} // namespace geoshard
