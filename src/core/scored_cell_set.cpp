#include "geoshard/scored_cell_set.hpp"
#include "geoshard/error.hpp"

namespace geoshard {

bool ScoredCellSet::insert(CellId cell, int64_t load) {
    return cells_.emplace(cell, load).second;
}

void ScoredCellSet::add_load(CellId cell, int64_t amount) {
    auto it = cells_.find(cell);
    if (it == cells_.end()) {
        throw BuildInvariantError("cell for user not found in enumerated set: " + cell.to_token(),
                                  __func__,
                                  "Check that users are scored at the same storage level the cells were enumerated at");
    }
    it->second += amount;
}

void ScoredCellSet::set_load(CellId cell, int64_t load) {
    auto it = cells_.find(cell);
    if (it == cells_.end()) {
        throw BuildInvariantError("cell not found in enumerated set: " + cell.to_token(), __func__);
    }
    it->second = load;
}

int64_t ScoredCellSet::load(CellId cell) const {
    auto it = cells_.find(cell);
    return it == cells_.end() ? 0 : it->second;
}

int64_t ScoredCellSet::total_load() const noexcept {
    int64_t total = 0;
    for (const auto& [cell, load] : cells_) {
        total += load;
    }
    return total;
}

} // namespace geoshard
