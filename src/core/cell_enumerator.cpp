#include "geoshard/cell_enumerator.hpp"
#include "geoshard/error.hpp"
#include "geoshard/logging.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace geoshard {

CellEnumerator::CellEnumerator(std::shared_ptr<const SpatialIndex> index)
    : index_(std::move(index)) {
    if (!index_) {
        throw InvalidArgumentError("CellEnumerator requires a spatial index", __func__);
    }
}

ScoredCellSet CellEnumerator::enumerate(int storage_level) const {
    GEOSHARD_CHECK_CONFIG(storage_level >= 0 && storage_level <= kMaxLevel,
                          "Storage level " + std::to_string(storage_level) + " is outside [0, 30]");

    auto start_time = std::chrono::steady_clock::now();

    const CellId seed = index_->cell_for(LatLng(0.0, 0.0), storage_level);
    GEOSHARD_CHECK_INVARIANT(seed.is_valid(),
                             "Seed cell for (0, 0) at level " + std::to_string(storage_level) + " is invalid");

    // The ordered map doubles as the visited set
    ScoredCellSet cells(storage_level);
    std::vector<CellId> worklist{seed};

    while (!worklist.empty()) {
        const CellId cell = worklist.back();
        worklist.pop_back();
        if (!cells.insert(cell)) {
            continue;
        }
        for (CellId neighbor : index_->all_neighbors(cell, storage_level)) {
            if (!cells.contains(neighbor)) {
                worklist.push_back(neighbor);
            }
        }
    }

    GEOSHARD_CHECK_INVARIANT(!cells.empty(),
                             "No cells discovered at level " + std::to_string(storage_level));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    GEOSHARD_LOG_DEBUG("Enumerated {} cells at level {} in {} ms", cells.size(), storage_level,
                       elapsed.count());
    return cells;
}

size_t CellEnumerator::expected_cell_count(int level) noexcept {
    if (level < 0 || level > kMaxLevel) {
        return 0;
    }
    return size_t{6} << (2 * level);
}

} // namespace geoshard
