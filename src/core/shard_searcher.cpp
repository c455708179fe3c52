#include "geoshard/shard_searcher.hpp"
#include "geoshard/error.hpp"

#include <algorithm>

namespace geoshard {

ShardSearcher::ShardSearcher(std::shared_ptr<const ShardCollection> shards,
                             std::shared_ptr<const SpatialIndex> index)
    : shards_(std::move(shards)), index_(std::move(index)), storage_level_(0) {
    GEOSHARD_CHECK_INVARIANT(shards_ && shards_->size() > 0, "Searcher needs a non-empty shard collection");
    if (!index_) {
        throw InvalidArgumentError("Searcher requires a spatial index", __func__);
    }
    storage_level_ = shards_->storage_level();
}

ShardSearcher::ShardSearcher(ShardCollection shards, std::shared_ptr<const SpatialIndex> index)
    : ShardSearcher(std::make_shared<ShardCollection>(std::move(shards)), std::move(index)) {}

CellId ShardSearcher::cell_for_location(const LatLng& location) const {
    return index_->cell_for(location, storage_level_);
}

const Shard& ShardSearcher::shard_for_location(const LatLng& location) const {
    return shard_for_cell(cell_for_location(location));
}

const Shard& ShardSearcher::shard_for_user(const UserRecord& user) const {
    return shard_for_location(user.location);
}

const Shard& ShardSearcher::shard_for_cell(CellId cell) const {
    return (*shards_)[index_of(cell)];
}

size_t ShardSearcher::index_of(CellId cell) const {
    const size_t fallback = shards_->size() - 1;
    if (!cell.is_valid()) {
        return fallback;
    }

    if (cell.level() > storage_level_) {
        cell = cell.parent(storage_level_);
    } else if (cell.level() < storage_level_) {
        cell = cell.child_begin(storage_level_);
    }

    // Last shard whose start is <= cell, then confirm the range reaches it
    const auto& shards = shards_->shards();
    auto it = std::upper_bound(shards.begin(), shards.end(), cell,
                               [](CellId value, const Shard& shard) { return value < shard.start; });
    if (it == shards.begin()) {
        return fallback;
    }
    --it;
    if (!index_->range_contains(it->start, it->end, cell)) {
        return fallback;
    }
    return static_cast<size_t>(it - shards.begin());
}

std::vector<CellId> ShardSearcher::cells_in_radius(const LatLng& location, double radius_meters) const {
    return index_->covering_disc(location, radius_meters, storage_level_);
}

std::vector<const Shard*> ShardSearcher::shards_in_radius(const LatLng& location, double radius_meters) const {
    std::vector<size_t> matched;
    for (CellId cell : cells_in_radius(location, radius_meters)) {
        matched.push_back(index_of(cell));
    }
    if (matched.empty()) {
        matched.push_back(index_of(CellId::none()));
    }
    std::sort(matched.begin(), matched.end());
    matched.erase(std::unique(matched.begin(), matched.end()), matched.end());

    std::vector<const Shard*> result;
    result.reserve(matched.size());
    for (size_t index : matched) {
        result.push_back(&(*shards_)[index]);
    }
    return result;
}

} // namespace geoshard
