#pragma once

#include "geoshard/shard.hpp"
#include "geoshard/spatial_index.hpp"
#include "geoshard/user_source.hpp"

#include <memory>
#include <vector>

namespace geoshard {

/**
 * Read-only lookups against a built shard collection.
 *
 * The collection is held through shared_ptr<const>, so copies of a searcher
 * share it and any number of threads may query concurrently without
 * locking. Every lookup returns a shard: coordinates are normalised by the
 * index, and a cell outside every range (or no cell at all, for non-finite
 * input) resolves to the last shard.
 */
class ShardSearcher {
public:
    explicit ShardSearcher(std::shared_ptr<const ShardCollection> shards,
                           std::shared_ptr<const SpatialIndex> index = default_spatial_index());

    explicit ShardSearcher(ShardCollection shards,
                           std::shared_ptr<const SpatialIndex> index = default_spatial_index());

    int storage_level() const noexcept { return storage_level_; }
    const ShardCollection& shards() const noexcept { return *shards_; }
    std::shared_ptr<const ShardCollection> shared_shards() const noexcept { return shards_; }

    CellId cell_for_location(const LatLng& location) const;

    const Shard& shard_for_location(const LatLng& location) const;
    const Shard& shard_for_user(const UserRecord& user) const;

    // Finer cells resolve through their parent, coarser ones through their
    // first descendant at the storage level
    const Shard& shard_for_cell(CellId cell) const;

    std::vector<CellId> cells_in_radius(const LatLng& location, double radius_meters) const;

    // Shards touching the disc, without duplicates, in collection order. A
    // center with no cell resolves to the last shard.
    std::vector<const Shard*> shards_in_radius(const LatLng& location, double radius_meters) const;

private:
    size_t index_of(CellId cell) const;

    std::shared_ptr<const ShardCollection> shards_;
    std::shared_ptr<const SpatialIndex> index_;
    int storage_level_;
};

} // namespace geoshard
