#pragma once

#include "geoshard/scored_cell_set.hpp"
#include "geoshard/shard.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace geoshard {

/**
 * Splits an ordered, scored cell set into contiguous shards.
 *
 * Every integer capacity between total_load / max_shard_count and
 * total_load / min_shard_count is tried with a greedy linear scan; the
 * partition with the lowest population standard deviation of shard loads
 * wins, first candidate on ties. Partitions whose shard count falls outside
 * [min_shard_count, max_shard_count] are never chosen. When no capacity
 * yields an admissible count (e.g. all loads zero) the cells are instead
 * split into N runs of near-equal cell count for each admissible N.
 *
 * Cost is O(capacity range * cell count); keep the bounds modest.
 */
class ShardPartitioner {
public:
    ShardCollection partition(const ScoredCellSet& cells, int min_shard_count, int max_shard_count) const;

    /**
     * Greedy scan at a fixed capacity. A shard is closed before a cell whose
     * load would bring it to `capacity` or beyond, so only a shard made of a
     * single heavy cell reaches the capacity. The trailing shard is always
     * emitted.
     */
    static std::vector<Shard> partition_at_capacity(const ScoredCellSet& cells, int64_t capacity);

    // `shard_count` contiguous runs whose cell counts differ by at most one
    static std::vector<Shard> partition_even(const ScoredCellSet& cells, size_t shard_count);

    struct CapacityRange {
        int64_t min_capacity;
        int64_t max_capacity;
    };

    static CapacityRange capacity_range(int64_t total_load, int min_shard_count, int max_shard_count);

    static std::vector<int64_t> loads_of(const std::vector<Shard>& shards);
};

} // namespace geoshard
