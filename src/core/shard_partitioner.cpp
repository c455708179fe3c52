#include "geoshard/shard_partitioner.hpp"
#include "geoshard/error.hpp"
#include "geoshard/logging.hpp"

#include <chrono>
#include <limits>
#include <string>

namespace geoshard {

namespace {

Shard open_shard(size_t index, int level, CellId first) {
    Shard shard;
    shard.name = shard_name(index);
    shard.storage_level = level;
    shard.start = first;
    shard.end = first;
    return shard;
}

bool admissible(const std::vector<Shard>& shards, int min_shard_count, int max_shard_count) {
    return shards.size() >= static_cast<size_t>(min_shard_count) &&
           shards.size() <= static_cast<size_t>(max_shard_count);
}

} // anonymous namespace

ShardPartitioner::CapacityRange ShardPartitioner::capacity_range(int64_t total_load, int min_shard_count,
                                                                 int max_shard_count) {
    return {total_load / max_shard_count, total_load / min_shard_count};
}

std::vector<int64_t> ShardPartitioner::loads_of(const std::vector<Shard>& shards) {
    std::vector<int64_t> loads;
    loads.reserve(shards.size());
    for (const Shard& shard : shards) {
        loads.push_back(shard.load);
    }
    return loads;
}

std::vector<Shard> ShardPartitioner::partition_at_capacity(const ScoredCellSet& cells, int64_t capacity) {
    GEOSHARD_CHECK_INVARIANT(!cells.empty(), "Cannot partition an empty cell set");

    const int level = cells.storage_level();
    std::vector<Shard> shards;
    Shard current = open_shard(0, level, cells.begin()->first);

    for (const auto& [cell, load] : cells) {
        if (current.cell_count > 0 && current.load + load >= capacity) {
            shards.push_back(std::move(current));
            current = open_shard(shards.size(), level, cell);
        }
        current.end = cell;
        current.cell_count += 1;
        current.load += load;
    }
    shards.push_back(std::move(current));

    return shards;
}

std::vector<Shard> ShardPartitioner::partition_even(const ScoredCellSet& cells, size_t shard_count) {
    GEOSHARD_CHECK_INVARIANT(!cells.empty(), "Cannot partition an empty cell set");
    GEOSHARD_CHECK_CONFIG(shard_count > 0 && shard_count <= cells.size(),
                          "Cannot split " + std::to_string(cells.size()) + " cells into " +
                              std::to_string(shard_count) + " shards");

    const int level = cells.storage_level();
    const size_t total = cells.size();
    std::vector<Shard> shards;
    shards.reserve(shard_count);

    auto it = cells.begin();
    for (size_t n = 0; n < shard_count; ++n) {
        const size_t first = n * total / shard_count;
        const size_t last = (n + 1) * total / shard_count;

        Shard shard = open_shard(n, level, it->first);
        for (size_t k = first; k < last; ++k, ++it) {
            shard.end = it->first;
            shard.cell_count += 1;
            shard.load += it->second;
        }
        shards.push_back(std::move(shard));
    }

    return shards;
}

ShardCollection ShardPartitioner::partition(const ScoredCellSet& cells, int min_shard_count,
                                            int max_shard_count) const {
    GEOSHARD_CHECK_CONFIG(min_shard_count > 0 && max_shard_count > 0,
                          "Shard count bounds must be positive (min=" + std::to_string(min_shard_count) +
                              ", max=" + std::to_string(max_shard_count) + ")");
    GEOSHARD_CHECK_CONFIG(min_shard_count <= max_shard_count,
                          "min_shard_count " + std::to_string(min_shard_count) + " exceeds max_shard_count " +
                              std::to_string(max_shard_count));
    GEOSHARD_CHECK_INVARIANT(!cells.empty(), "Cannot partition an empty cell set");
    GEOSHARD_CHECK_CONFIG(cells.size() >= static_cast<size_t>(min_shard_count),
                          "Only " + std::to_string(cells.size()) + " cells available for at least " +
                              std::to_string(min_shard_count) + " shards; raise the storage level");

    auto start_time = std::chrono::steady_clock::now();

    const int64_t total_load = cells.total_load();
    const CapacityRange range = capacity_range(total_load, min_shard_count, max_shard_count);

    std::vector<Shard> best;
    double best_deviation = std::numeric_limits<double>::max();
    int64_t best_capacity = -1;
    size_t rejected = 0;

    for (int64_t capacity = range.min_capacity; capacity <= range.max_capacity; ++capacity) {
        std::vector<Shard> candidate = partition_at_capacity(cells, capacity);
        if (!admissible(candidate, min_shard_count, max_shard_count)) {
            ++rejected;
            continue;
        }

        const double deviation = standard_deviation(loads_of(candidate));
        if (best.empty() || deviation < best_deviation) {
            best_deviation = deviation;
            best_capacity = capacity;
            best = std::move(candidate);
        }
    }

    if (best.empty()) {
        GEOSHARD_LOG_WARN("No capacity in [{}, {}] gives {}..{} shards; splitting by cell count",
                          range.min_capacity, range.max_capacity, min_shard_count, max_shard_count);

        for (int count = min_shard_count; count <= max_shard_count; ++count) {
            if (static_cast<size_t>(count) > cells.size()) {
                break;
            }
            std::vector<Shard> candidate = partition_even(cells, static_cast<size_t>(count));
            const double deviation = standard_deviation(loads_of(candidate));
            if (best.empty() || deviation < best_deviation) {
                best_deviation = deviation;
                best = std::move(candidate);
            }
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (best_capacity >= 0) {
        GEOSHARD_LOG_INFO("Partitioned {} cells (load {}) into {} shards at capacity {}, stddev {:.4f} "
                          "({} candidates rejected, {} ms)",
                          cells.size(), total_load, best.size(), best_capacity, best_deviation, rejected,
                          elapsed.count());
    } else {
        GEOSHARD_LOG_INFO("Partitioned {} cells (load {}) into {} even shards, stddev {:.4f} ({} ms)",
                          cells.size(), total_load, best.size(), best_deviation, elapsed.count());
    }

    return ShardCollection(std::move(best));
}

} // namespace geoshard
