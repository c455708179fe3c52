#include "geoshard/shard.hpp"
#include "geoshard/error.hpp"

#include <cmath>

namespace geoshard {

bool operator==(const Shard& a, const Shard& b) {
    return a.name == b.name && a.storage_level == b.storage_level && a.start == b.start &&
           a.end == b.end && a.cell_count == b.cell_count && a.load == b.load;
}

std::string shard_name(size_t index) {
    return "geoshard_user_index_" + std::to_string(index);
}

double standard_deviation(const std::vector<int64_t>& loads) {
    if (loads.empty()) {
        return 0.0;
    }

    const double n = static_cast<double>(loads.size());
    double sum = 0.0;
    for (int64_t load : loads) {
        sum += static_cast<double>(load);
    }
    const double mean = sum / n;

    double variance = 0.0;
    for (int64_t load : loads) {
        const double delta = static_cast<double>(load) - mean;
        variance += delta * delta;
    }
    variance /= n;

    return std::sqrt(variance);
}

ShardCollection::ShardCollection(std::vector<Shard> shards) : shards_(std::move(shards)) {
    validate();
}

void ShardCollection::validate() const {
    GEOSHARD_CHECK_INVARIANT(!shards_.empty(), "Shard collection is empty");

    const int level = shards_.front().storage_level;
    for (size_t n = 0; n < shards_.size(); ++n) {
        const Shard& shard = shards_[n];
        const std::string where = "shard " + shard.name;

        if (shard.storage_level != level) {
            throw BuildInvariantError("Mixed storage levels in shard collection", where);
        }
        if (!shard.start.is_valid() || !shard.end.is_valid()) {
            throw BuildInvariantError("Shard range has an invalid cell id", where);
        }
        if (shard.start.level() != level || shard.end.level() != level) {
            throw BuildInvariantError("Shard range is not at the collection storage level", where);
        }
        if (shard.end < shard.start) {
            throw BuildInvariantError("Shard end precedes its start", where);
        }
        if (n > 0 && !(shards_[n - 1].end < shard.start)) {
            throw BuildInvariantError("Shard overlaps or is out of order with its predecessor", where);
        }
    }
}

std::vector<int64_t> ShardCollection::loads() const {
    std::vector<int64_t> result;
    result.reserve(shards_.size());
    for (const Shard& shard : shards_) {
        result.push_back(shard.load);
    }
    return result;
}

double ShardCollection::standard_deviation() const {
    return geoshard::standard_deviation(loads());
}

int64_t ShardCollection::total_load() const noexcept {
    int64_t total = 0;
    for (const Shard& shard : shards_) {
        total += shard.load;
    }
    return total;
}

size_t ShardCollection::total_cells() const noexcept {
    size_t total = 0;
    for (const Shard& shard : shards_) {
        total += shard.cell_count;
    }
    return total;
}

} // namespace geoshard
