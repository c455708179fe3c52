#pragma once

#include "geoshard/cell_id.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace geoshard {

/**
 * Contiguous run of cells, by CellId order, owned by one logical partition.
 * [start, end] is inclusive and both ends are cells at storage_level.
 */
struct Shard {
    std::string name;
    int storage_level = 0;
    CellId start;
    CellId end;
    size_t cell_count = 0;
    int64_t load = 0;

    bool contains(CellId cell) const noexcept { return start <= cell && cell <= end; }
};

bool operator==(const Shard& a, const Shard& b);
inline bool operator!=(const Shard& a, const Shard& b) { return !(a == b); }

// "geoshard_user_index_<index>"
std::string shard_name(size_t index);

// Population standard deviation: sqrt(mean((x - mean)^2)); 0 for empty input
double standard_deviation(const std::vector<int64_t>& loads);

/**
 * Immutable, start-ordered list of shards whose ranges partition the cell
 * space of one storage level.
 */
class ShardCollection {
public:
    // Throws BuildInvariantError if the shards are empty, unordered or overlapping
    explicit ShardCollection(std::vector<Shard> shards);

    const std::vector<Shard>& shards() const noexcept { return shards_; }
    size_t size() const noexcept { return shards_.size(); }
    const Shard& operator[](size_t index) const { return shards_[index]; }
    const Shard& front() const { return shards_.front(); }
    const Shard& back() const { return shards_.back(); }

    std::vector<Shard>::const_iterator begin() const noexcept { return shards_.begin(); }
    std::vector<Shard>::const_iterator end() const noexcept { return shards_.end(); }

    int storage_level() const noexcept { return shards_.front().storage_level; }

    std::vector<int64_t> loads() const;
    double standard_deviation() const;
    int64_t total_load() const noexcept;
    size_t total_cells() const noexcept;

    friend bool operator==(const ShardCollection& a, const ShardCollection& b) {
        return a.shards_ == b.shards_;
    }
    friend bool operator!=(const ShardCollection& a, const ShardCollection& b) { return !(a == b); }

private:
    void validate() const;

    std::vector<Shard> shards_;
};

} // namespace geoshard
