#include "geoshard/builder.hpp"
#include "geoshard/cell_enumerator.hpp"
#include "geoshard/error.hpp"
#include "geoshard/logging.hpp"
#include "geoshard/shard_partitioner.hpp"

#include <chrono>
#include <string>

namespace geoshard {

GeoshardBuilder::GeoshardBuilder(BuildConfig config, std::shared_ptr<const SpatialIndex> index)
    : config_(std::move(config)), index_(std::move(index)) {
    config_.validate();
    if (!index_) {
        throw InvalidArgumentError("Builder requires a spatial index", __func__);
    }
    scorer_ = make_scorer(config_.scorer, index_);
}

GeoshardBuilder::GeoshardBuilder(BuildConfig config, std::shared_ptr<const LoadScorer> scorer,
                                 std::shared_ptr<const SpatialIndex> index)
    : config_(std::move(config)), index_(std::move(index)), scorer_(std::move(scorer)) {
    if (!scorer_) {
        throw InvalidArgumentError("Builder requires a scorer", __func__);
    }
    if (!index_) {
        throw InvalidArgumentError("Builder requires a spatial index", __func__);
    }
    config_.scorer = scorer_->name();
    config_.validate();
}

ShardCollection GeoshardBuilder::build(UserSource& users) const {
    using clock = std::chrono::steady_clock;
    auto ms_since = [](clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start).count();
    };

    GEOSHARD_LOG_INFO("Building shards: level {}, {}..{} shards, scorer '{}'", config_.storage_level,
                      config_.min_shard_count, config_.max_shard_count, scorer_->name());

    auto stage = clock::now();
    ScoredCellSet cells = CellEnumerator(index_).enumerate(config_.storage_level);
    GEOSHARD_LOG_INFO("Enumerated {} cells ({} ms)", cells.size(), ms_since(stage));

    stage = clock::now();
    cells = scorer_->score(std::move(cells), users);
    GEOSHARD_LOG_INFO("Scored cells, total load {} ({} ms)", cells.total_load(), ms_since(stage));

    ShardCollection shards =
        ShardPartitioner().partition(cells, config_.min_shard_count, config_.max_shard_count);

    GEOSHARD_CHECK_INVARIANT(shards.total_cells() == cells.size(),
                             "Shards cover " + std::to_string(shards.total_cells()) + " of " +
                                 std::to_string(cells.size()) + " cells");
    return shards;
}

} // namespace geoshard
