#pragma once

#include "geoshard/config.hpp"
#include "geoshard/load_scorer.hpp"
#include "geoshard/shard.hpp"
#include "geoshard/spatial_index.hpp"
#include "geoshard/user_source.hpp"

#include <memory>

namespace geoshard {

/**
 * One-shot build pipeline: enumerate cells, score them from a user stream,
 * then partition into shards.
 *
 * Building is expensive (the whole sphere is enumerated at storage_level),
 * so it only happens when build() is called. The result is all or nothing:
 * any failure surfaces as an exception and no partial collection is
 * returned.
 *
 * Usage:
 *   GeoshardBuilder builder(BuildConfig{8, 40, 100});
 *   ShardCollection shards = builder.build(users);
 *   ShardSearcher searcher(std::move(shards));
 */
class GeoshardBuilder {
public:
    // Scorer chosen by config.scorer
    explicit GeoshardBuilder(BuildConfig config,
                             std::shared_ptr<const SpatialIndex> index = default_spatial_index());

    // Caller-supplied scoring heuristic; config.scorer is ignored
    GeoshardBuilder(BuildConfig config, std::shared_ptr<const LoadScorer> scorer,
                    std::shared_ptr<const SpatialIndex> index = default_spatial_index());

    const BuildConfig& config() const noexcept { return config_; }
    const LoadScorer& scorer() const noexcept { return *scorer_; }

    ShardCollection build(UserSource& users) const;

private:
    BuildConfig config_;
    std::shared_ptr<const SpatialIndex> index_;
    std::shared_ptr<const LoadScorer> scorer_;
};

} // namespace geoshard
