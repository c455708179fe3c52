#pragma once

#include "geoshard/scored_cell_set.hpp"
#include "geoshard/spatial_index.hpp"
#include "geoshard/user_source.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace geoshard {

/**
 * Strategy that turns a user stream into per-cell load.
 *
 * score() drains `users` exactly once and returns the cell set with loads
 * filled in. A user that maps to a cell missing from the set means the set
 * was enumerated at another level or from a different index; implementations
 * throw BuildInvariantError rather than dropping the user.
 */
class LoadScorer {
public:
    virtual ~LoadScorer() = default;

    virtual ScoredCellSet score(ScoredCellSet cells, UserSource& users) const = 0;

    virtual std::string name() const = 0;
};

/**
 * Base for scorers that add a per-user contribution to the user's own cell.
 */
class CellMappingScorer : public LoadScorer {
public:
    explicit CellMappingScorer(std::shared_ptr<const SpatialIndex> index);

    ScoredCellSet score(ScoredCellSet cells, UserSource& users) const override;

protected:
    virtual int64_t contribution(const UserRecord& user) const = 0;

private:
    std::shared_ptr<const SpatialIndex> index_;
};

// Default heuristic: one unit of load per user record
class UserCountScorer final : public CellMappingScorer {
public:
    explicit UserCountScorer(std::shared_ptr<const SpatialIndex> index = default_spatial_index())
        : CellMappingScorer(std::move(index)) {}

    std::string name() const override { return "user_count"; }

protected:
    int64_t contribution(const UserRecord&) const override { return 1; }
};

// Uses each record's weight, e.g. recent activity; negative weights are rejected
class WeightedUserScorer final : public CellMappingScorer {
public:
    explicit WeightedUserScorer(std::shared_ptr<const SpatialIndex> index = default_spatial_index())
        : CellMappingScorer(std::move(index)) {}

    std::string name() const override { return "weighted"; }

protected:
    int64_t contribution(const UserRecord& user) const override;
};

// "user_count" or "weighted"; throws ConfigurationError for anything else
std::shared_ptr<const LoadScorer> make_scorer(const std::string& name,
                                              std::shared_ptr<const SpatialIndex> index = default_spatial_index());

} // namespace geoshard
