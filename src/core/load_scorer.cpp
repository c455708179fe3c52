#include "geoshard/load_scorer.hpp"
#include "geoshard/error.hpp"
#include "geoshard/logging.hpp"

#include <string>

namespace geoshard {

CellMappingScorer::CellMappingScorer(std::shared_ptr<const SpatialIndex> index)
    : index_(std::move(index)) {
    if (!index_) {
        throw InvalidArgumentError("Scorer requires a spatial index", __func__);
    }
}

ScoredCellSet CellMappingScorer::score(ScoredCellSet cells, UserSource& users) const {
    const int level = cells.storage_level();
    size_t scored = 0;

    while (auto user = users.next()) {
        const CellId cell = index_->cell_for(user->location, level);
        if (!cells.contains(cell)) {
            throw BuildInvariantError(
                "cell for user not found in enumerated set",
                "user " + std::to_string(scored) + " at (" + std::to_string(user->location.lat_degrees) +
                    ", " + std::to_string(user->location.lng_degrees) + ") maps to " + cell.to_token() +
                    " at level " + std::to_string(level),
                "Enumerate and score with the same spatial index and storage level");
        }
        cells.add_load(cell, contribution(*user));
        ++scored;
    }

    GEOSHARD_LOG_DEBUG("Scorer '{}' mapped {} users onto {} cells", name(), scored, cells.size());
    return cells;
}

int64_t WeightedUserScorer::contribution(const UserRecord& user) const {
    if (user.weight < 0) {
        throw BuildInvariantError("negative user weight " + std::to_string(user.weight), __func__);
    }
    return user.weight;
}

std::shared_ptr<const LoadScorer> make_scorer(const std::string& name,
                                              std::shared_ptr<const SpatialIndex> index) {
    if (name == "user_count") {
        return std::make_shared<UserCountScorer>(std::move(index));
    }
    if (name == "weighted") {
        return std::make_shared<WeightedUserScorer>(std::move(index));
    }
    throw ConfigurationError("Unknown scorer '" + name + "'", __func__,
                             "Use user_count or weighted");
}

} // namespace geoshard
