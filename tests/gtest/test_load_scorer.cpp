// =============================================================================
// Load Scorer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geoshard/cell_enumerator.hpp"
#include "geoshard/error.hpp"
#include "geoshard/load_scorer.hpp"
#include <memory>

using namespace geoshard;

class LoadScorerTest : public ::testing::Test {
protected:
    static constexpr int kLevel = 6;

    void SetUp() override {
        cells_ = std::make_unique<ScoredCellSet>(CellEnumerator().enumerate(kLevel));
    }

    ScoredCellSet fresh() const { return *cells_; }

    S2SpatialIndex index;
    std::unique_ptr<ScoredCellSet> cells_;
};

TEST_F(LoadScorerTest, CountsUsersPerCell) {
    const LatLng nyc(40.7128, -74.0060);
    const LatLng tokyo(35.6762, 139.6503);
    VectorUserSource users({UserRecord(nyc), UserRecord(nyc), UserRecord(tokyo, 50)});

    ScoredCellSet scored = UserCountScorer().score(fresh(), users);

    EXPECT_EQ(scored.size(), cells_->size());
    EXPECT_EQ(scored.load(index.cell_for(nyc, kLevel)), 2);
    EXPECT_EQ(scored.load(index.cell_for(tokyo, kLevel)), 1);
    EXPECT_EQ(scored.total_load(), 3);
}

TEST_F(LoadScorerTest, EmptyStreamLeavesZeroLoads) {
    VectorUserSource users;
    ScoredCellSet scored = UserCountScorer().score(fresh(), users);
    EXPECT_EQ(scored.total_load(), 0);
    EXPECT_EQ(scored.size(), cells_->size());
}

TEST_F(LoadScorerTest, WeightedUsesRecordWeight) {
    const LatLng paris(48.8566, 2.3522);
    VectorUserSource users({UserRecord(paris, 4), UserRecord(paris, 6), UserRecord(paris, 0)});

    ScoredCellSet scored = WeightedUserScorer().score(fresh(), users);
    EXPECT_EQ(scored.load(index.cell_for(paris, kLevel)), 10);
    EXPECT_EQ(scored.total_load(), 10);
}

TEST_F(LoadScorerTest, WeightedRejectsNegativeWeight) {
    VectorUserSource users({UserRecord(LatLng(0, 0), -1)});
    EXPECT_THROW(WeightedUserScorer().score(fresh(), users), BuildInvariantError);
}

TEST_F(LoadScorerTest, UserOutsideEnumeratedSet) {
    // Only one cell enumerated; a user elsewhere has nowhere to go
    ScoredCellSet partial(kLevel);
    partial.insert(index.cell_for(LatLng(0, 0), kLevel));
    VectorUserSource users({UserRecord(LatLng(-45, 170))});

    try {
        UserCountScorer().score(std::move(partial), users);
        FAIL() << "expected BuildInvariantError";
    } catch (const BuildInvariantError& e) {
        EXPECT_EQ(e.code(), ErrorCode::BUILD_INVARIANT);
        EXPECT_EQ(e.message(), "cell for user not found in enumerated set");
    }
}

TEST_F(LoadScorerTest, ScorerFactory) {
    EXPECT_EQ(make_scorer("user_count")->name(), "user_count");
    EXPECT_EQ(make_scorer("weighted")->name(), "weighted");
    EXPECT_THROW(make_scorer("popularity"), ConfigurationError);
}

TEST_F(LoadScorerTest, CustomScorerPlugsIn) {
    // Any LoadScorer works; this one gives each cell a flat load
    class FlatScorer : public LoadScorer {
    public:
        ScoredCellSet score(ScoredCellSet cells, UserSource&) const override {
            for (const auto& entry : cells.cells()) cells.set_load(entry.first, 3);
            return cells;
        }
        std::string name() const override { return "flat"; }
    };

    VectorUserSource users;
    ScoredCellSet scored = FlatScorer().score(fresh(), users);
    EXPECT_EQ(scored.total_load(), static_cast<int64_t>(3 * cells_->size()));
}

TEST_F(LoadScorerTest, ScoredCellSetRejectsUnknownCells) {
    ScoredCellSet set(kLevel);
    CellId cell = index.cell_for(LatLng(1, 1), kLevel);
    EXPECT_TRUE(set.insert(cell));
    EXPECT_FALSE(set.insert(cell));
    set.add_load(cell, 5);
    EXPECT_EQ(set.load(cell), 5);
    EXPECT_THROW(set.add_load(index.cell_for(LatLng(-1, -1), kLevel), 1), BuildInvariantError);
    EXPECT_THROW(set.set_load(CellId::from_face(0), 1), BuildInvariantError);
}
