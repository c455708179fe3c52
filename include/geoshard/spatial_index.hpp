#pragma once

#include "geoshard/cell_id.hpp"
#include "geoshard/types.hpp"

#include <memory>
#include <vector>

namespace geoshard {

/**
 * Geometry collaborator consumed by the enumerator, scorers and searcher.
 *
 * Implementations map coordinates to cells at a requested level and answer
 * adjacency and coverage questions. Cell ids must be totally ordered such
 * that consecutive ids are spatially close; the partitioner relies on that
 * to turn a linear scan into contiguous shards.
 */
class SpatialIndex {
public:
    virtual ~SpatialIndex() = default;

    // Cell at `level` holding the coordinate, or CellId::none() when it is not finite
    virtual CellId cell_for(const LatLng& coord, int level) const = 0;

    virtual CellId parent(CellId cell, int level) const = 0;

    // Every cell at `level` sharing an edge or vertex with `cell`
    virtual std::vector<CellId> all_neighbors(CellId cell, int level) const = 0;

    // Cells at `level` that together cover a disc of radius_meters around
    // center, sorted by id; empty when the center is not finite
    virtual std::vector<CellId> covering_disc(const LatLng& center, double radius_meters,
                                              int level) const = 0;

    // Whether cell lies in the inclusive id range [start, end]
    virtual bool range_contains(CellId start, CellId end, CellId cell) const = 0;
};

/**
 * SpatialIndex backed by s2geometry cells.
 *
 * Coordinates are normalised before lookup: latitude is clamped to
 * [-90, 90] and longitude wrapped into [-180, 180]. Non-finite coordinates
 * map to CellId::none(). Stateless; a single instance may be shared freely
 * between threads.
 */
class S2SpatialIndex final : public SpatialIndex {
public:
    CellId cell_for(const LatLng& coord, int level) const override;
    CellId parent(CellId cell, int level) const override;
    std::vector<CellId> all_neighbors(CellId cell, int level) const override;
    std::vector<CellId> covering_disc(const LatLng& center, double radius_meters,
                                      int level) const override;
    bool range_contains(CellId start, CellId end, CellId cell) const override;

    static Point cell_center(CellId cell);
};

// Shared instance used when callers do not supply their own index
std::shared_ptr<const SpatialIndex> default_spatial_index();

// Radius on the Earth's surface converted to a central angle in radians
double radius_to_angle(double radius_meters) noexcept;

} // namespace geoshard
