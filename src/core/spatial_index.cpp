#include "geoshard/spatial_index.hpp"
#include "geoshard/error.hpp"

#include <s2/s1angle.h>
#include <s2/s2cap.h>
#include <s2/s2latlng.h>
#include <s2/s2region_coverer.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace geoshard {

namespace {

void check_level(int level, const char* func) {
    if (level < 0 || level > kMaxLevel) {
        throw ConfigurationError("Storage level " + std::to_string(level) + " is outside [0, " +
                                 std::to_string(kMaxLevel) + "]", func);
    }
}

bool is_finite(const LatLng& coord) {
    return std::isfinite(coord.lat_degrees) && std::isfinite(coord.lng_degrees);
}

// Clamped latitude, wrapped longitude
S2LatLng normalized(const LatLng& coord) {
    return S2LatLng::FromDegrees(coord.lat_degrees, coord.lng_degrees).Normalized();
}

std::vector<CellId> wrap_cells(const std::vector<S2CellId>& cells) {
    std::vector<CellId> result;
    result.reserve(cells.size());
    for (const S2CellId& cell : cells) {
        result.emplace_back(cell);
    }
    return result;
}

} // anonymous namespace

CellId S2SpatialIndex::cell_for(const LatLng& coord, int level) const {
    check_level(level, __func__);
    if (!is_finite(coord)) {
        return CellId::none();
    }
    return CellId(S2CellId(normalized(coord)).parent(level));
}

CellId S2SpatialIndex::parent(CellId cell, int level) const {
    check_level(level, __func__);
    if (!cell.is_valid() || level > cell.level()) {
        throw InvalidArgumentError("Cannot take level " + std::to_string(level) +
                                   " parent of cell " + cell.to_token(), __func__);
    }
    return cell.parent(level);
}

std::vector<CellId> S2SpatialIndex::all_neighbors(CellId cell, int level) const {
    check_level(level, __func__);
    if (!cell.is_valid()) {
        throw InvalidArgumentError("Neighbors requested for invalid cell " + cell.to_token(), __func__);
    }
    if (level < cell.level()) {
        cell = cell.parent(level);
    }

    std::vector<S2CellId> found;
    cell.s2().AppendAllNeighbors(level, &found);

    // Cube corners only have three faces meeting, so one diagonal repeats
    std::vector<CellId> neighbors = wrap_cells(found);
    std::sort(neighbors.begin(), neighbors.end());
    neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
    return neighbors;
}

std::vector<CellId> S2SpatialIndex::covering_disc(const LatLng& center, double radius_meters,
                                                  int level) const {
    check_level(level, __func__);
    if (!is_finite(center)) {
        return {};
    }

    const S2Cap cap(normalized(center).ToPoint(), S1Angle::Radians(radius_to_angle(radius_meters)));

    // Pinning both levels makes the coverer return every intersecting cell
    // at the storage level, however many there are
    S2RegionCoverer::Options options;
    options.set_min_level(level);
    options.set_max_level(level);
    S2RegionCoverer coverer(options);

    std::vector<S2CellId> found;
    coverer.GetCovering(cap, &found);

    std::vector<CellId> covering = wrap_cells(found);
    std::sort(covering.begin(), covering.end());
    return covering;
}

bool S2SpatialIndex::range_contains(CellId start, CellId end, CellId cell) const {
    return start <= cell && cell <= end;
}

Point S2SpatialIndex::cell_center(CellId cell) {
    const S2Point center = cell.s2().ToPoint();
    return Point(center.x(), center.y(), center.z());
}

std::shared_ptr<const SpatialIndex> default_spatial_index() {
    static const std::shared_ptr<const SpatialIndex> instance = std::make_shared<S2SpatialIndex>();
    return instance;
}

double radius_to_angle(double radius_meters) noexcept {
    if (!(radius_meters > 0.0)) {
        return 0.0;
    }
    return std::min(kPi, radius_meters / kEarthRadiusMeters);
}

} // namespace geoshard
