#pragma once

#include "geoshard/types.hpp"

#include <s2/s2cell_id.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace geoshard {

static_assert(kMaxLevel == S2CellId::kMaxLevel, "geoshard levels follow S2 levels");

/**
 * Hierarchical cell identifier, a value wrapper around S2CellId.
 *
 * Ordering by the raw id walks each cube face along its Hilbert curve, so
 * consecutive ids are spatially close and a parent's id lies between the ids
 * of its first and last descendants.
 */
class CellId {
public:
    static constexpr int kNumFaces = S2CellId::kNumFaces;

    CellId() noexcept : cell_(S2CellId::None()) {}
    explicit CellId(uint64_t id) noexcept : cell_(id) {}
    explicit CellId(S2CellId cell) noexcept : cell_(cell) {}

    static CellId none() noexcept { return CellId(); }

    // Face cell (level 0)
    static CellId from_face(int face) noexcept { return CellId(S2CellId::FromFace(face)); }

    // Invalid for empty, malformed or over-long tokens
    static CellId from_token(const std::string& token) { return CellId(S2CellId::FromToken(token)); }

    uint64_t id() const noexcept { return cell_.id(); }
    const S2CellId& s2() const noexcept { return cell_; }

    bool is_valid() const noexcept { return cell_.is_valid(); }
    int face() const noexcept { return cell_.face(); }
    int level() const noexcept { return is_valid() ? cell_.level() : -1; }
    bool is_leaf() const noexcept { return cell_.is_leaf(); }

    uint64_t lsb() const noexcept { return cell_.lsb(); }
    static uint64_t lsb_for_level(int level) noexcept { return S2CellId::lsb_for_level(level); }

    CellId parent(int level) const noexcept { return CellId(cell_.parent(level)); }
    CellId child_begin(int level) const noexcept { return CellId(cell_.child_begin(level)); }

    CellId range_min() const noexcept { return CellId(cell_.range_min()); }
    CellId range_max() const noexcept { return CellId(cell_.range_max()); }
    bool contains(CellId other) const noexcept { return cell_.contains(other.cell_); }

    std::string to_token() const { return cell_.ToToken(); }

    // "face/child positions", e.g. "3/012"
    std::string to_string() const { return cell_.ToString(); }

    friend bool operator==(CellId a, CellId b) noexcept { return a.cell_ == b.cell_; }
    friend bool operator!=(CellId a, CellId b) noexcept { return a.cell_ != b.cell_; }
    friend bool operator<(CellId a, CellId b) noexcept { return a.cell_ < b.cell_; }
    friend bool operator>(CellId a, CellId b) noexcept { return a.cell_ > b.cell_; }
    friend bool operator<=(CellId a, CellId b) noexcept { return a.cell_ <= b.cell_; }
    friend bool operator>=(CellId a, CellId b) noexcept { return a.cell_ >= b.cell_; }

private:
    S2CellId cell_;
};

inline std::ostream& operator<<(std::ostream& os, CellId cell) {
    return os << cell.to_string();
}

} // namespace geoshard

