#pragma once

#include "geoshard/types.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geoshard {

// One record to be distributed across shards
struct UserRecord {
    LatLng location;
    int64_t weight = 1;

    UserRecord() = default;
    UserRecord(const LatLng& loc, int64_t w = 1) : location(loc), weight(w) {}
};

/**
 * Pull-based stream of user records.
 * A scorer drains the source exactly once; sources need not be rewindable.
 */
class UserSource {
public:
    virtual ~UserSource() = default;

    // Next record, or std::nullopt once the source is exhausted
    virtual std::optional<UserRecord> next() = 0;
};

class VectorUserSource final : public UserSource {
public:
    VectorUserSource() = default;
    explicit VectorUserSource(std::vector<UserRecord> users) : users_(std::move(users)) {}

    std::optional<UserRecord> next() override;

private:
    std::vector<UserRecord> users_;
    size_t position_ = 0;
};

/**
 * Reads "lat,lng[,weight]" lines.
 * Blank lines, lines starting with '#' and "lat,lng" header lines are
 * skipped. Malformed lines throw IOError
 * naming the line number.
 */
class CsvUserSource final : public UserSource {
public:
    explicit CsvUserSource(std::istream& input);
    explicit CsvUserSource(const std::string& path);

    std::optional<UserRecord> next() override;

    size_t line_number() const noexcept { return line_number_; }

private:
    std::unique_ptr<std::ifstream> owned_;
    std::istream* input_;
    size_t line_number_ = 0;
};

} // namespace geoshard
