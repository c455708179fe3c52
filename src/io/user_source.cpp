#include "geoshard/user_source.hpp"
#include "geoshard/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace geoshard {

namespace {

std::string trim(const std::string& s) {
    auto first = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

bool parse_double(const std::string& text, double* out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    *out = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

bool parse_int64(const std::string& text, int64_t* out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    *out = std::strtoll(text.c_str(), &end, 10);
    return end == text.c_str() + text.size();
}

} // anonymous namespace

std::optional<UserRecord> VectorUserSource::next() {
    if (position_ >= users_.size()) {
        return std::nullopt;
    }
    return users_[position_++];
}

CsvUserSource::CsvUserSource(std::istream& input) : input_(&input) {}

CsvUserSource::CsvUserSource(const std::string& path)
    : owned_(std::make_unique<std::ifstream>(path)), input_(owned_.get()) {
    if (!owned_->is_open()) {
        throw IOError("Cannot open users file: " + path, __func__, "Check the io.users setting");
    }
}

std::optional<UserRecord> CsvUserSource::next() {
    std::string line;
    while (std::getline(*input_, line)) {
        ++line_number_;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ',')) {
            fields.push_back(trim(field));
        }

        if (!fields.empty() && fields[0] == "lat") {
            continue;
        }

        const std::string where = "line " + std::to_string(line_number_);
        if (fields.size() < 2 || fields.size() > 3) {
            throw IOError("Expected lat,lng[,weight] but found " + std::to_string(fields.size()) + " fields",
                          where);
        }

        UserRecord record;
        if (!parse_double(fields[0], &record.location.lat_degrees) ||
            !parse_double(fields[1], &record.location.lng_degrees)) {
            throw IOError("Malformed coordinate '" + line + "'", where);
        }
        if (!record.location.is_valid()) {
            throw IOError("Coordinate out of range '" + line + "'", where);
        }
        if (fields.size() == 3 && !parse_int64(fields[2], &record.weight)) {
            throw IOError("Malformed weight '" + fields[2] + "'", where);
        }
        return record;
    }

    if (input_->bad()) {
        throw IOError("Read error while loading users", "line " + std::to_string(line_number_));
    }
    return std::nullopt;
}

} // namespace geoshard
