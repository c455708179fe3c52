#include "geoshard/shard_io.hpp"
#include "geoshard/error.hpp"
#include "geoshard/logging.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <sstream>
#include <vector>

namespace geoshard {

namespace pt = boost::property_tree;

namespace {

pt::ptree to_tree(const Shard& shard) {
    pt::ptree node;
    node.put("name", shard.name);
    node.put("storage_level", shard.storage_level);
    node.put("start", shard.start.to_token());
    node.put("end", shard.end.to_token());
    node.put("cell_count", shard.cell_count);
    node.put("load", shard.load);
    return node;
}

CellId parse_token(const std::string& token, const std::string& where) {
    const CellId cell = CellId::from_token(token);
    if (!cell.is_valid()) {
        throw IOError("Invalid cell token '" + token + "'", where);
    }
    return cell;
}

Shard from_tree(const pt::ptree& node, size_t index) {
    const std::string where = "shards[" + std::to_string(index) + "]";
    try {
        Shard shard;
        shard.name = node.get<std::string>("name");
        shard.storage_level = node.get<int>("storage_level");
        shard.start = parse_token(node.get<std::string>("start"), where);
        shard.end = parse_token(node.get<std::string>("end"), where);
        shard.cell_count = node.get<size_t>("cell_count");
        shard.load = node.get<int64_t>("load");
        return shard;
    } catch (const pt::ptree_error& e) {
        throw IOError("Malformed shard record", where + ": " + e.what());
    }
}

} // anonymous namespace

void write_shards(std::ostream& out, const ShardCollection& shards, bool pretty) {
    pt::ptree records;
    for (const Shard& shard : shards) {
        records.push_back(std::make_pair("", to_tree(shard)));
    }

    pt::ptree root;
    root.put("storage_level", shards.storage_level());
    root.add_child("shards", records);

    try {
        pt::write_json(out, root, pretty);
    } catch (const pt::json_parser_error& e) {
        throw IOError("Failed to write shard collection", e.what());
    }
    if (!out) {
        GEOSHARD_THROW_IO("Output stream failed while writing shards");
    }
}

ShardCollection read_shards(std::istream& in) {
    pt::ptree root;
    try {
        pt::read_json(in, root);
    } catch (const pt::json_parser_error& e) {
        throw IOError("Shard document is not valid JSON", e.what());
    }

    const auto level = root.get_optional<int>("storage_level");
    if (!level) {
        GEOSHARD_THROW_IO("Shard document has no integer 'storage_level'");
    }

    const auto records = root.get_child_optional("shards");
    if (!records) {
        GEOSHARD_THROW_IO("Shard document has no 'shards' array");
    }

    std::vector<Shard> shards;
    size_t index = 0;
    for (const auto& entry : *records) {
        shards.push_back(from_tree(entry.second, index++));
    }

    try {
        ShardCollection collection(std::move(shards));
        if (collection.storage_level() != *level) {
            throw IOError("Shard document storage_level " + std::to_string(*level) +
                              " does not match its shards' level " + std::to_string(collection.storage_level()),
                          __func__);
        }
        return collection;
    } catch (const BuildInvariantError& e) {
        throw IOError("Shard document violates collection invariants", e.message() + " (" + e.context() + ")");
    }
}

void save_shards(const std::string& path, const ShardCollection& shards) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw IOError("Cannot open shards file for writing: " + path, __func__);
    }
    write_shards(out, shards);
    GEOSHARD_LOG_INFO("Wrote {} shards to {}", shards.size(), path);
}

ShardCollection load_shards(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw IOError("Cannot open shards file: " + path, __func__);
    }
    ShardCollection shards = read_shards(in);
    GEOSHARD_LOG_DEBUG("Loaded {} shards from {}", shards.size(), path);
    return shards;
}

std::string shards_to_json(const ShardCollection& shards, bool pretty) {
    std::ostringstream out;
    write_shards(out, shards, pretty);
    return out.str();
}

ShardCollection shards_from_json(const std::string& json) {
    std::istringstream in(json);
    return read_shards(in);
}

} // namespace geoshard
