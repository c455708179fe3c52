#pragma once

#include "geoshard/shard.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace geoshard {

/**
 * JSON exchange format for shard collections:
 *
 *   {
 *     "storage_level": "8",
 *     "shards": [
 *       { "name": "geoshard_user_index_0", "storage_level": "8",
 *         "start": "0000c", "end": "0fff4", "cell_count": "2048", "load": "51" },
 *       ...
 *     ]
 *   }
 *
 * start/end are cell tokens. Scalars are written as JSON strings; numeric
 * values are read back from either strings or JSON numbers. Reading
 * revalidates the collection, so a document that loads always yields a
 * usable searcher. Failures throw IOError.
 */
void write_shards(std::ostream& out, const ShardCollection& shards, bool pretty = true);
ShardCollection read_shards(std::istream& in);

void save_shards(const std::string& path, const ShardCollection& shards);
ShardCollection load_shards(const std::string& path);

std::string shards_to_json(const ShardCollection& shards, bool pretty = true);
ShardCollection shards_from_json(const std::string& json);

} // namespace geoshard
