#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "ChunkPlanner.hpp"

// Parses { "count": N | "targetSize": N, "delimiter": "\n" | 10 }.
// Throws InvalidRequest naming the offending field.
ChunkRequest chunk_request_from_json(const Json::Value& config);
// Reads and parses a JSON file holding a request object.
ChunkRequest load_chunk_request(const std::string& path);
Json::Value chunk_request_to_json(const ChunkRequest& request);

// { "fileSize": N, "delimiter": "\n" | null, "ranges": [{ "offset", "size" }, ...] }
Json::Value chunk_plan_to_json(const std::vector<ByteRange>& ranges, size_t file_size, std::optional<char> delimiter);
// Reads "ranges" back and checks it partitions [0, file_size). Throws InvalidRequest.
std::vector<ByteRange> chunk_plan_from_json(const Json::Value& plan, size_t file_size);
