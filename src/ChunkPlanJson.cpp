#include "ChunkPlanJson.hpp"
#include "ChunkerErrors.hpp"
#include <fstream>

namespace {

size_t positive_field(const Json::Value& config, const char* name) {
    const Json::Value& field = config[name];
    if (!field.isUInt64() || field.asUInt64() == 0) {
        throw InvalidRequest(std::string("'") + name + "' must be a positive integer");
    }
    return static_cast<size_t>(field.asUInt64());
}

std::optional<char> delimiter_field(const Json::Value& config) {
    if (!config.isMember("delimiter") || config["delimiter"].isNull()) {
        return std::nullopt;
    }
    const Json::Value& field = config["delimiter"];
    if (field.isString()) {
        std::string text = field.asString();
        if (text.size() != 1) {
            throw InvalidRequest("'delimiter' must be a single byte");
        }
        return text[0];
    }
    if (field.isUInt() && field.asUInt() <= 255) {
        return static_cast<char>(static_cast<unsigned char>(field.asUInt()));
    }
    throw InvalidRequest("'delimiter' must be a one-byte string or a byte value 0-255");
}

Json::Value delimiter_value(std::optional<char> delimiter) {
    if (!delimiter) return Json::Value(Json::nullValue);
    return Json::Value(std::string(1, *delimiter));
}

} // namespace

ChunkRequest chunk_request_from_json(const Json::Value& config) {
    if (!config.isObject()) {
        throw InvalidRequest("chunk request must be a JSON object");
    }
    bool hasCount = config.isMember("count");
    bool hasSize = config.isMember("targetSize");
    if (hasCount == hasSize) {
        throw InvalidRequest("exactly one of 'count' and 'targetSize' is required");
    }
    std::optional<char> delimiter = delimiter_field(config);
    if (hasCount) {
        return ChunkRequest::byCount(positive_field(config, "count"), delimiter);
    }
    return ChunkRequest::bySize(positive_field(config, "targetSize"), delimiter);
}

ChunkRequest load_chunk_request(const std::string& path) {
    std::ifstream configFile(path);
    if (!configFile) {
        throw InvalidRequest("cannot read " + path);
    }
    Json::Value config;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &config, &errs)) {
        throw InvalidRequest("malformed JSON in " + path + ": " + errs);
    }
    return chunk_request_from_json(config);
}

Json::Value chunk_request_to_json(const ChunkRequest& request) {
    Json::Value config(Json::objectValue);
    if (request.mode == ChunkRequest::Mode::Size) {
        config["targetSize"] = (Json::UInt64)request.targetSize;
    } else {
        config["count"] = (Json::UInt64)request.count;
    }
    if (request.delimiter) {
        config["delimiter"] = delimiter_value(request.delimiter);
    }
    return config;
}

Json::Value chunk_plan_to_json(const std::vector<ByteRange>& ranges, size_t file_size, std::optional<char> delimiter) {
    Json::Value plan;
    plan["fileSize"] = (Json::UInt64)file_size;
    plan["delimiter"] = delimiter_value(delimiter);
    plan["ranges"] = Json::Value(Json::arrayValue);
    for (const auto& range : ranges) {
        Json::Value r;
        r["offset"] = (Json::UInt64)range.offset;
        r["size"] = (Json::UInt64)range.size;
        plan["ranges"].append(r);
    }
    return plan;
}

std::vector<ByteRange> chunk_plan_from_json(const Json::Value& plan, size_t file_size) {
    if (!plan.isObject() || !plan["ranges"].isArray()) {
        throw InvalidRequest("'ranges' must be an array");
    }
    if (plan.isMember("fileSize") && (!plan["fileSize"].isUInt64() || plan["fileSize"].asUInt64() != file_size)) {
        throw InvalidRequest("plan does not match a file of " + std::to_string(file_size) + " bytes");
    }
    std::vector<ByteRange> ranges;
    ranges.reserve(plan["ranges"].size());
    for (const auto& r : plan["ranges"]) {
        if (!r.isObject() || !r["offset"].isUInt64() || !r["size"].isUInt64()) {
            throw InvalidRequest("each range needs non-negative integer 'offset' and 'size'");
        }
        ranges.push_back(ByteRange{static_cast<size_t>(r["offset"].asUInt64()), static_cast<size_t>(r["size"].asUInt64())});
    }
    if (!is_valid_partition(ranges, file_size)) {
        throw InvalidRequest("ranges do not partition the file contiguously");
    }
    return ranges;
}
