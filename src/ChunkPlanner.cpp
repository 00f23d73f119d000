#include "ChunkPlanner.hpp"
#include "ChunkerErrors.hpp"
#include "DelimiterScan.hpp"
#include <algorithm>

ChunkRequest ChunkRequest::byCount(size_t count, std::optional<char> delimiter) {
    ChunkRequest request;
    request.mode = Mode::Count;
    request.count = count;
    request.delimiter = delimiter;
    return request;
}

ChunkRequest ChunkRequest::bySize(size_t targetSize, std::optional<char> delimiter) {
    ChunkRequest request;
    request.mode = Mode::Size;
    request.targetSize = targetSize;
    request.delimiter = delimiter;
    return request;
}

size_t naive_boundary(size_t file_length, size_t count, size_t i) {
    // file_length * i / count without forming the full product:
    // q * i + r * i / count, where r < count keeps r * i small.
    const size_t q = file_length / count;
    const size_t r = file_length % count;
    const unsigned __int128 rest = static_cast<unsigned __int128>(r) * i * 2 + count;
    return q * i + static_cast<size_t>(rest / (static_cast<unsigned __int128>(count) * 2));
}

namespace {

// Turns naive boundaries (one per internal split) into the final ranges.
std::vector<ByteRange> adjust_and_emit(const char* data, size_t file_length, const std::vector<size_t>& naive, std::optional<char> delimiter) {
    std::vector<ByteRange> ranges;
    ranges.reserve(naive.size() + 1);

    size_t previous = 0;
    for (size_t split : naive) {
        size_t boundary = std::max(split, previous);
        if (delimiter) {
            next_record_boundary(data, file_length, boundary, *delimiter, boundary);
        }
        ranges.push_back(ByteRange{previous, boundary - previous});
        previous = boundary;
    }
    ranges.push_back(ByteRange{previous, file_length - previous});
    return ranges;
}

} // namespace

std::vector<ByteRange> plan_chunks(const char* data, size_t file_length, size_t count, std::optional<char> delimiter) {
    if (count == 0) {
        throw InvalidRequest("chunk count must be at least 1");
    }
    count = std::min(count, std::max<size_t>(file_length, 1));

    std::vector<size_t> naive;
    naive.reserve(count - 1);
    for (size_t i = 1; i < count; ++i) {
        naive.push_back(naive_boundary(file_length, count, i));
    }
    return adjust_and_emit(data, file_length, naive, delimiter);
}

std::vector<ByteRange> plan_chunks_by_size(const char* data, size_t file_length, size_t target_size, std::optional<char> delimiter) {
    if (target_size == 0) {
        throw InvalidRequest("target chunk size must be at least 1");
    }
    size_t count = file_length / target_size + (file_length % target_size != 0 ? 1 : 0);
    count = std::max<size_t>(count, 1);

    std::vector<size_t> naive;
    naive.reserve(count - 1);
    for (size_t i = 1; i < count; ++i) {
        naive.push_back(i * target_size);
    }
    return adjust_and_emit(data, file_length, naive, delimiter);
}

std::vector<ByteRange> plan_chunks(const char* data, size_t file_length, const ChunkRequest& request) {
    if (request.mode == ChunkRequest::Mode::Size) {
        return plan_chunks_by_size(data, file_length, request.targetSize, request.delimiter);
    }
    return plan_chunks(data, file_length, request.count, request.delimiter);
}

bool is_valid_partition(const std::vector<ByteRange>& ranges, size_t file_length) {
    if (ranges.empty()) return false;
    size_t expected = 0;
    for (const auto& range : ranges) {
        if (range.offset != expected) return false;
        if (range.size > file_length - range.offset) return false;
        expected = range.end();
    }
    return expected == file_length;
}
