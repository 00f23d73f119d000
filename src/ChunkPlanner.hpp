#pragma once
#include <cstddef>
#include <optional>
#include <vector>

// Half-open byte range [offset, offset + size).
struct ByteRange {
    size_t offset = 0;
    size_t size = 0;

    size_t end() const { return offset + size; }
    bool operator==(const ByteRange& other) const { return offset == other.offset && size == other.size; }
    bool operator!=(const ByteRange& other) const { return !(*this == other); }
};

// What to split a file into: either a number of chunks or a target chunk size,
// plus an optional delimiter that every internal boundary must follow.
struct ChunkRequest {
    enum class Mode { Count, Size };

    Mode mode = Mode::Count;
    size_t count = 1;
    size_t targetSize = 0;
    std::optional<char> delimiter;

    static ChunkRequest byCount(size_t count, std::optional<char> delimiter = std::nullopt);
    static ChunkRequest bySize(size_t targetSize, std::optional<char> delimiter = std::nullopt);
};

// Splits [0, file_length) into 'count' contiguous ranges of roughly equal width.
//
// Boundaries start at round(file_length * i / count). With a delimiter, each
// boundary moves forward to just past the next delimiter byte, scanning from
// the previous adjusted boundary if that is further along. A boundary that
// finds no delimiter lands on file_length, and the chunks after it are empty.
//
// 'count' is capped to max(file_length, 1); an empty file yields one empty range.
// Throws InvalidRequest if count is zero.
std::vector<ByteRange> plan_chunks(const char* data, size_t file_length, size_t count, std::optional<char> delimiter);

// Same as plan_chunks, but with naive boundaries every 'target_size' bytes.
// Throws InvalidRequest if target_size is zero.
std::vector<ByteRange> plan_chunks_by_size(const char* data, size_t file_length, size_t target_size, std::optional<char> delimiter);

std::vector<ByteRange> plan_chunks(const char* data, size_t file_length, const ChunkRequest& request);

// The equal-width split point i of 'count', rounded half up. Exposed for tests.
size_t naive_boundary(size_t file_length, size_t count, size_t i);

// True if 'ranges' is non-empty, starts at 0, ends at file_length and has no gaps or overlaps.
bool is_valid_partition(const std::vector<ByteRange>& ranges, size_t file_length);
