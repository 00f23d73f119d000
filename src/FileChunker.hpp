#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "ChunkPlanner.hpp"
#include "MappedFile.hpp"

// The result of one chunking call: the planned ranges and zero-copy views of
// them. Holds a reference on the mapping, so the views stay valid for as long
// as the set itself is alive.
class ChunkSet {
public:
    ChunkSet(std::shared_ptr<const MappedFile> file, std::vector<ByteRange> ranges);

    size_t size() const;
    bool empty() const;
    std::string_view operator[](size_t index) const;
    std::string_view at(size_t index) const;

    const std::vector<ByteRange>& ranges() const;
    std::vector<std::string_view> views() const;
    size_t fileSize() const;

private:
    std::shared_ptr<const MappedFile> file_;
    std::vector<ByteRange> ranges_;
};

class FileChunker {
public:
    // Maps the file behind 'fd'. Throws MappingError.
    explicit FileChunker(int fd);
    explicit FileChunker(const std::string& path);
    explicit FileChunker(std::shared_ptr<const MappedFile> file);

    size_t size() const;
    std::string_view contents() const;

    // Divides the file into 'count' chunks of approximately equal size. With a
    // delimiter every chunk except possibly the last ends with it.
    // Throws InvalidRequest if count is zero.
    ChunkSet chunks(size_t count, std::optional<char> delimiter = std::nullopt) const;
    // Divides the file into chunks of about 'targetSize' bytes.
    ChunkSet chunksBySize(size_t targetSize, std::optional<char> delimiter = std::nullopt) const;
    ChunkSet chunks(const ChunkRequest& request) const;

    // Boundaries only, without views.
    std::vector<ByteRange> plan(const ChunkRequest& request) const;

private:
    std::shared_ptr<const MappedFile> file_;
};
