#include "FileChunker.hpp"
#include "ChunkerErrors.hpp"
#include <stdexcept>
#include <utility>

ChunkSet::ChunkSet(std::shared_ptr<const MappedFile> file, std::vector<ByteRange> ranges)
    : file_(std::move(file)), ranges_(std::move(ranges)) {}

size_t ChunkSet::size() const {
    return ranges_.size();
}

bool ChunkSet::empty() const {
    return ranges_.empty();
}

std::string_view ChunkSet::operator[](size_t index) const {
    const ByteRange& range = ranges_[index];
    return file_->view().substr(range.offset, range.size);
}

std::string_view ChunkSet::at(size_t index) const {
    if (index >= ranges_.size()) {
        throw std::out_of_range("chunk index " + std::to_string(index) + " out of range");
    }
    return (*this)[index];
}

const std::vector<ByteRange>& ChunkSet::ranges() const {
    return ranges_;
}

std::vector<std::string_view> ChunkSet::views() const {
    std::vector<std::string_view> result;
    result.reserve(ranges_.size());
    for (size_t i = 0; i < ranges_.size(); ++i) {
        result.push_back((*this)[i]);
    }
    return result;
}

size_t ChunkSet::fileSize() const {
    return file_->size();
}

FileChunker::FileChunker(int fd)
    : file_(std::make_shared<const MappedFile>(fd)) {}

FileChunker::FileChunker(const std::string& path)
    : file_(std::make_shared<const MappedFile>(path)) {}

FileChunker::FileChunker(std::shared_ptr<const MappedFile> file)
    : file_(std::move(file)) {
    if (!file_) {
        throw MappingError("no mapped file");
    }
}

size_t FileChunker::size() const {
    return file_->size();
}

std::string_view FileChunker::contents() const {
    return file_->view();
}

ChunkSet FileChunker::chunks(size_t count, std::optional<char> delimiter) const {
    return chunks(ChunkRequest::byCount(count, delimiter));
}

ChunkSet FileChunker::chunksBySize(size_t targetSize, std::optional<char> delimiter) const {
    return chunks(ChunkRequest::bySize(targetSize, delimiter));
}

ChunkSet FileChunker::chunks(const ChunkRequest& request) const {
    return ChunkSet(file_, plan(request));
}

std::vector<ByteRange> FileChunker::plan(const ChunkRequest& request) const {
    return plan_chunks(file_->data(), file_->size(), request);
}
