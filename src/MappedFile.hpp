#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <boost/interprocess/mapped_region.hpp>

// Read-only mapping of a whole file. The contents must not change while the
// mapping is alive; concurrent modification is undefined behaviour.
class MappedFile {
public:
    // Maps the file behind an already-open descriptor. The descriptor is
    // borrowed and is not closed here.
    explicit MappedFile(int fd);
    // Opens the file read-only just long enough to map it.
    explicit MappedFile(const std::string& path);
    ~MappedFile() = default;

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    size_t size() const;
    const char* data() const;
    std::string_view view() const;

private:
    void mapDescriptor(int fd);

    boost::interprocess::mapped_region region;
    size_t fileSize = 0;
};
