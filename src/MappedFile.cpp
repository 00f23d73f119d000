#include "MappedFile.hpp"
#include "ChunkerErrors.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/interprocess/exceptions.hpp>

namespace {

// Adapts a borrowed descriptor to the MemoryMappable interface that
// mapped_region expects, so no second open of the file is needed.
class DescriptorMapping {
public:
    explicit DescriptorMapping(int fd) : fd_(fd) {}

    boost::interprocess::mapping_handle_t get_mapping_handle() const {
        return boost::interprocess::ipcdetail::mapping_handle_from_file_handle(fd_);
    }

    boost::interprocess::mode_t get_mode() const {
        return boost::interprocess::read_only;
    }

private:
    int fd_;
};

// Closes the descriptor opened by the path constructor.
struct DescriptorGuard {
    int fd;
    ~DescriptorGuard() {
        if (fd >= 0) ::close(fd);
    }
};

} // namespace

MappedFile::MappedFile(int fd) {
    mapDescriptor(fd);
}

MappedFile::MappedFile(const std::string& path) {
    DescriptorGuard guard{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (guard.fd < 0) {
        throw MappingError("cannot open " + path + ": " + std::strerror(errno));
    }
    mapDescriptor(guard.fd);
}

void MappedFile::mapDescriptor(int fd) {
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        throw MappingError(std::string("fstat failed: ") + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw MappingError("not a regular file");
    }
    fileSize = static_cast<size_t>(st.st_size);
    // mmap rejects zero-length regions, an empty file simply has an empty view
    if (fileSize == 0) {
        return;
    }
    try {
        boost::interprocess::mapped_region mapped(DescriptorMapping(fd), boost::interprocess::read_only, 0, fileSize);
        region.swap(mapped);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw MappingError(e.what());
    }
}

size_t MappedFile::size() const {
    return fileSize;
}

const char* MappedFile::data() const {
    if (fileSize == 0) return "";
    return static_cast<const char*>(region.get_address());
}

std::string_view MappedFile::view() const {
    return std::string_view(data(), fileSize);
}
