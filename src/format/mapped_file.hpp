#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace tkb {

/**
 * MappedFile - read-only view of a whole file
 *
 * Either memory-mapped or read into a heap buffer. Throws Error with
 * TKB_ERROR_FILE_NOT_FOUND, TKB_ERROR_FILE_READ, TKB_ERROR_MMAP_FAILED or
 * TKB_ERROR_OUT_OF_MEMORY.
 */
class MappedFile {
public:
    static std::unique_ptr<MappedFile> open(const std::string& path, bool use_mmap = true);

    ~MappedFile();

    // Prevent copying
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    const std::string& path() const { return path_; }
    const uint8_t* data() const { return static_cast<const uint8_t*>(data_); }
    size_t size() const { return size_; }
    bool is_mmap() const { return mapped_; }

private:
    MappedFile() = default;

    std::string path_;
    void* data_ = nullptr;
    size_t size_ = 0;
    bool mapped_ = false;
};

} // namespace tkb
