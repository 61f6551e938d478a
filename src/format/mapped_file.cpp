#include "mapped_file.hpp"
#include "../core/error.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#endif

namespace tkb {

std::unique_ptr<MappedFile> MappedFile::open(const std::string& path, bool use_mmap) {
    auto file = std::unique_ptr<MappedFile>(new MappedFile());
    file->path_ = path;

#ifdef _WIN32
    HANDLE hFile = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (hFile == INVALID_HANDLE_VALUE) {
        throw Error(TKB_ERROR_FILE_NOT_FOUND, "Failed to open file: " + path);
    }

    LARGE_INTEGER fileSize;
    if (!GetFileSizeEx(hFile, &fileSize)) {
        CloseHandle(hFile);
        throw Error(TKB_ERROR_FILE_READ, "Failed to get file size: " + path);
    }

    file->size_ = static_cast<size_t>(fileSize.QuadPart);
    if (file->size_ == 0) {
        CloseHandle(hFile);
        return file;
    }

    if (use_mmap) {
        HANDLE hMapping = CreateFileMappingA(hFile, nullptr, PAGE_READONLY, 0, 0, nullptr);
        if (hMapping == nullptr) {
            CloseHandle(hFile);
            throw Error(TKB_ERROR_MMAP_FAILED, "Failed to create file mapping: " + path);
        }

        file->data_ = MapViewOfFile(hMapping, FILE_MAP_READ, 0, 0, 0);
        CloseHandle(hMapping);
        CloseHandle(hFile);

        if (file->data_ == nullptr) {
            throw Error(TKB_ERROR_MMAP_FAILED, "Failed to map file: " + path);
        }
        file->mapped_ = true;
    } else {
        file->data_ = malloc(file->size_);
        if (file->data_ == nullptr) {
            CloseHandle(hFile);
            throw Error(TKB_ERROR_OUT_OF_MEMORY, "Failed to allocate memory for " + path);
        }

        DWORD bytesRead;
        if (!ReadFile(hFile, file->data_, static_cast<DWORD>(file->size_), &bytesRead, nullptr) ||
            bytesRead != file->size_) {
            CloseHandle(hFile);
            throw Error(TKB_ERROR_FILE_READ, "Failed to read file: " + path);
        }
        CloseHandle(hFile);
    }
#else
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw Error(errno == ENOENT ? TKB_ERROR_FILE_NOT_FOUND : TKB_ERROR_FILE_READ,
                    "Failed to open file: " + path);
    }

    struct stat st;
    if (fstat(fd, &st) < 0) {
        ::close(fd);
        throw Error(TKB_ERROR_FILE_READ, "Failed to get file size: " + path);
    }

    file->size_ = static_cast<size_t>(st.st_size);
    if (file->size_ == 0) {
        ::close(fd);
        return file;
    }

    if (use_mmap) {
        void* addr = mmap(nullptr, file->size_, PROT_READ, MAP_PRIVATE, fd, 0);
        ::close(fd);
        if (addr == MAP_FAILED) {
            throw Error(TKB_ERROR_MMAP_FAILED, "Failed to mmap file: " + path);
        }
        file->data_ = addr;
        file->mapped_ = true;
        // Parsed once front to back
        madvise(file->data_, file->size_, MADV_SEQUENTIAL);
    } else {
        file->data_ = malloc(file->size_);
        if (file->data_ == nullptr) {
            ::close(fd);
            throw Error(TKB_ERROR_OUT_OF_MEMORY, "Failed to allocate memory for " + path);
        }

        size_t total_read = 0;
        while (total_read < file->size_) {
            ssize_t n = ::read(fd, static_cast<char*>(file->data_) + total_read,
                               file->size_ - total_read);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                ::close(fd);
                throw Error(TKB_ERROR_FILE_READ, "Failed to read file: " + path);
            }
            total_read += static_cast<size_t>(n);
        }
        ::close(fd);
    }
#endif

    return file;
}

MappedFile::~MappedFile() {
    if (!data_) {
        return;
    }
#ifdef _WIN32
    if (mapped_) {
        UnmapViewOfFile(data_);
    } else {
        free(data_);
    }
#else
    if (mapped_) {
        munmap(data_, size_);
    } else {
        free(data_);
    }
#endif
}

} // namespace tkb
