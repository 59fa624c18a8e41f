#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

// A file found under a local directory tree
struct LocalEntry {
    std::string path;           // absolute
    std::string relative;       // to the walked root, '/'-separated
    std::uint64_t size = 0;
};

// An open local file
class LocalFile {
public:
    virtual ~LocalFile() = default;

    // Returns 0 at end of file.
    virtual Result<std::size_t> read(char* buf, std::size_t len) = 0;
    virtual Result<void> write(const char* data, std::size_t len) = 0;
    virtual Result<void> close() = 0;
};

// LocalStorage: the transfer engine's view of the local filesystem.
class LocalStorage {
public:
    enum class Mode { Read, WriteTruncate, WriteAt };

    virtual ~LocalStorage() = default;

    virtual bool exists(const std::string& path) = 0;
    virtual bool is_directory(const std::string& path) = 0;
    virtual Result<std::uint64_t> size(const std::string& path) = 0;

    virtual Result<std::unique_ptr<LocalFile>> open(const std::string& path, Mode mode,
                                                    std::uint64_t offset = 0) = 0;
    virtual Result<void> make_dirs(const std::string& path) = 0;

    // Regular files under root, in a stable order.
    virtual Result<std::vector<LocalEntry>> list_tree(const std::string& root) = 0;
};

// LocalStorage backed by std::filesystem and fstreams
class FileSystemStorage : public LocalStorage {
public:
    bool exists(const std::string& path) override;
    bool is_directory(const std::string& path) override;
    Result<std::uint64_t> size(const std::string& path) override;
    Result<std::unique_ptr<LocalFile>> open(const std::string& path, Mode mode,
                                            std::uint64_t offset = 0) override;
    Result<void> make_dirs(const std::string& path) override;
    Result<std::vector<LocalEntry>> list_tree(const std::string& root) override;
};
