#include "local_storage.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

class StreamFile : public LocalFile {
public:
    StreamFile(std::string path, std::fstream stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    Result<std::size_t> read(char* buf, std::size_t len) override {
        stream_.read(buf, static_cast<std::streamsize>(len));
        auto n = static_cast<std::size_t>(stream_.gcount());
        if (stream_.bad()) {
            return Result<std::size_t>::Err(ErrorKind::TransferIoError, "read", path_, "read failed");
        }
        if (stream_.eof()) stream_.clear();
        return Result<std::size_t>::Ok(n);
    }

    Result<void> write(const char* data, std::size_t len) override {
        stream_.write(data, static_cast<std::streamsize>(len));
        if (!stream_) {
            return Result<void>::Err(ErrorKind::TransferIoError, "write", path_, "write failed");
        }
        return Result<void>::Ok();
    }

    Result<void> close() override {
        if (!stream_.is_open()) return Result<void>::Ok();
        stream_.flush();
        bool ok = static_cast<bool>(stream_);
        stream_.close();
        if (!ok) return Result<void>::Err(ErrorKind::TransferIoError, "close", path_, "flush failed");
        return Result<void>::Ok();
    }

private:
    std::string path_;
    std::fstream stream_;
};

} // namespace

bool FileSystemStorage::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileSystemStorage::is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

Result<std::uint64_t> FileSystemStorage::size(const std::string& path) {
    std::error_code ec;
    auto n = fs::file_size(path, ec);
    if (ec) return Result<std::uint64_t>::Err(ErrorKind::TransferIoError, "stat", path, ec.message());
    return Result<std::uint64_t>::Ok(n);
}

Result<std::unique_ptr<LocalFile>> FileSystemStorage::open(const std::string& path, Mode mode,
                                                           std::uint64_t offset) {
    using R = Result<std::unique_ptr<LocalFile>>;
    std::fstream stream;
    switch (mode) {
        case Mode::Read:
            stream.open(path, std::ios::in | std::ios::binary);
            break;
        case Mode::WriteTruncate:
            stream.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
            break;
        case Mode::WriteAt:
            // in|out keeps the existing bytes; fall back to create when missing
            stream.open(path, std::ios::in | std::ios::out | std::ios::binary);
            if (!stream.is_open()) stream.open(path, std::ios::out | std::ios::binary);
            break;
    }
    if (!stream.is_open()) {
        return R::Err(ErrorKind::TransferIoError, "open", path, "cannot open local file");
    }

    if (offset > 0) {
        if (mode == Mode::Read) stream.seekg(static_cast<std::streamoff>(offset));
        else stream.seekp(static_cast<std::streamoff>(offset));
        if (!stream) {
            return R::Err(ErrorKind::TransferIoError, "seek", path,
                          fmt::format("cannot seek to {}", offset));
        }
    }
    return R::Ok(std::make_unique<StreamFile>(path, std::move(stream)));
}

Result<void> FileSystemStorage::make_dirs(const std::string& path) {
    if (path.empty()) return Result<void>::Ok();
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) return Result<void>::Err(ErrorKind::TransferIoError, "mkdir", path, ec.message());
    return Result<void>::Ok();
}

Result<std::vector<LocalEntry>> FileSystemStorage::list_tree(const std::string& root) {
    using R = Result<std::vector<LocalEntry>>;
    std::vector<LocalEntry> out;
    std::error_code ec;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return R::Err(ErrorKind::TransferIoError, "list", root, ec.message());

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return R::Err(ErrorKind::TransferIoError, "list", root, ec.message());
        if (!it->is_regular_file(ec)) continue;
        LocalEntry e;
        e.path = it->path().string();
        e.relative = fs::relative(it->path(), root, ec).generic_string();
        e.size = it->file_size(ec);
        out.push_back(std::move(e));
    }

    std::sort(out.begin(), out.end(),
              [](const LocalEntry& a, const LocalEntry& b) { return a.relative < b.relative; });
    return R::Ok(std::move(out));
}
