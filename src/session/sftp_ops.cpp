#include "sftp_ops.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>

const char* sftp_op_name(SftpOpKind kind) {
    switch (kind) {
        case SftpOpKind::List:       return "list";
        case SftpOpKind::Stat:       return "stat";
        case SftpOpKind::Mkdir:      return "mkdir";
        case SftpOpKind::CreateFile: return "create";
        case SftpOpKind::Remove:     return "remove";
        case SftpOpKind::Rename:     return "rename";
        case SftpOpKind::Chmod:      return "chmod";
        case SftpOpKind::ReadFile:   return "read";
        case SftpOpKind::WriteFile:  return "write";
        case SftpOpKind::Walk:       return "walk";
    }
    return "unknown";
}

static Error io_error(const std::string& op, const std::string& path, const IoResult& r) {
    return make_error(r.fatal ? ErrorKind::SessionLost : ErrorKind::TransferIoError, op, path,
                      r.error.empty() ? "remote I/O failed" : r.error);
}

Result<std::vector<RemoteEntry>> walk_remote(SftpIo& sftp, const std::string& root) {
    using R = Result<std::vector<RemoteEntry>>;
    std::vector<RemoteEntry> files;
    std::vector<std::string> pending{root};

    while (!pending.empty()) {
        std::string dir = pending.back();
        pending.pop_back();
        auto listed = sftp.list(dir);
        if (listed.is_err()) return R::Err(listed.error);
        for (auto& e : listed.value) {
            if (e.is_dir) pending.push_back(e.path);
            else files.push_back(std::move(e));
        }
    }
    return R::Ok(std::move(files));
}

Result<void> remove_remote_tree(SftpIo& sftp, const std::string& path) {
    auto st = sftp.stat(path);
    if (st.is_err()) return Result<void>::Err(st.error);
    if (!st.value.is_dir) return sftp.remove_file(path);

    auto listed = sftp.list(path);
    if (listed.is_err()) return Result<void>::Err(listed.error);
    for (const auto& e : listed.value) {
        auto r = e.is_dir ? remove_remote_tree(sftp, e.path) : sftp.remove_file(e.path);
        if (r.is_err()) return r;
    }
    return sftp.remove_dir(path);
}

Result<void> make_remote_dirs(SftpIo& sftp, const std::string& path) {
    if (path.empty() || path == "/" || path == ".") return Result<void>::Ok();

    auto st = sftp.stat(path);
    if (st.is_ok()) {
        if (st.value.is_dir) return Result<void>::Ok();
        return Result<void>::Err(ErrorKind::TransferIoError, "mkdir", path,
                                 "exists and is not a directory");
    }
    if (st.kind() == ErrorKind::SessionLost) return Result<void>::Err(st.error);

    auto parent = make_remote_dirs(sftp, remote_parent(path));
    if (parent.is_err()) return parent;
    auto made = sftp.mkdir(path, 0755);
    if (made.is_ok() || made.kind() == ErrorKind::SessionLost) return made;

    // Another worker may have created it in the meantime
    auto again = sftp.stat(path);
    if (again.is_ok() && again.value.is_dir) return Result<void>::Ok();
    return made;
}

static Result<std::string> read_content(SftpIo& sftp, const SftpOp& op) {
    using R = Result<std::string>;
    auto opened = sftp.open(op.path, OpenMode::Read, 0);
    if (opened.is_err()) return R::Err(opened.error);
    auto& file = opened.value;

    std::string content;
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    for (;;) {
        auto r = file->read(buf.data(), buf.size());
        if (r.status == IoStatus::Ok) {
            content.append(buf.data(), r.bytes);
            if (op.max_bytes && content.size() >= *op.max_bytes) {
                content.resize(static_cast<std::size_t>(*op.max_bytes));
                break;
            }
        } else if (r.status == IoStatus::Again) {
            platform::sleep_ms(1);
        } else if (r.status == IoStatus::Eof) {
            break;
        } else {
            file->close();
            return R::Err(io_error("read", op.path, r));
        }
    }
    file->close();
    return R::Ok(std::move(content));
}

static Result<void> write_small(SftpIo& sftp, const std::string& path, const std::string& content) {
    auto opened = sftp.open(path, OpenMode::WriteTruncate, 0);
    if (opened.is_err()) return Result<void>::Err(opened.error);
    auto& file = opened.value;

    size_t sent = 0;
    while (sent < content.size()) {
        auto r = file->write(content.data() + sent, content.size() - sent);
        if (r.status == IoStatus::Ok) {
            sent += r.bytes;
        } else if (r.status == IoStatus::Again) {
            platform::sleep_ms(1);
        } else {
            file->close();
            return Result<void>::Err(io_error("write", path, r));
        }
    }
    file->close();
    return Result<void>::Ok();
}

Result<SftpReply> run_sftp_op(SftpIo& sftp, const SftpOp& op) {
    using R = Result<SftpReply>;
    SftpReply reply;

    if (op.path.empty()) {
        return R::Err(ErrorKind::InvalidArgument, sftp_op_name(op.kind), op.path, "path is required");
    }

    auto unit = [&](const Result<void>& r) {
        return r.is_ok() ? R::Ok(std::move(reply)) : R::Err(r.error);
    };

    switch (op.kind) {
        case SftpOpKind::List: {
            auto r = sftp.list(op.path);
            if (r.is_err()) return R::Err(r.error);
            reply.entries = std::move(r.value);
            return R::Ok(std::move(reply));
        }
        case SftpOpKind::Stat: {
            auto r = sftp.stat(op.path);
            if (r.is_err()) return R::Err(r.error);
            reply.entry = std::move(r.value);
            return R::Ok(std::move(reply));
        }
        case SftpOpKind::Walk: {
            auto r = walk_remote(sftp, op.path);
            if (r.is_err()) return R::Err(r.error);
            reply.entries = std::move(r.value);
            return R::Ok(std::move(reply));
        }
        case SftpOpKind::Mkdir:
            return unit(sftp.mkdir(op.path, op.mode));
        case SftpOpKind::CreateFile:
            return unit(write_small(sftp, op.path, ""));
        case SftpOpKind::WriteFile:
            return unit(write_small(sftp, op.path, op.content));
        case SftpOpKind::Remove:
            if (op.recursive) return unit(remove_remote_tree(sftp, op.path));
            {
                auto st = sftp.stat(op.path);
                if (st.is_err()) return R::Err(st.error);
                return unit(st.value.is_dir ? sftp.remove_dir(op.path) : sftp.remove_file(op.path));
            }
        case SftpOpKind::Rename:
            if (op.target.empty()) {
                return R::Err(ErrorKind::InvalidArgument, "rename", op.path, "target is required");
            }
            return unit(sftp.rename(op.path, op.target));
        case SftpOpKind::Chmod:
            return unit(sftp.chmod(op.path, op.mode));
        case SftpOpKind::ReadFile: {
            auto r = read_content(sftp, op);
            if (r.is_err()) return R::Err(r.error);
            reply.content = std::move(r.value);
            return R::Ok(std::move(reply));
        }
    }
    return R::Err(ErrorKind::InvalidArgument, "sftp", op.path, "unknown operation");
}
