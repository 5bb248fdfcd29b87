#include "filecenter/storage/source.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace filecenter::storage {

using namespace filecenter::core;

namespace {
    Status io_error() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
    }

    // Regular files can be re-read from `*start`; anything else streams once.
    Status classify_descriptor(int fd, bool* rewindable, u64* start) noexcept {
        struct stat st{};
        if (::fstat(fd, &st) != 0) {
            return io_error();
        }
        *rewindable = false;
        *start = 0;
        if (!S_ISREG(st.st_mode)) {
            return ok_status();
        }
        const off_t pos = ::lseek(fd, 0, SEEK_CUR);
        if (pos < 0) {
            return ok_status();
        }
        *rewindable = true;
        *start = static_cast<u64>(pos);
        return ok_status();
    }
}

const char* source_base_name(const ByteSource& s) noexcept {
    if (s.kind != SourceKind::Path || s.path == nullptr) {
        return nullptr;
    }
    const char* slash = std::strrchr(s.path, '/');
    const char* name = slash ? slash + 1 : s.path;
    return name[0] != '\0' ? name : nullptr;
}

SourceCursor::~SourceCursor() noexcept {
    close();
}

Status SourceCursor::open(const ByteSource& src) noexcept {
    if (open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    switch (src.kind) {
        case SourceKind::Path: {
            if (src.path == nullptr || src.path[0] == '\0') {
                return make_status(StatusDomain::Storage, StatusCode::Invalid);
            }
            int fd = ::open(src.path, O_RDONLY | O_CLOEXEC);
            if (fd < 0) {
                return io_error();
            }
            Status s = classify_descriptor(fd, &rewindable_, &start_);
            if (!is_ok(s)) {
                ::close(fd);
                return s;
            }
            fd_ = fd;
            owns_fd_ = true;
            break;
        }
        case SourceKind::Buffer:
            if (!buffer_ok(src.buffer)) {
                return make_status(StatusDomain::Storage, StatusCode::Invalid);
            }
            rewindable_ = true;
            start_ = 0;
            break;
        case SourceKind::Fd: {
            if (src.fd < 0) {
                return make_status(StatusDomain::Storage, StatusCode::Invalid);
            }
            Status s = classify_descriptor(src.fd, &rewindable_, &start_);
            if (!is_ok(s)) {
                return s;
            }
            fd_ = src.fd;
            owns_fd_ = false;
            break;
        }
        case SourceKind::Reader:
            if (src.read == nullptr) {
                return make_status(StatusDomain::Storage, StatusCode::Invalid);
            }
            rewindable_ = false;
            start_ = 0;
            break;
        default:
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    src_ = src;
    offset_ = 0;
    open_ = true;
    return ok_status();
}

Status SourceCursor::read(BufferMut out, u64* n_read) noexcept {
    if (n_read == nullptr || !buffer_ok(out)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *n_read = 0;
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (out.len == 0) {
        return ok_status();
    }

    switch (src_.kind) {
        case SourceKind::Buffer: {
            const u64 remaining = src_.buffer.len - offset_;
            const u64 n = remaining < out.len ? remaining : out.len;
            if (n > 0) {
                std::memcpy(out.data, src_.buffer.data + offset_, static_cast<size_t>(n));
                offset_ += n;
            }
            *n_read = n;
            return ok_status();
        }
        case SourceKind::Path:
        case SourceKind::Fd: {
            while (true) {
                ssize_t n = ::read(fd_, out.data, static_cast<size_t>(out.len));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return io_error();
                }
                offset_ += static_cast<u64>(n);
                *n_read = static_cast<u64>(n);
                return ok_status();
            }
        }
        case SourceKind::Reader: {
            u64 n = 0;
            Status s = src_.read(src_.ctx, out, &n);
            if (!is_ok(s)) {
                return s;
            }
            if (n > out.len) {
                return make_status(StatusDomain::Storage, StatusCode::Invalid);
            }
            offset_ += n;
            *n_read = n;
            return ok_status();
        }
    }
    return make_status(StatusDomain::Storage, StatusCode::Invalid);
}

Status SourceCursor::read_full(BufferMut out, u64* n_read) noexcept {
    if (n_read == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *n_read = 0;

    u64 total = 0;
    while (total < out.len) {
        u64 n = 0;
        Status s = read(BufferMut{out.data + total, out.len - total}, &n);
        if (!is_ok(s)) {
            return s;
        }
        if (n == 0) break;  // end of data
        total += n;
    }
    *n_read = total;
    return ok_status();
}

Status SourceCursor::rewind() noexcept {
    if (!open_ || !rewindable_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (src_.kind != SourceKind::Buffer && ::lseek(fd_, static_cast<off_t>(start_), SEEK_SET) < 0) {
        return io_error();
    }
    offset_ = 0;
    return ok_status();
}

void SourceCursor::close() noexcept {
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
    owns_fd_ = false;
    open_ = false;
    rewindable_ = false;
    offset_ = 0;
    start_ = 0;
    src_ = ByteSource{};
}

} // namespace filecenter::storage
