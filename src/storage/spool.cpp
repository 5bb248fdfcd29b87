#include "filecenter/storage/spool.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <unistd.h>

#include "filecenter/core/log.hpp"

namespace filecenter::storage {

using namespace filecenter::core;

namespace {
    constexpr size_t kSpoolBlockBytes = 64 * 1024;

    Status io_error() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
    }

    const char* scratch_dir(const char* dir) noexcept {
        if (dir != nullptr && dir[0] != '\0') {
            return dir;
        }
        const char* env = std::getenv("TMPDIR");
        if (env != nullptr && env[0] != '\0') {
            return env;
        }
        return "/tmp";
    }
}

Spool::~Spool() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Status Spool::fill(SourceCursor* in, const SpoolPolicy& policy, HashState* hasher) noexcept {
    if (in == nullptr || filled_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    filled_ = true;

    // One byte past the memory limit decides whether the copy spills.
    memory_.resize(static_cast<size_t>(policy.memory_limit) + 1);
    u64 n = 0;
    Status s = in->read_full(BufferMut{memory_.data(), memory_.size()}, &n);
    if (!is_ok(s)) {
        return s;
    }
    memory_.resize(static_cast<size_t>(n));
    if (hasher != nullptr) {
        s = hash_update(hasher, BufferView{memory_.data(), memory_.size()});
        if (!is_ok(s)) {
            return s;
        }
    }
    size_ = n;
    if (size_ > policy.max_file_bytes) {
        return make_status(StatusDomain::Storage, StatusCode::TooLarge);
    }
    if (size_ <= policy.memory_limit) {
        return ok_status();
    }

    s = spill(scratch_dir(policy.dir));
    if (!is_ok(s)) {
        return s;
    }
    s = append(BufferView{memory_.data(), memory_.size()});
    memory_.clear();
    memory_.shrink_to_fit();
    if (!is_ok(s)) {
        return s;
    }

    std::array<u8, kSpoolBlockBytes> block;
    while (true) {
        s = in->read(BufferMut{block.data(), block.size()}, &n);
        if (!is_ok(s)) {
            return s;
        }
        if (n == 0) {
            break;
        }
        size_ += n;
        if (size_ > policy.max_file_bytes) {
            return make_status(StatusDomain::Storage, StatusCode::TooLarge);
        }
        if (hasher != nullptr) {
            s = hash_update(hasher, BufferView{block.data(), n});
            if (!is_ok(s)) {
                return s;
            }
        }
        s = append(BufferView{block.data(), n});
        if (!is_ok(s)) {
            return s;
        }
    }

    if (::lseek(fd_, 0, SEEK_SET) < 0) {
        return io_error();
    }
    FILECENTER_LOG_DEBUG("source spooled to disk", {field_int("bytes", static_cast<i64>(size_))});
    return ok_status();
}

ByteSource Spool::source() const noexcept {
    if (fd_ >= 0) {
        return source_fd(fd_);
    }
    return source_buffer(BufferView{memory_.data(), memory_.size()});
}

Status Spool::spill(const char* dir) noexcept {
    std::string path = std::string(dir) + "/filecenter-spool-XXXXXX";

    int fd = ::mkstemp(path.data());
    if (fd < 0) {
        FILECENTER_LOG_ERROR("spool file create failed", {field_str("dir", dir), field_int("errno", errno)});
        return io_error();
    }
    // Nobody else needs the name; the descriptor keeps the data alive.
    if (::unlink(path.c_str()) != 0 || ::fcntl(fd, F_SETFD, FD_CLOEXEC) != 0) {
        Status s = io_error();
        ::close(fd);
        return s;
    }
    fd_ = fd;
    return ok_status();
}

Status Spool::append(BufferView data) noexcept {
    u64 written = 0;
    while (written < data.len) {
        ssize_t n = ::write(fd_, data.data + written, static_cast<size_t>(data.len - written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error();
        }
        written += static_cast<u64>(n);
    }
    return ok_status();
}

} // namespace filecenter::storage
