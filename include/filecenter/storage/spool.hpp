#pragma once

#include <vector>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/storage/hashing.hpp"
#include "filecenter/storage/source.hpp"

namespace filecenter::storage {

struct SpoolPolicy {
    u64 memory_limit;       // Larger payloads spill to an unlinked scratch file
    u64 max_file_bytes;     // Larger payloads fail with TooLarge
    const char* dir;        // Scratch directory; nullptr means $TMPDIR, then /tmp
};

// Private copy of a read-once source. Pipes and reader callbacks are drained
// here before any transaction starts, and the copy is read back as a
// rewindable Buffer or Fd source.
class Spool {
public:
    Spool() noexcept = default;
    ~Spool() noexcept;

    Spool(const Spool&) = delete;
    Spool& operator=(const Spool&) = delete;

    // Reads `in` to end of data. Every byte is fed to the optional hasher
    // exactly once. Fills once.
    [[nodiscard]] filecenter::core::Status fill(SourceCursor* in, const SpoolPolicy& policy, HashState* hasher) noexcept;

    // Valid while the spool lives.
    [[nodiscard]] ByteSource source() const noexcept;

    [[nodiscard]] u64 size_bytes() const noexcept { return size_; }
    [[nodiscard]] bool on_disk() const noexcept { return fd_ >= 0; }

private:
    [[nodiscard]] filecenter::core::Status spill(const char* dir) noexcept;
    [[nodiscard]] filecenter::core::Status append(BufferView data) noexcept;

    std::vector<u8> memory_;
    int fd_{-1};
    u64 size_{0};
    bool filled_{false};
};

} // namespace filecenter::storage
