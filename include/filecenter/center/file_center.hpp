#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <string_view>

#include "filecenter/core/config.hpp"
#include "filecenter/core/errors.hpp"
#include "filecenter/core/models.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/db/db.hpp"
#include "filecenter/security/id_token.hpp"
#include "filecenter/storage/chunked_store.hpp"
#include "filecenter/storage/repository.hpp"
#include "filecenter/storage/source.hpp"

namespace filecenter::center {

using u32 = filecenter::core::u32;
using u64 = filecenter::core::u64;

struct PutOptions {
    std::optional<std::string> file_name;   // Path sources default to the final path component
    std::optional<std::string> mime_type;
    bool temporary{false};                  // single-use, expires after the configured lifetime
};

struct PutResult {
    filecenter::core::FileId id{filecenter::core::FileId::invalid()};
    bool deduplicated{false};
    filecenter::core::StorageShape shape{filecenter::core::StorageShape::Inline};
    u64 size_bytes{0};
};

// A loaded file. Move-only because a chunked payload streams once.
struct FileItem {
    filecenter::core::FileMeta meta{};
    filecenter::storage::FileData data;
};

using GarbageReport = filecenter::storage::GarbageReport;

// ========================================================================
// FileCenter
// ========================================================================

// Deduplicating file store over one SQLite database.
// - Perennial files are content addressed: equal bytes share one id
// - Temporary files are never deduplicated and can be read once
// - Payloads up to file_size_threshold live inline, larger ones in chunks
// - Ids handed to untrusted parties go through encrypt_id/decrypt_id_token
//
// All methods may be called concurrently once open() returned. open(),
// close() and drop() must not race other calls.
class FileCenter {
public:
    FileCenter() noexcept = default;
    ~FileCenter() noexcept;

    FileCenter(const FileCenter&) = delete;
    FileCenter& operator=(const FileCenter&) = delete;

    // Validates the configuration, derives token keys and opens the store.
    // Fails with Invalid when codec_key is missing. A database that already
    // records a threshold keeps it; cfg.file_size_threshold only seeds new
    // databases.
    [[nodiscard]] filecenter::core::Status open(const filecenter::core::FileCenterConfig& cfg) noexcept;
    [[nodiscard]] filecenter::core::Status close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return open_; }

    // Deletes every stored file and the settings, then closes. The next
    // open() of the same path starts from an empty store.
    [[nodiscard]] filecenter::core::Status drop() noexcept;

    // Stores a payload. Perennial puts of known content return the existing
    // id with deduplicated = true and write nothing.
    [[nodiscard]] filecenter::core::Status put(const filecenter::storage::ByteSource& source,
                                               const PutOptions& opts,
                                               PutResult* out) noexcept;

    // NotFound for unknown ids and for expired or already read temporary
    // files alike. A successful get of a temporary file consumes it.
    [[nodiscard]] filecenter::core::Status get(filecenter::core::FileId id, FileItem* out) noexcept;

    // Whether get() would succeed right now, without consuming anything.
    [[nodiscard]] filecenter::core::Status exists(filecenter::core::FileId id, bool* out) noexcept;

    // Metadata only, under the same NotFound rules as get(). Never consumes.
    [[nodiscard]] filecenter::core::Status stat(filecenter::core::FileId id, filecenter::core::FileMeta* out) noexcept;

    // NotFound when nothing was removed.
    [[nodiscard]] filecenter::core::Status remove(filecenter::core::FileId id) noexcept;

    [[nodiscard]] filecenter::core::Status encrypt_id(filecenter::core::FileId id, std::string* out) const noexcept;
    [[nodiscard]] filecenter::core::Status decrypt_id_token(std::string_view token,
                                                            filecenter::core::FileId* out) const noexcept;

    [[nodiscard]] filecenter::core::Status clear_garbage(GarbageReport* out) noexcept;

    // Persists a new inline/chunked boundary. Files already stored keep
    // their shape; later puts use the new value.
    [[nodiscard]] filecenter::core::Status set_file_size_threshold(u32 threshold) noexcept;
    [[nodiscard]] u32 file_size_threshold() const noexcept { return threshold_.load(std::memory_order_relaxed); }

    // Configuration as of open(), with the stored threshold.
    [[nodiscard]] const filecenter::core::FileCenterConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] filecenter::db::DbHandle db() const noexcept { return db_; }

private:
    [[nodiscard]] filecenter::core::Timestamp now() const noexcept;
    [[nodiscard]] filecenter::core::Status find_existing(const filecenter::core::Hash256& content,
                                                         PutResult* out,
                                                         bool* found) noexcept;

    filecenter::core::FileCenterConfig cfg_{};
    std::string db_path_;
    std::string spool_dir_;
    std::atomic<u32> threshold_{0};
    filecenter::db::DbHandle db_{};
    filecenter::security::IdTokenKeys keys_{};
    bool open_{false};
};

} // namespace filecenter::center
