#include "filecenter/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace filecenter::core {
    namespace {
        [[nodiscard]] Status env_u32(const char* name, u32* out) noexcept {
            const char* raw = std::getenv(name);
            if (raw == nullptr || raw[0] == '\0') {
                return ok_status();
            }
            u64 v{};
            if (!parse_u64(raw, &v) || v > 0xffffffffull) {
                return make_status(StatusDomain::Config, StatusCode::Invalid);
            }
            *out = static_cast<u32>(v);
            return ok_status();
        }

        [[nodiscard]] Status env_u64(const char* name, u64* out) noexcept {
            const char* raw = std::getenv(name);
            if (raw == nullptr || raw[0] == '\0') {
                return ok_status();
            }
            if (!parse_u64(raw, out)) {
                return make_status(StatusDomain::Config, StatusCode::Invalid);
            }
            return ok_status();
        }
    } // namespace

    bool parse_u64(const char* s, u64* out) noexcept {
        if (s == nullptr || out == nullptr || *s == '\0') {
            return false;
        }
        const char* end = s + std::strlen(s);
        u64 v{};
        auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end) {
            return false;
        }
        *out = v;
        return true;
    }

    Status config_validate(const FileCenterConfig& cfg) noexcept {
        if (cfg.db_path == nullptr || cfg.db_path[0] == '\0') {
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }
        if (cfg.file_size_threshold == 0 || cfg.file_size_threshold > kMaxFileSizeThreshold) {
            return make_status(StatusDomain::Config, StatusCode::Invalid, cfg.file_size_threshold);
        }
        if (cfg.chunk_size == 0 || cfg.chunk_size > kMaxFileSizeThreshold) {
            return make_status(StatusDomain::Config, StatusCode::Invalid, cfg.chunk_size);
        }
        if (cfg.temporary_lifetime_ms <= 0) {
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }
        if (cfg.max_file_size > kStoreMaxFileBytes) {
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }
        if (cfg.codec_key == nullptr || cfg.codec_key[0] == '\0') {
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }
        return ok_status();
    }

    Status config_from_env(FileCenterConfig* cfg) noexcept {
        if (cfg == nullptr) {
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }

        if (const char* path = std::getenv("FILECENTER_DB_PATH"); path != nullptr && path[0] != '\0') {
            cfg->db_path = path;
        }
        if (const char* key = std::getenv("FILECENTER_CODEC_KEY"); key != nullptr && key[0] != '\0') {
            cfg->codec_key = key;
        }
        if (const char* dir = std::getenv("FILECENTER_SPOOL_DIR"); dir != nullptr && dir[0] != '\0') {
            cfg->spool_dir = dir;
        }

        Status s = env_u32("FILECENTER_FILE_SIZE_THRESHOLD", &cfg->file_size_threshold);
        if (!is_ok(s)) {
            return s;
        }
        s = env_u32("FILECENTER_CHUNK_SIZE", &cfg->chunk_size);
        if (!is_ok(s)) {
            return s;
        }
        s = env_u64("FILECENTER_MAX_FILE_SIZE", &cfg->max_file_size);
        if (!is_ok(s)) {
            return s;
        }

        u64 lifetime = 0;
        s = env_u64("FILECENTER_TEMPORARY_LIFETIME_MS", &lifetime);
        if (!is_ok(s)) {
            return s;
        }
        if (lifetime != 0) {
            if (lifetime > static_cast<u64>(INT64_MAX)) {
                return make_status(StatusDomain::Config, StatusCode::Invalid);
            }
            cfg->temporary_lifetime_ms = static_cast<i64>(lifetime);
        }
        return ok_status();
    }
} // namespace filecenter::core
