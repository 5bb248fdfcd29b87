#include "filecenter/cli/app.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>

#include "filecenter/center/file_center.hpp"
#include "filecenter/cli/commands.hpp"
#include "filecenter/core/config.hpp"
#include "filecenter/core/errors.hpp"
#include "filecenter/core/log.hpp"

namespace filecenter::cli {
    using filecenter::core::FileId;
    using filecenter::core::Status;
    using filecenter::core::StatusCode;
    using filecenter::core::StatusDomain;
    using filecenter::core::u64;

    namespace {
        // ========================================================================
        // Tables
        // ========================================================================

        constexpr u32 kMaxOptionHits = 32;

        const CommandDef g_commands[] = {
            {"put", CommandId::Put, "[put options] <path|->"},
            {"get", CommandId::Get, "[get options] <token>"},
            {"stat", CommandId::Stat, "<token>"},
            {"rm", CommandId::Rm, "<token>"},
            {"token", CommandId::Token, "<id>"},
            {"id", CommandId::Id, "<token>"},
            {"gc", CommandId::Gc, ""},
            {"threshold", CommandId::Threshold, "[N]"},
            {"help", CommandId::Help, ""},
        };

        const OptionDef g_global_options[] = {
            {"db", '\0', ValueKind::Text, OptionId::Db, "database file (default :memory:, env FILECENTER_DB_PATH)"},
            {"key", '\0', ValueKind::Text, OptionId::Key, "id token key (env FILECENTER_CODEC_KEY)"},
            {"threshold", '\0', ValueKind::Count, OptionId::Threshold, "largest inline payload of a new database"},
            {"chunk-size", '\0', ValueKind::Count, OptionId::ChunkSize, "chunk size in bytes"},
            {"lifetime-ms", '\0', ValueKind::Count, OptionId::LifetimeMs, "lifetime of temporary files"},
            {"spool-dir", '\0', ValueKind::Text, OptionId::SpoolDir, "scratch space for piped input"},
            {"log-level", '\0', ValueKind::Text, OptionId::LogLevel, "trace, debug, info, warn, err, off"},
            {"help", 'h', ValueKind::Switch, OptionId::Help, "show this help"},
        };

        const OptionDef g_put_options[] = {
            {"temporary", 't', ValueKind::Switch, OptionId::Temporary, "single-use, expires after the lifetime"},
            {"name", 'n', ValueKind::Text, OptionId::Name, "file name to record"},
            {"mime", 'm', ValueKind::Text, OptionId::Mime, "mime type to record"},
        };

        const OptionDef g_get_options[] = {
            {"output", 'o', ValueKind::Text, OptionId::Output, "write the payload to a file"},
        };

        template <typename T, std::size_t N>
        constexpr u32 count_of(const T (&)[N]) noexcept {
            return static_cast<u32>(N);
        }

        // Option storage for one parse.
        struct OptionSlots {
            OptionHit hits[kMaxOptionHits]{};
            OptionSet set{hits, 0, kMaxOptionHits};

            OptionSlots() noexcept = default;
            OptionSlots(const OptionSlots&) = delete;
            OptionSlots& operator=(const OptionSlots&) = delete;
        };

        // ========================================================================
        // Output helpers
        // ========================================================================

        void print_usage(std::FILE* f) noexcept {
            std::fprintf(f, "usage: filecenter [global options] <command> [args]\n\nglobal options:\n");
            print_options(f, g_global_options, count_of(g_global_options));
            std::fprintf(f, "\ncommands:\n");
            print_commands(f, g_commands, count_of(g_commands));
            std::fprintf(f, "\nput options:\n");
            print_options(f, g_put_options, count_of(g_put_options));
            std::fprintf(f, "\nget options:\n");
            print_options(f, g_get_options, count_of(g_get_options));
        }

        void print_status_error(std::FILE* err, const char* what, Status s) noexcept {
            std::fprintf(err, "error: %s: %s (%s", what,
                filecenter::core::status_code_name(s.code),
                filecenter::core::status_domain_name(s.domain));
            if (s.aux != 0) {
                std::fprintf(err, ", aux=%u", s.aux);
            }
            std::fprintf(err, ")\n");
        }

        int usage_error(std::FILE* err, const char* what) noexcept {
            std::fprintf(err, "error: %s\n", what);
            std::fprintf(err, "run 'filecenter help' for usage\n");
            return kExitUsage;
        }

        [[nodiscard]] Status write_all(std::FILE* sink, const u8* data, std::size_t len) noexcept {
            if (len == 0) {
                return filecenter::core::ok_status();
            }
            if (std::fwrite(data, 1, len, sink) != len) {
                return filecenter::core::make_status(StatusDomain::Cli, StatusCode::Io, static_cast<u32>(errno));
            }
            return filecenter::core::ok_status();
        }

        // Writes an inline buffer or drains a chunk stream into `sink`.
        [[nodiscard]] Status write_payload(filecenter::storage::FileData& data, std::FILE* sink) noexcept {
            if (data.shape() == filecenter::core::StorageShape::Inline) {
                return write_all(sink, data.buffer().data(), data.buffer().size());
            }
            std::vector<u8> chunk;
            while (true) {
                bool done = false;
                Status s = data.stream().next(&chunk, &done);
                if (!filecenter::core::is_ok(s)) {
                    return s;
                }
                if (done) {
                    break;
                }
                s = write_all(sink, chunk.data(), chunk.size());
                if (!filecenter::core::is_ok(s)) {
                    return s;
                }
            }
            return filecenter::core::ok_status();
        }

        [[nodiscard]] Status decode_token(const filecenter::center::FileCenter& center, const char* token,
                                          FileId* id) noexcept {
            return center.decrypt_id_token(token, id);
        }

        // ========================================================================
        // Command handlers
        // ========================================================================

        int handle_put(filecenter::center::FileCenter& center, CliArgs args, std::FILE* out, std::FILE* err) noexcept {
            OptionSlots opts;
            if (!filecenter::core::is_ok(take_options(&args, g_put_options, count_of(g_put_options), &opts.set))) {
                return usage_error(err, "put: bad option");
            }
            if (args.argc != 1) {
                return usage_error(err, "put: expected one path or '-'");
            }

            filecenter::center::PutOptions put_opts{};
            put_opts.temporary = opts.set.has(OptionId::Temporary);
            if (const OptionHit* o = opts.set.last(OptionId::Name)) {
                put_opts.file_name = std::string(o->text);
            }
            if (const OptionHit* o = opts.set.last(OptionId::Mime)) {
                put_opts.mime_type = std::string(o->text);
            }

            const char* path = args.argv[0];
            const filecenter::storage::ByteSource source = std::strcmp(path, "-") == 0
                ? filecenter::storage::source_fd(STDIN_FILENO)
                : filecenter::storage::source_path(path);

            filecenter::center::PutResult result{};
            Status s = center.put(source, put_opts, &result);
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "put", s);
                return kExitFailure;
            }

            std::string token;
            s = center.encrypt_id(result.id, &token);
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "put", s);
                return kExitFailure;
            }
            std::fprintf(out, "%s\n", token.c_str());
            if (result.deduplicated) {
                std::fprintf(err, "note: content already stored, existing id reused\n");
            }
            return kExitOk;
        }

        int handle_get(filecenter::center::FileCenter& center, CliArgs args, std::FILE* out, std::FILE* err) noexcept {
            OptionSlots opts;
            if (!filecenter::core::is_ok(take_options(&args, g_get_options, count_of(g_get_options), &opts.set))) {
                return usage_error(err, "get: bad option");
            }
            if (args.argc != 1) {
                return usage_error(err, "get: expected one token");
            }

            FileId id{};
            Status s = decode_token(center, args.argv[0], &id);
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "get", s);
                return kExitFailure;
            }

            filecenter::center::FileItem item{};
            s = center.get(id, &item);
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "get", s);
                return kExitFailure;
            }

            const OptionHit* output = opts.set.last(OptionId::Output);
            if (output == nullptr) {
                s = write_payload(item.data, out);
                if (filecenter::core::is_ok(s) && std::fflush(out) != 0) {
                    s = filecenter::core::make_status(StatusDomain::Cli, StatusCode::Io, static_cast<u32>(errno));
                }
            } else {
                std::FILE* f = std::fopen(output->text, "wb");
                if (f == nullptr) {
                    s = filecenter::core::make_status(StatusDomain::Cli, StatusCode::Io, static_cast<u32>(errno));
                } else {
                    s = write_payload(item.data, f);
                    if (std::fclose(f) != 0 && filecenter::core::is_ok(s)) {
                        s = filecenter::core::make_status(StatusDomain::Cli, StatusCode::Io, static_cast<u32>(errno));
                    }
                    if (!filecenter::core::is_ok(s)) {
                        std::remove(output->text);
                    }
                }
            }
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "get", s);
                return kExitFailure;
            }
            return kExitOk;
        }

        int handle_stat(filecenter::center::FileCenter& center, const CliArgs& args, std::FILE* out, std::FILE* err) noexcept {
            if (args.argc != 1) {
                return usage_error(err, "stat: expected one token");
            }

            FileId id{};
            Status s = decode_token(center, args.argv[0], &id);
            filecenter::core::FileMeta meta{};
            if (filecenter::core::is_ok(s)) {
                s = center.stat(id, &meta);
            }
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "stat", s);
                return kExitFailure;
            }

            const bool chunked = meta.shape == filecenter::core::StorageShape::Chunked;
            std::fprintf(out, "id=%llu\n", static_cast<unsigned long long>(meta.id.v));
            std::fprintf(out, "size=%llu\n", static_cast<unsigned long long>(meta.size_bytes));
            std::fprintf(out, "shape=%s\n", chunked ? "chunked" : "inline");
            if (chunked) {
                std::fprintf(out, "chunks=%llu\n", static_cast<unsigned long long>(meta.chunk_count));
                std::fprintf(out, "chunk_bytes=%u\n", meta.chunk_bytes);
            }
            std::fprintf(out, "name=%s\n", meta.file_name ? meta.file_name->c_str() : "");
            std::fprintf(out, "mime=%s\n", meta.mime_type ? meta.mime_type->c_str() : "");
            std::fprintf(out, "temporary=%s\n", meta.temporary ? "yes" : "no");
            std::fprintf(out, "created_at=%lld\n", static_cast<long long>(meta.created_at));
            if (meta.temporary) {
                std::fprintf(out, "expires_at=%lld\n", static_cast<long long>(meta.expires_at));
            }
            return kExitOk;
        }

        int handle_rm(filecenter::center::FileCenter& center, const CliArgs& args, std::FILE* err) noexcept {
            if (args.argc != 1) {
                return usage_error(err, "rm: expected one token");
            }
            FileId id{};
            Status s = decode_token(center, args.argv[0], &id);
            if (filecenter::core::is_ok(s)) {
                s = center.remove(id);
            }
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "rm", s);
                return kExitFailure;
            }
            return kExitOk;
        }

        int handle_token(filecenter::center::FileCenter& center, const CliArgs& args, std::FILE* out, std::FILE* err) noexcept {
            if (args.argc != 1) {
                return usage_error(err, "token: expected one id");
            }
            u64 raw = 0;
            if (!filecenter::core::parse_u64(args.argv[0], &raw)) {
                return usage_error(err, "token: id must be a decimal number");
            }
            std::string token;
            Status s = center.encrypt_id(FileId{raw}, &token);
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "token", s);
                return kExitFailure;
            }
            std::fprintf(out, "%s\n", token.c_str());
            return kExitOk;
        }

        int handle_id(filecenter::center::FileCenter& center, const CliArgs& args, std::FILE* out, std::FILE* err) noexcept {
            if (args.argc != 1) {
                return usage_error(err, "id: expected one token");
            }
            FileId id{};
            Status s = decode_token(center, args.argv[0], &id);
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "id", s);
                return kExitFailure;
            }
            std::fprintf(out, "%llu\n", static_cast<unsigned long long>(id.v));
            return kExitOk;
        }

        int handle_gc(filecenter::center::FileCenter& center, const CliArgs& args, std::FILE* out, std::FILE* err) noexcept {
            if (args.argc != 0) {
                return usage_error(err, "gc: takes no arguments");
            }
            filecenter::center::GarbageReport report{};
            Status s = center.clear_garbage(&report);
            if (!filecenter::core::is_ok(s)) {
                print_status_error(err, "gc", s);
                return kExitFailure;
            }
            std::fprintf(out, "orphan_chunks=%llu\n", static_cast<unsigned long long>(report.orphan_chunks));
            std::fprintf(out, "incomplete_files=%llu\n", static_cast<unsigned long long>(report.incomplete_files));
            std::fprintf(out, "expired_temporaries=%llu\n", static_cast<unsigned long long>(report.expired_temporaries));
            return kExitOk;
        }

        int handle_threshold(filecenter::center::FileCenter& center, const CliArgs& args, std::FILE* out, std::FILE* err) noexcept {
            if (args.argc > 1) {
                return usage_error(err, "threshold: expected at most one size");
            }
            if (args.argc == 1) {
                u64 raw = 0;
                if (!filecenter::core::parse_u64(args.argv[0], &raw) || raw == 0 ||
                    raw > filecenter::core::kMaxFileSizeThreshold) {
                    return usage_error(err, "threshold: size out of range");
                }
                Status s = center.set_file_size_threshold(static_cast<u32>(raw));
                if (!filecenter::core::is_ok(s)) {
                    print_status_error(err, "threshold", s);
                    return kExitFailure;
                }
            }
            std::fprintf(out, "%u\n", center.file_size_threshold());
            return kExitOk;
        }

        // Applies a global size option. Zero and values past 32 bits are
        // usage errors.
        [[nodiscard]] bool apply_u32(const OptionSet& opts, OptionId id, u32* field) noexcept {
            const OptionHit* o = opts.last(id);
            if (o == nullptr) {
                return true;
            }
            if (o->count == 0 || o->count > 0xffffffffull) {
                return false;
            }
            *field = static_cast<u32>(o->count);
            return true;
        }
    } // namespace

    int run(const CliArgs& args, std::FILE* out, std::FILE* err) noexcept {
        OptionSlots globals;
        CliArgs rest = args;
        if (!filecenter::core::is_ok(take_options(&rest, g_global_options, count_of(g_global_options), &globals.set))) {
            return usage_error(err, "bad global option");
        }
        if (globals.set.has(OptionId::Help)) {
            print_usage(out);
            return kExitOk;
        }
        if (rest.argc == 0) {
            print_usage(err);
            return kExitUsage;
        }

        const CommandDef* command = nullptr;
        Status s = take_command(&rest, g_commands, count_of(g_commands), &command);
        if (!filecenter::core::is_ok(s)) {
            std::fprintf(err, "error: unknown command '%s'\n", rest.argv[0]);
            return kExitUsage;
        }
        if (command->id == CommandId::Help) {
            print_usage(out);
            return kExitOk;
        }

        filecenter::core::FileCenterConfig cfg{};
        s = filecenter::core::config_from_env(&cfg);
        if (!filecenter::core::is_ok(s)) {
            return usage_error(err, "malformed FILECENTER_* environment variable");
        }
        if (const OptionHit* o = globals.set.last(OptionId::Db)) {
            cfg.db_path = o->text;
        }
        if (const OptionHit* o = globals.set.last(OptionId::Key)) {
            cfg.codec_key = o->text;
        }
        if (const OptionHit* o = globals.set.last(OptionId::SpoolDir)) {
            cfg.spool_dir = o->text;
        }
        if (!apply_u32(globals.set, OptionId::Threshold, &cfg.file_size_threshold) ||
            !apply_u32(globals.set, OptionId::ChunkSize, &cfg.chunk_size)) {
            return usage_error(err, "sizes must be positive 32-bit numbers");
        }
        if (const OptionHit* o = globals.set.last(OptionId::LifetimeMs)) {
            if (o->count == 0 || o->count > static_cast<u64>(INT64_MAX)) {
                return usage_error(err, "--lifetime-ms must be positive");
            }
            cfg.temporary_lifetime_ms = static_cast<filecenter::core::i64>(o->count);
        }

        const OptionHit* level = globals.set.last(OptionId::LogLevel);
        filecenter::core::log_init(level != nullptr ? level->text : "warn");

        if (cfg.codec_key == nullptr || cfg.codec_key[0] == '\0') {
            return usage_error(err, "no id token key: pass --key or set FILECENTER_CODEC_KEY");
        }

        filecenter::center::FileCenter center;
        s = center.open(cfg);
        if (!filecenter::core::is_ok(s)) {
            print_status_error(err, "open", s);
            return s.domain == StatusDomain::Config ? kExitUsage : kExitFailure;
        }

        int rc = kExitUsage;
        switch (command->id) {
            case CommandId::Put:
                rc = handle_put(center, rest, out, err);
                break;
            case CommandId::Get:
                rc = handle_get(center, rest, out, err);
                break;
            case CommandId::Stat:
                rc = handle_stat(center, rest, out, err);
                break;
            case CommandId::Rm:
                rc = handle_rm(center, rest, err);
                break;
            case CommandId::Token:
                rc = handle_token(center, rest, out, err);
                break;
            case CommandId::Id:
                rc = handle_id(center, rest, out, err);
                break;
            case CommandId::Gc:
                rc = handle_gc(center, rest, out, err);
                break;
            case CommandId::Threshold:
                rc = handle_threshold(center, rest, out, err);
                break;
            case CommandId::Help:
            case CommandId::None:
                break;
        }

        s = center.close();
        if (!filecenter::core::is_ok(s)) {
            print_status_error(err, "close", s);
            if (rc == kExitOk) {
                rc = kExitFailure;
            }
        }
        return rc;
    }
} // namespace filecenter::cli
