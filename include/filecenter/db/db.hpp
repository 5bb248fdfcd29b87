#pragma once

#include <type_traits>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/db/schema.hpp"

namespace filecenter::db {
    using u32 = filecenter::core::u32;

    constexpr u32 kMaxDbHandles = 64;
    constexpr u32 kDefaultBusyTimeoutMs = 5000;

    struct DbConfig {
        const char* path{":memory:"};
        u32 busy_timeout_ms{kDefaultBusyTimeoutMs};
    };

    // One sqlite connection. Statements issued through a handle are
    // serialized; a transaction owns the handle until commit or rollback.
    struct DbHandle {
        u32 id{0};
    };

    struct DbTxn {
        u32 id{0};
    };

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle db) noexcept {
        return db.id != 0;
    }

    [[nodiscard]] constexpr bool db_txn_valid(DbTxn txn) noexcept {
        return txn.id != 0;
    }

    filecenter::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    filecenter::core::Status db_close(DbHandle db) noexcept;

    // BEGIN IMMEDIATE. Commit and rollback must run on the thread that
    // began the transaction.
    filecenter::core::Status db_txn_begin(DbHandle db, DbTxn* out) noexcept;
    filecenter::core::Status db_txn_commit(DbTxn txn) noexcept;
    filecenter::core::Status db_txn_rollback(DbTxn txn) noexcept;

    filecenter::core::Status db_settings_get(DbHandle db, SettingsRecord* out) noexcept;

    // Records `initial` unless a threshold is already stored, then reports
    // the stored one. The first store to open a database fixes its layout.
    filecenter::core::Status db_settings_init_threshold(DbHandle db, u32 initial, u32* out) noexcept;
    filecenter::core::Status db_settings_set_threshold(DbHandle db, u32 threshold) noexcept;

    // Drops every table. The handle stays open; reopening the path
    // recreates an empty store.
    filecenter::core::Status db_drop_schema(DbHandle db) noexcept;

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_trivially_copyable_v<DbTxn>);
    static_assert(std::is_standard_layout_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbTxn>);

} // namespace filecenter::db
