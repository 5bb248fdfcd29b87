#pragma once

#include <mutex>

#include <sqlite3.h>

#include "filecenter/core/errors.hpp"
#include "filecenter/db/db.hpp"

namespace filecenter::db::detail {

    struct DbSlot {
        sqlite3* conn{nullptr};
        u32 generation{0};
        // Recursive so a transaction can hold the slot while its own
        // statements lock it again.
        std::recursive_mutex mutex;
    };

    // Locks the slot behind `db` and returns it. On success the caller owns
    // slot->mutex and must release it (std::adopt_lock).
    filecenter::core::Status slot_acquire(DbHandle db, DbSlot** out) noexcept;

    // Maps a sqlite result code onto the store error model: constraint
    // violations become Conflict, corruption Inconsistent, everything else
    // Unavailable with the extended code in aux.
    filecenter::core::Status sqlite_status(sqlite3* conn, int rc) noexcept;

    filecenter::core::Status exec(sqlite3* conn, const char* sql) noexcept;

} // namespace filecenter::db::detail
