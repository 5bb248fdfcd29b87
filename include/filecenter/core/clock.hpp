#pragma once

#include "filecenter/core/types.hpp"

namespace filecenter::core {
    // Wall clock in milliseconds; the default ClockFn.
    [[nodiscard]] Timestamp system_now_ms() noexcept;

    [[nodiscard]] inline Timestamp clock_now(ClockFn clock) noexcept {
        return clock != nullptr ? clock() : system_now_ms();
    }
} // namespace filecenter::core
