#include "filecenter/core/clock.hpp"

#include <chrono>

namespace filecenter::core {
    Timestamp system_now_ms() noexcept {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    }
} // namespace filecenter::core
