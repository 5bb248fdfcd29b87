#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace filecenter::core {

    // Borrowed key/value pair. Fields only live for the log statement that
    // names them.
    struct LogField {
        std::string_view key;
        std::string_view text;
        std::int64_t number{0};
        bool is_number{false};
    };

    constexpr LogField field_str(std::string_view key, std::string_view value) noexcept {
        return {key, value, 0, false};
    }

    constexpr LogField field_int(std::string_view key, std::int64_t value) noexcept {
        return {key, {}, value, true};
    }

    // Installs the "filecenter" stderr logger. `level` is an spdlog level
    // name; FILECENTER_LOG_LEVEL wins over it when set.
    void log_init(const char* level) noexcept;
    void log_shutdown() noexcept;

    [[nodiscard]] bool log_enabled(spdlog::level::level_enum level) noexcept;

    void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {}) noexcept;

} // namespace filecenter::core

// Fields are only evaluated when the level is enabled.
#define FILECENTER_LOG_AT(level, message, ...)                                      \
    do {                                                                            \
        if (::filecenter::core::log_enabled(level)) {                               \
            ::filecenter::core::log((level), (message) __VA_OPT__(, ) __VA_ARGS__);   \
        }                                                                           \
    } while (false)

#define FILECENTER_LOG_DEBUG(message, ...) FILECENTER_LOG_AT(spdlog::level::debug, message __VA_OPT__(, ) __VA_ARGS__)
#define FILECENTER_LOG_INFO(message, ...) FILECENTER_LOG_AT(spdlog::level::info, message __VA_OPT__(, ) __VA_ARGS__)
#define FILECENTER_LOG_WARN(message, ...) FILECENTER_LOG_AT(spdlog::level::warn, message __VA_OPT__(, ) __VA_ARGS__)
#define FILECENTER_LOG_ERROR(message, ...) FILECENTER_LOG_AT(spdlog::level::err, message __VA_OPT__(, ) __VA_ARGS__)
