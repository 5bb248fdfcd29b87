#include "filecenter/core/log.hpp"

#include <cstdlib>
#include <iterator>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace filecenter::core {
    namespace {
        constexpr const char* kLoggerName = "filecenter";
        constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

        void serialize_fields(std::initializer_list<LogField> fields, spdlog::memory_buf_t* out) {
            for (const auto& field : fields) {
                if (out->size() > 0) {
                    out->push_back(' ');
                }
                if (field.is_number) {
                    fmt::format_to(std::back_inserter(*out), "{}={}", field.key, field.number);
                } else {
                    fmt::format_to(std::back_inserter(*out), "{}={}", field.key, field.text);
                }
            }
        }
    } // namespace

    void log_init(const char* level) noexcept {
        const char* env_level = std::getenv("FILECENTER_LOG_LEVEL");
        if (env_level != nullptr && env_level[0] != '\0') {
            level = env_level;
        }

        auto logger = spdlog::get(kLoggerName);
        if (!logger) {
            logger = spdlog::stderr_color_mt(kLoggerName);
        }
        logger->set_pattern(kPattern);
        logger->set_level(spdlog::level::from_str(level != nullptr ? level : "info"));
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);
    }

    void log_shutdown() noexcept {
        spdlog::shutdown();
    }

    bool log_enabled(spdlog::level::level_enum level) noexcept {
        return spdlog::should_log(level);
    }

    void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) noexcept {
        if (!spdlog::should_log(level)) {
            return;
        }
        spdlog::memory_buf_t serialized;
        serialize_fields(fields, &serialized);
        if (serialized.size() == 0) {
            spdlog::log(level, "{}", message);
            return;
        }
        spdlog::log(level, "{} {}", message, std::string_view(serialized.data(), serialized.size()));
    }
} // namespace filecenter::core
