#include "filecenter/core/errors.hpp"

namespace filecenter::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::InvalidToken: return "InvalidToken";
            case StatusCode::TooLarge: return "TooLarge";
            case StatusCode::Inconsistent: return "Inconsistent";
            case StatusCode::Io: return "Io";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::Unsupported: return "Unsupported";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Db: return "Db";
            case StatusDomain::Security: return "Security";
            case StatusDomain::Center: return "Center";
            case StatusDomain::Config: return "Config";
            case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }
} // namespace filecenter::core
