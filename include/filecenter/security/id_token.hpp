#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/security/kdf.hpp"

namespace filecenter::security {

    // Tokens are url-safe unpadded base64 of iv(16) || ciphertext(8).
    constexpr std::size_t kIdTokenIvBytes = 16;
    constexpr std::size_t kIdTokenIdBytes = 8;
    constexpr std::size_t kIdTokenChars = 32;

    // Process-wide token keys, fixed at startup. Changing the codec key
    // invalidates every token issued under the old one.
    struct IdTokenKeys {
        Key256 cipher{};
        Key256 iv{};
        bool ready{false};
    };

    filecenter::core::Status id_token_keys_init(std::string_view codec_key, IdTokenKeys* out) noexcept;

    // Zeroes key material.
    void id_token_keys_wipe(IdTokenKeys* keys) noexcept;

    // Deterministic: the same id always yields the same token.
    filecenter::core::Status id_token_encrypt(const IdTokenKeys& keys,
        filecenter::core::FileId id,
        std::string* out) noexcept;

    // Every rejection (length, alphabet, integrity) is the same InvalidToken.
    filecenter::core::Status id_token_decrypt(const IdTokenKeys& keys,
        std::string_view token,
        filecenter::core::FileId* out) noexcept;

    static_assert(std::is_trivially_copyable_v<IdTokenKeys>);
    static_assert(std::is_standard_layout_v<IdTokenKeys>);

} // namespace filecenter::security
