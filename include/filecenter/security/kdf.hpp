#pragma once

#include <type_traits>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/storage/buffer.hpp"

namespace filecenter::security {
    using u8 = filecenter::core::u8;
    using u32 = filecenter::core::u32;
    using filecenter::storage::BufferView;

    struct Key256 {
        u8 b[32]{};
    };

    // Each purpose gets its own BLAKE3 derive_key context, so keys for
    // different jobs never coincide even under one secret.
    enum class KdfPurpose : u8 {
        TokenCipher = 1,
        TokenIv = 2,
    };

    [[nodiscard]] const char* kdf_context(KdfPurpose purpose) noexcept;

    // Derives a 256-bit key from caller key material. Empty material is
    // rejected.
    filecenter::core::Status kdf_derive_key(BufferView secret,
        KdfPurpose purpose,
        Key256* out_key) noexcept;

    static_assert(std::is_trivially_copyable_v<Key256>);
    static_assert(std::is_standard_layout_v<Key256>);

} // namespace filecenter::security
