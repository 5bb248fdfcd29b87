#include "filecenter/security/kdf.hpp"

#include <cstddef>

#include <blake3.h>

namespace filecenter::security {

    const char* kdf_context(KdfPurpose purpose) noexcept {
        switch (purpose) {
            case KdfPurpose::TokenCipher: return "filecenter 2024-06 id token cipher key v1";
            case KdfPurpose::TokenIv: return "filecenter 2024-06 id token iv key v1";
        }
        return nullptr;
    }

    filecenter::core::Status kdf_derive_key(BufferView secret,
        KdfPurpose purpose,
        Key256* out_key) noexcept {
        if (out_key == nullptr) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Security, filecenter::core::StatusCode::Invalid);
        }
        if (secret.len == 0 || !filecenter::storage::buffer_ok(secret)) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Security, filecenter::core::StatusCode::Invalid);
        }
        const char* context = kdf_context(purpose);
        if (context == nullptr) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Security, filecenter::core::StatusCode::Invalid);
        }

        blake3_hasher h;
        blake3_hasher_init_derive_key(&h, context);
        blake3_hasher_update(&h, secret.data, static_cast<size_t>(secret.len));
        blake3_hasher_finalize(&h, out_key->b, sizeof(out_key->b));
        return filecenter::core::ok_status();
    }
} // namespace filecenter::security
