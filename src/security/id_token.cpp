#include "filecenter/security/id_token.hpp"

#include <cstring>

#include <blake3.h>
#include <sodium.h>

namespace filecenter::security {
    namespace {
        constexpr char kIvLabel[] = "filecenter.id_token.iv.v1";
        constexpr int kB64Variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

        filecenter::core::Status invalid_token() noexcept {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Security, filecenter::core::StatusCode::InvalidToken);
        }

        filecenter::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return filecenter::core::make_status(filecenter::core::StatusDomain::Security, filecenter::core::StatusCode::Unavailable);
            }
            return filecenter::core::ok_status();
        }

        void id_to_be(filecenter::core::u64 v, u8 out[kIdTokenIdBytes]) noexcept {
            for (std::size_t i = 0; i < kIdTokenIdBytes; ++i) {
                out[i] = static_cast<u8>((v >> (8 * (kIdTokenIdBytes - 1 - i))) & 0xffu);
            }
        }

        filecenter::core::u64 id_from_be(const u8 in[kIdTokenIdBytes]) noexcept {
            filecenter::core::u64 v = 0;
            for (std::size_t i = 0; i < kIdTokenIdBytes; ++i) {
                v = (v << 8) | in[i];
            }
            return v;
        }

        // Synthetic IV: keyed BLAKE3 over the plaintext id.
        void derive_iv(const Key256& iv_key, const u8 id_be[kIdTokenIdBytes], u8 iv[kIdTokenIvBytes]) noexcept {
            blake3_hasher h;
            blake3_hasher_init_keyed(&h, iv_key.b);
            blake3_hasher_update(&h, kIvLabel, sizeof(kIvLabel) - 1);
            blake3_hasher_update(&h, id_be, kIdTokenIdBytes);
            blake3_hasher_finalize(&h, iv, kIdTokenIvBytes);
        }

        void xor_stream(const Key256& cipher_key, const u8 iv[kIdTokenIvBytes], const u8* in, u8* out) noexcept {
            u8 nonce[crypto_stream_xchacha20_NONCEBYTES]{};
            std::memcpy(nonce, iv, kIdTokenIvBytes);
            crypto_stream_xchacha20_xor(out, in, kIdTokenIdBytes, nonce, cipher_key.b);
        }
    } // namespace

    filecenter::core::Status id_token_keys_init(std::string_view codec_key, IdTokenKeys* out) noexcept {
        if (out == nullptr || codec_key.empty()) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Security, filecenter::core::StatusCode::Invalid);
        }
        const filecenter::core::Status init = ensure_sodium();
        if (!filecenter::core::is_ok(init)) {
            return init;
        }

        const BufferView secret{reinterpret_cast<const u8*>(codec_key.data()), codec_key.size()};
        IdTokenKeys keys{};
        filecenter::core::Status s = kdf_derive_key(secret, KdfPurpose::TokenCipher, &keys.cipher);
        if (!filecenter::core::is_ok(s)) {
            return s;
        }
        s = kdf_derive_key(secret, KdfPurpose::TokenIv, &keys.iv);
        if (!filecenter::core::is_ok(s)) {
            sodium_memzero(&keys, sizeof(keys));
            return s;
        }
        keys.ready = true;
        *out = keys;
        sodium_memzero(&keys, sizeof(keys));
        return filecenter::core::ok_status();
    }

    void id_token_keys_wipe(IdTokenKeys* keys) noexcept {
        if (keys != nullptr) {
            sodium_memzero(keys, sizeof(*keys));
        }
    }

    filecenter::core::Status id_token_encrypt(const IdTokenKeys& keys,
        filecenter::core::FileId id,
        std::string* out) noexcept {
        if (out == nullptr || !keys.ready || !id.is_valid()) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Security, filecenter::core::StatusCode::Invalid);
        }

        u8 plain[kIdTokenIdBytes];
        id_to_be(id.v, plain);

        u8 raw[kIdTokenIvBytes + kIdTokenIdBytes];
        derive_iv(keys.iv, plain, raw);
        xor_stream(keys.cipher, raw, plain, raw + kIdTokenIvBytes);

        char encoded[sodium_base64_ENCODED_LEN(sizeof(raw), sodium_base64_VARIANT_URLSAFE_NO_PADDING)];
        sodium_bin2base64(encoded, sizeof(encoded), raw, sizeof(raw), kB64Variant);
        out->assign(encoded, kIdTokenChars);
        return filecenter::core::ok_status();
    }

    filecenter::core::Status id_token_decrypt(const IdTokenKeys& keys,
        std::string_view token,
        filecenter::core::FileId* out) noexcept {
        if (out == nullptr || !keys.ready) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Security, filecenter::core::StatusCode::Invalid);
        }
        if (token.size() != kIdTokenChars) {
            return invalid_token();
        }

        u8 raw[kIdTokenIvBytes + kIdTokenIdBytes];
        std::size_t raw_len = 0;
        const char* end = nullptr;
        const int rc = sodium_base642bin(raw, sizeof(raw), token.data(), token.size(),
            nullptr, &raw_len, &end, kB64Variant);
        if (rc != 0 || raw_len != sizeof(raw) || end != token.data() + token.size()) {
            return invalid_token();
        }

        u8 plain[kIdTokenIdBytes];
        xor_stream(keys.cipher, raw, raw + kIdTokenIvBytes, plain);

        u8 iv[kIdTokenIvBytes];
        derive_iv(keys.iv, plain, iv);
        if (sodium_memcmp(iv, raw, kIdTokenIvBytes) != 0) {
            return invalid_token();
        }

        const filecenter::core::FileId id{id_from_be(plain)};
        if (!id.is_valid()) {
            return invalid_token();
        }
        *out = id;
        return filecenter::core::ok_status();
    }
} // namespace filecenter::security
