#include <cstring>
#include <string_view>

#include <gtest/gtest.h>

#include "filecenter/core/errors.hpp"
#include "filecenter/security/kdf.hpp"

namespace {
filecenter::security::BufferView view_of(std::string_view s) {
    return {reinterpret_cast<const filecenter::security::u8*>(s.data()), s.size()};
}

void expect_key_eq(const filecenter::security::Key256& a, const filecenter::security::Key256& b) {
    EXPECT_EQ(0, std::memcmp(a.b, b.b, 32));
}

void expect_key_ne(const filecenter::security::Key256& a, const filecenter::security::Key256& b) {
    EXPECT_NE(0, std::memcmp(a.b, b.b, 32));
}
} // namespace

TEST(SecurityKdf, RejectsNullOut) {
    const filecenter::core::Status s = filecenter::security::kdf_derive_key(
        view_of("secret"), filecenter::security::KdfPurpose::TokenCipher, nullptr);
    EXPECT_EQ(s.domain, filecenter::core::StatusDomain::Security);
    EXPECT_EQ(s.code, filecenter::core::StatusCode::Invalid);
}

TEST(SecurityKdf, RejectsEmptySecret) {
    filecenter::security::Key256 out{};
    const filecenter::core::Status s = filecenter::security::kdf_derive_key(
        filecenter::security::BufferView{nullptr, 0}, filecenter::security::KdfPurpose::TokenCipher, &out);
    EXPECT_EQ(s.code, filecenter::core::StatusCode::Invalid);
}

TEST(SecurityKdf, Deterministic) {
    filecenter::security::Key256 a{};
    filecenter::security::Key256 b{};
    ASSERT_TRUE(filecenter::core::is_ok(
        filecenter::security::kdf_derive_key(view_of("secret"), filecenter::security::KdfPurpose::TokenIv, &a)));
    ASSERT_TRUE(filecenter::core::is_ok(
        filecenter::security::kdf_derive_key(view_of("secret"), filecenter::security::KdfPurpose::TokenIv, &b)));
    expect_key_eq(a, b);
}

TEST(SecurityKdf, PurposesAreSeparated) {
    filecenter::security::Key256 cipher{};
    filecenter::security::Key256 iv{};
    ASSERT_TRUE(filecenter::core::is_ok(
        filecenter::security::kdf_derive_key(view_of("secret"), filecenter::security::KdfPurpose::TokenCipher, &cipher)));
    ASSERT_TRUE(filecenter::core::is_ok(
        filecenter::security::kdf_derive_key(view_of("secret"), filecenter::security::KdfPurpose::TokenIv, &iv)));
    expect_key_ne(cipher, iv);
    EXPECT_STRNE(filecenter::security::kdf_context(filecenter::security::KdfPurpose::TokenCipher),
                 filecenter::security::kdf_context(filecenter::security::KdfPurpose::TokenIv));
}

TEST(SecurityKdf, SecretsAreSeparated) {
    filecenter::security::Key256 a{};
    filecenter::security::Key256 b{};
    ASSERT_TRUE(filecenter::core::is_ok(
        filecenter::security::kdf_derive_key(view_of("secret-a"), filecenter::security::KdfPurpose::TokenCipher, &a)));
    ASSERT_TRUE(filecenter::core::is_ok(
        filecenter::security::kdf_derive_key(view_of("secret-b"), filecenter::security::KdfPurpose::TokenCipher, &b)));
    expect_key_ne(a, b);
}
