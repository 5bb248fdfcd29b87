#include <cstdlib>
#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include "filecenter/core/config.hpp"

using namespace filecenter::core;

namespace {
// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() {
        ::unsetenv(name_.c_str());
    }
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string name_;
};

FileCenterConfig keyed() {
    FileCenterConfig cfg{};
    cfg.codec_key = "k";
    return cfg;
}
} // namespace

TEST(Config, DefaultsNeedOnlyAKey) {
    FileCenterConfig cfg{};
    EXPECT_EQ(cfg.file_size_threshold, 262144u);
    EXPECT_EQ(cfg.temporary_lifetime_ms, 60000);
    EXPECT_EQ(config_validate(cfg).code, StatusCode::Invalid);
    EXPECT_TRUE(is_ok(config_validate(keyed())));
}

TEST(Config, ThresholdBounds) {
    FileCenterConfig cfg = keyed();
    cfg.file_size_threshold = 0;
    EXPECT_EQ(config_validate(cfg).code, StatusCode::Invalid);
    cfg.file_size_threshold = kMaxFileSizeThreshold;
    EXPECT_TRUE(is_ok(config_validate(cfg)));
    cfg.file_size_threshold = kMaxFileSizeThreshold + 1;
    const Status s = config_validate(cfg);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Config);
}

TEST(Config, LifetimeMustBePositive) {
    FileCenterConfig cfg = keyed();
    cfg.temporary_lifetime_ms = 0;
    EXPECT_EQ(config_validate(cfg).code, StatusCode::Invalid);
}

TEST(Config, EmptyKeyIsRejected) {
    FileCenterConfig cfg{};
    cfg.codec_key = "";
    EXPECT_EQ(config_validate(cfg).code, StatusCode::Invalid);
}

TEST(Config, EnvironmentOverlay) {
    EnvGuard path("FILECENTER_DB_PATH", "/tmp/x.db");
    EnvGuard key("FILECENTER_CODEC_KEY", "from-env");
    EnvGuard threshold("FILECENTER_FILE_SIZE_THRESHOLD", "1024");
    EnvGuard lifetime("FILECENTER_TEMPORARY_LIFETIME_MS", "250");

    FileCenterConfig cfg{};
    ASSERT_TRUE(is_ok(config_from_env(&cfg)));
    EXPECT_STREQ(cfg.db_path, "/tmp/x.db");
    EXPECT_STREQ(cfg.codec_key, "from-env");
    EXPECT_EQ(cfg.file_size_threshold, 1024u);
    EXPECT_EQ(cfg.temporary_lifetime_ms, 250);
    EXPECT_EQ(cfg.chunk_size, kDefaultChunkSize);
    EXPECT_TRUE(is_ok(config_validate(cfg)));
}

TEST(Config, MalformedEnvironmentNumberIsRejected) {
    EnvGuard threshold("FILECENTER_FILE_SIZE_THRESHOLD", "12kb");
    FileCenterConfig cfg{};
    const Status s = config_from_env(&cfg);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Config);
}

TEST(Config, UnsetEnvironmentLeavesConfigAlone) {
    FileCenterConfig cfg = keyed();
    cfg.file_size_threshold = 77;
    ASSERT_TRUE(is_ok(config_from_env(&cfg)));
    EXPECT_EQ(cfg.file_size_threshold, 77u);
    EXPECT_STREQ(cfg.codec_key, "k");
}

TEST(Config, ParseU64AcceptsDigitsOnly) {
    u64 v = 7;
    EXPECT_TRUE(parse_u64("0", &v));
    EXPECT_EQ(v, 0u);
    EXPECT_TRUE(parse_u64("18446744073709551615", &v));
    EXPECT_EQ(v, 18446744073709551615ull);

    v = 7;
    EXPECT_FALSE(parse_u64("", &v));
    EXPECT_FALSE(parse_u64("-1", &v));
    EXPECT_FALSE(parse_u64("+1", &v));
    EXPECT_FALSE(parse_u64(" 1", &v));
    EXPECT_FALSE(parse_u64("12k", &v));
    EXPECT_FALSE(parse_u64("18446744073709551616", &v));
    EXPECT_FALSE(parse_u64(nullptr, &v));
    EXPECT_EQ(v, 7u);
}

TEST(Config, SpoolDirFromEnv) {
    EnvGuard dir("FILECENTER_SPOOL_DIR", "/var/tmp/filecenter");
    FileCenterConfig cfg = keyed();
    ASSERT_TRUE(is_ok(config_from_env(&cfg)));
    ASSERT_NE(cfg.spool_dir, nullptr);
    EXPECT_STREQ(cfg.spool_dir, "/var/tmp/filecenter");
}

TEST(Config, EffectiveChunkBytesNeverExceedsThreshold) {
    EXPECT_EQ(effective_chunk_bytes(100, 10), 10u);
    EXPECT_EQ(effective_chunk_bytes(8, 10), 8u);
    FileCenterConfig cfg = keyed();
    cfg.file_size_threshold = 4096;
    cfg.chunk_size = 1024;
    EXPECT_EQ(effective_chunk_bytes(cfg), 1024u);
}
