#include "turbofetch/options.hpp"

#include "turbofetch/errors.hpp"

#include <gtest/gtest.h>

using turbofetch::ConnectionCount;
using turbofetch::DownloadOptions;
using turbofetch::DownloadRequest;
using turbofetch::InvalidArgumentError;

TEST(Options, DefaultsAreValid) {
    DownloadOptions options;
    EXPECT_NO_THROW(options.validate());
    EXPECT_TRUE(options.max_connections.isAuto());
    EXPECT_DOUBLE_EQ(options.connection_speed_mbps, 80.0);
    EXPECT_TRUE(options.overwrite);
    EXPECT_FALSE(options.timeout_seconds.has_value());

    DownloadRequest request;
    EXPECT_NO_THROW(request.validate());
    EXPECT_EQ(request.use_ram_buffer, turbofetch::WriteMode::Auto);
    EXPECT_EQ(request.hash_type, "md5");
}

TEST(Options, ConnectionCountBounds) {
    DownloadOptions options;
    options.max_connections = ConnectionCount::fixed(0);
    EXPECT_THROW(options.validate(), InvalidArgumentError);
    options.max_connections = ConnectionCount::fixed(33);
    EXPECT_THROW(options.validate(), InvalidArgumentError);
    options.max_connections = ConnectionCount::fixed(32);
    EXPECT_NO_THROW(options.validate());
    options.max_connections = ConnectionCount::fixed(1);
    EXPECT_NO_THROW(options.validate());
}

TEST(Options, SpeedAndTimeoutMustBePositive) {
    DownloadOptions options;
    options.connection_speed_mbps = 0.0;
    EXPECT_THROW(options.validate(), InvalidArgumentError);
    options.connection_speed_mbps = -5.0;
    EXPECT_THROW(options.validate(), InvalidArgumentError);

    options.connection_speed_mbps = 10.0;
    options.timeout_seconds = 0L;
    EXPECT_THROW(options.validate(), InvalidArgumentError);
}

TEST(Options, RequestRejectsUnknownHashTypeAndNonHexDigest) {
    DownloadRequest request;
    request.hash_type = "crc32";
    EXPECT_THROW(request.validate(), InvalidArgumentError);

    request.hash_type = "sha256";
    request.expected_hash = "not-hex";
    EXPECT_THROW(request.validate(), InvalidArgumentError);
    request.expected_hash = "ABCDEF01";
    EXPECT_NO_THROW(request.validate());
}

TEST(Headers, CanonicalNames) {
    EXPECT_EQ(turbofetch::canonicalHeaderName("x-api-key"), "X-Api-Key");
    EXPECT_EQ(turbofetch::canonicalHeaderName("ACCEPT-encoding"), "Accept-Encoding");
    EXPECT_EQ(turbofetch::canonicalHeaderName("user_agent"), "User_Agent");
}

TEST(Headers, CustomHeadersMergeButCannotOverrideEngineHeaders) {
    const auto headers = turbofetch::buildRequestHeaders({
        {"authorization", "Bearer t"},
        {"user-agent", "custom/1.0"},
        {"accept-encoding", "gzip"},
        {"RANGE", "bytes=0-1"},
        {"connection", "close"},
    });

    EXPECT_EQ(headers.at("Authorization"), "Bearer t");
    EXPECT_EQ(headers.at("User-Agent"), "custom/1.0");
    EXPECT_EQ(headers.at("Accept-Encoding"), "identity");
    EXPECT_EQ(headers.at("Connection"), "keep-alive");
    EXPECT_EQ(headers.at("Accept"), "*/*");
    EXPECT_EQ(headers.count("Range"), 0u);
}
