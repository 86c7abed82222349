#include "turbofetch/digest.hpp"

#include "test_support.hpp"

#include <fstream>

#include <gtest/gtest.h>

using turbofetch::hashBytes;
using turbofetch::hashFile;

TEST(Digest, KnownVectors) {
    EXPECT_EQ(hashBytes("abc", "md5"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hashBytes("abc", "sha1"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(hashBytes("abc", "sha256"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hashBytes("abc", "sha3_256"),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
    EXPECT_EQ(hashBytes("abc", "blake2s"),
              "508c5e8c327c14e2e1a72ba34eeb452f37458b209ed63a294d999b4c86675982");
}

TEST(Digest, ExtendableOutputLength) {
    EXPECT_EQ(hashBytes("", "shake_128", 32),
              "7f9c2ba4e88f827d616045507605853ed73b8093f6efbc88eb1a6eacfa66ef26");
    EXPECT_EQ(hashBytes("", "shake_128"), "7f9c2ba4e88f827d616045507605853e");
}

TEST(Digest, EveryAdvertisedTypeWorks) {
    for (const auto& type : turbofetch::supportedHashTypes()) {
        SCOPED_TRACE(type);
        const std::string hex = hashBytes("turbofetch", type);
        EXPECT_FALSE(hex.empty());
        EXPECT_EQ(hex.size() % 2, 0u);
        EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
    }
}

TEST(Digest, FileHashMatchesInMemoryHash) {
    turbofetch::testing::TempDir dir;
    const auto path = dir / "payload.bin";
    const std::string data = turbofetch::testing::makePattern(3 * 1024 * 1024 + 5);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
    EXPECT_EQ(hashFile(path.string(), "sha512"), hashBytes(data, "sha512"));
    EXPECT_EQ(hashFile(path.string(), "blake2b"), hashBytes(data, "blake2b"));
}

TEST(Digest, UnknownTypeIsInvalidArgument) {
    EXPECT_FALSE(turbofetch::isSupportedHashType("crc32"));
    EXPECT_THROW(static_cast<void>(hashBytes("abc", "crc32")), turbofetch::InvalidArgumentError);
}

TEST(Digest, MissingFileIsAnError) {
    turbofetch::testing::TempDir dir;
    EXPECT_THROW(static_cast<void>(hashFile((dir / "absent").string(), "md5")), turbofetch::Error);
}
