#include "syncmd/core/digest.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using syncmd::test_support::create_temp_dir;
using syncmd::test_support::write_file;

TEST(DigestTest, KnownSha256Vectors) {
    EXPECT_EQ(syncmd::sha256_hex(std::string{}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(syncmd::sha256_hex(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, ByteAndStringOverloadsAgree) {
    const std::string text = "chunk payload";
    const std::vector<std::uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(syncmd::sha256_hex(bytes), syncmd::sha256_hex(text));
    EXPECT_EQ(syncmd::sha256_hex(bytes.data(), bytes.size()), syncmd::sha256_hex(text));
}

TEST(DigestTest, FileDigestMatchesContentDigest) {
    const auto dir = create_temp_dir("syncmd_digest");
    const std::string content(200000, 'x');
    write_file(dir / "big.txt", content);

    auto digest = syncmd::sha256_file(dir / "big.txt");
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), syncmd::sha256_hex(content));
    EXPECT_TRUE(syncmd::is_digest_hex(digest.value()));

    fs::remove_all(dir);
}

TEST(DigestTest, MissingFileIsIoError) {
    auto digest = syncmd::sha256_file("/nonexistent/syncmd/file.md");
    ASSERT_TRUE(digest.is_error());
    EXPECT_EQ(digest.error().kind, syncmd::ErrorKind::Io);
}

TEST(DigestTest, IsDigestHex) {
    EXPECT_TRUE(syncmd::is_digest_hex(std::string(64, 'a')));
    EXPECT_FALSE(syncmd::is_digest_hex(std::string(63, 'a')));
    EXPECT_FALSE(syncmd::is_digest_hex(std::string(64, 'g')));
}

TEST(DigestTest, HexDecodeRejectsMalformedInput) {
    auto odd = syncmd::hex_decode("abc");
    ASSERT_TRUE(odd.is_error());
    EXPECT_EQ(odd.error().kind, syncmd::ErrorKind::Serialization);

    auto garbage = syncmd::hex_decode("zz");
    ASSERT_TRUE(garbage.is_error());

    auto upper = syncmd::hex_decode("00FF7a");
    ASSERT_TRUE(upper.is_ok());
    EXPECT_EQ(upper.value(), (std::vector<std::uint8_t>{0x00, 0xff, 0x7a}));
    EXPECT_EQ(syncmd::hex_encode(upper.value()), "00ff7a");
}

TEST(DigestTest, RandomIdsAreUniqueAndPrefixed) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(syncmd::random_id("syncmd_"));
    }
    EXPECT_EQ(ids.size(), 100u);
    EXPECT_EQ(ids.begin()->rfind("syncmd_", 0), 0u);
}
