#include <gtest/gtest.h>

#include "sift/digest.h"
#include "test_support.h"

#include <stop_token>

using namespace sift;
using sift::testing::ScratchDirTest;

TEST(DigestBytesTest, KnownVectors) {
    EXPECT_EQ(DigestBytes("", DigestAlgorithm::Md5), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(DigestBytes("abc", DigestAlgorithm::Md5), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(DigestBytes("abc", DigestAlgorithm::Sha1), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(DigestBytes("abc", DigestAlgorithm::Sha256),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestBytesTest, AlgorithmNames) {
    EXPECT_EQ(ToString(DigestAlgorithm::Sha1), "sha1");
    EXPECT_EQ(ParseAlgorithm("SHA256"), DigestAlgorithm::Sha256);
    EXPECT_EQ(ParseAlgorithm("md5"), DigestAlgorithm::Md5);
    EXPECT_FALSE(ParseAlgorithm("crc32").has_value());
}

class DigestFileTest : public ScratchDirTest {};

TEST_F(DigestFileTest, MatchesInMemoryDigest) {
    auto file = WriteFile("abc.txt", "abc");
    EXPECT_EQ(Digest(file), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(Digest(file, DigestAlgorithm::Sha256),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(DigestFileTest, ChunkSizeDoesNotChangeTheResult) {
    std::string content;
    for (int i = 0; i < 10000; ++i) {
        content += static_cast<char>('a' + i % 26);
    }
    auto file = WriteFile("data.bin", content);
    const auto expected = DigestBytes(content, DigestAlgorithm::Sha1);
    EXPECT_EQ(Digest(file, DigestAlgorithm::Sha1, 7), expected);
    EXPECT_EQ(Digest(file, DigestAlgorithm::Sha1, 4096), expected);
    EXPECT_EQ(Digest(file, DigestAlgorithm::Sha1, kDefaultChunkSize), expected);
}

TEST_F(DigestFileTest, DiffersWhenOneByteDiffers) {
    auto a = WriteFile("a.bin", std::string(500, 'x'));
    auto b = WriteFile("b.bin", std::string(499, 'x') + "y");
    ASSERT_TRUE(Digest(a).has_value());
    EXPECT_NE(Digest(a), Digest(b));
    EXPECT_EQ(Digest(a), Digest(a));
}

TEST_F(DigestFileTest, UnreadableInputsGiveNothing) {
    EXPECT_FALSE(Digest(root_ / "missing.bin").has_value());
    EXPECT_FALSE(Digest(MakeDir("dir")).has_value());
}

TEST_F(DigestFileTest, StopRequestAbandonsTheDigest) {
    auto file = WriteFile("big.bin", std::string(256 * 1024, 'z'));
    std::stop_source source;
    source.request_stop();
    EXPECT_FALSE(Digest(file, DigestAlgorithm::Md5, 1024, source.get_token()).has_value());
}
