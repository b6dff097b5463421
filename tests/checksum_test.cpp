#include "packfetch/checksum.hpp"

#include "test_support.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

using namespace packfetch;
using namespace packfetch::test;

TEST(ChecksumTest, HashesFileContents) {
    TempDir dir;
    const auto path = dir / "abc.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    EXPECT_EQ(sha256File(path), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChecksumTest, EmptyFileHasTheEmptyDigest) {
    TempDir dir;
    const auto path = dir / "empty.bin";
    writeFile(path, 0);
    EXPECT_EQ(sha256File(path), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(ChecksumTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW((void)sha256File(dir / "absent"), std::runtime_error);
}
