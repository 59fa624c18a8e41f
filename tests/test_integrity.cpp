#include <gtest/gtest.h>
#include <cctype>
#include <transfer/integrity.hpp>
#include "fake_transport.hpp"

static const std::string kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
static const std::string kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

TEST(Integrity, Sha256OfKnownVectors) {
    EXPECT_EQ(sha256_hex("abc"), kAbcDigest);
    EXPECT_EQ(sha256_hex(""), kEmptyDigest);
}

TEST(Integrity, LocalFileDigestMatchesInMemoryDigest) {
    MemoryStorage storage;
    std::string big(300 * 1024, 'q');
    big += "tail";
    storage.put_file("/data/big.bin", big);

    auto r = sha256_local(storage, "/data/big.bin");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value, sha256_hex(big));
}

TEST(Integrity, MissingLocalFileIsAnError) {
    MemoryStorage storage;
    auto r = sha256_local(storage, "/nope");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::TransferIoError);
}

TEST(Integrity, ParsesSha256sumOutput) {
    auto d = parse_sha256_output(kAbcDigest + "  /srv/file.txt\n");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, kAbcDigest);
}

TEST(Integrity, ParsesEscapedAndUppercaseOutput) {
    std::string upper = kAbcDigest;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    auto d = parse_sha256_output("\\" + upper + "  /srv/odd\\nname\n");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, kAbcDigest);
}

TEST(Integrity, RejectsGarbage) {
    EXPECT_FALSE(parse_sha256_output("").has_value());
    EXPECT_FALSE(parse_sha256_output("sha256sum: x: No such file or directory\n").has_value());
    EXPECT_FALSE(parse_sha256_output(kAbcDigest.substr(0, 40)).has_value());
    EXPECT_FALSE(parse_sha256_output(kAbcDigest + "ff  /too/long").has_value());
}
