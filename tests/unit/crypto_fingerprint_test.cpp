#include "common/crypto.hpp"
#include "core/token/fingerprint.hpp"

#include <gtest/gtest.h>

#include <set>

using guard::core::FingerprintGenerator;

TEST(CryptoTest, Sha256KnownVector) {
    EXPECT_EQ(guard::common::Sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(guard::common::Sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptoTest, RandomHexLengthAndUniqueness) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        auto value = guard::common::RandomHex(32);
        ASSERT_TRUE(value.IsOk()) << value.GetStatus().Message();
        ASSERT_EQ(value.Value().size(), 64u);
        EXPECT_EQ(value.Value().find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(value.Value());
    }
    EXPECT_EQ(seen.size(), 64u);
}

TEST(CryptoTest, ConstantTimeEquals) {
    EXPECT_TRUE(guard::common::ConstantTimeEquals("abc", "abc"));
    EXPECT_FALSE(guard::common::ConstantTimeEquals("abc", "abd"));
    EXPECT_FALSE(guard::common::ConstantTimeEquals("abc", "abcd"));
    EXPECT_TRUE(guard::common::ConstantTimeEquals("", ""));
}

TEST(FingerprintTest, DeterministicHex) {
    FingerprintGenerator generator("salt");
    auto a = generator.Fingerprint("Mozilla/5.0", "10.0.0.1");
    auto b = generator.Fingerprint("Mozilla/5.0", "10.0.0.1");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a, guard::common::Sha256Hex("Mozilla/5.0|10.0.0.1|salt"));
}

TEST(FingerprintTest, SensitiveToEveryInput) {
    FingerprintGenerator generator("salt");
    const auto base = generator.Fingerprint("ua", "1.1.1.1");
    EXPECT_NE(base, generator.Fingerprint("ua2", "1.1.1.1"));
    EXPECT_NE(base, generator.Fingerprint("ua", "1.1.1.2"));
    EXPECT_NE(base, FingerprintGenerator("other").Fingerprint("ua", "1.1.1.1"));
}

TEST(FingerprintTest, Matches) {
    FingerprintGenerator generator("salt");
    const auto fp = generator.Fingerprint("ua", "1.1.1.1");
    EXPECT_TRUE(generator.Matches(fp, "ua", "1.1.1.1"));
    EXPECT_FALSE(generator.Matches(fp, "ua", "2.2.2.2"));
    EXPECT_FALSE(generator.Matches("", "ua", "1.1.1.1"));
}

TEST(FingerprintTest, MaskKeepsPrefix) {
    EXPECT_EQ(FingerprintGenerator::Mask("0123456789abcdef"), "01234567...");
    EXPECT_EQ(FingerprintGenerator::Mask("short"), "short");
}
