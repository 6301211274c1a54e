#include <gtest/gtest.h>
#include "ulidgen/base32.h"
#include "ulidgen/errors.h"
#include "ulidgen/openssl_random_source.h"
#include "ulidgen/types.h"
#include "test_utils.h"
#include <stdexcept>
#include <string>
#include <vector>

using namespace ulidgen;
using namespace ulidgen::test_utils;

TEST(Base32Test, EncodeIntegerPadsToWidth) {
    EXPECT_EQ(Base32::EncodeInteger(0, 10), "0000000000");
    EXPECT_EQ(Base32::EncodeInteger(31, 4), "000Z");
    EXPECT_EQ(Base32::EncodeInteger(32, 4), "0010");
    EXPECT_EQ(Base32::EncodeInteger(1469918176385ULL, 10), "01ARYZ6S41");
}

TEST(Base32Test, EncodeIntegerTruncatesWhenWidthTooSmall) {
    EXPECT_EQ(Base32::EncodeInteger(1470118279201ULL, 8), "AS4Y1E11");
    EXPECT_EQ(Base32::EncodeInteger(12345, 0), "");
}

TEST(Base32Test, DecodeInteger) {
    EXPECT_EQ(Base32::DecodeInteger(""), 0u);
    EXPECT_EQ(Base32::DecodeInteger("Z"), 31u);
    EXPECT_EQ(Base32::DecodeInteger("10"), 32u);
    EXPECT_EQ(Base32::DecodeInteger("01ARYZ6S41"), 1469918176385ULL);
    EXPECT_EQ(Base32::DecodeInteger("7ZZZZZZZZZ"), static_cast<uint64_t>(TIME_MAX));
}

TEST(Base32Test, DecodeIntegerInvertsEncodeInteger) {
    const uint64_t values[] = {0, 1, 31, 32, 1023, 164436145, 1469918176385ULL,
                               static_cast<uint64_t>(TIME_MAX)};
    for (uint64_t value : values) {
        EXPECT_EQ(Base32::DecodeInteger(Base32::EncodeInteger(value, TIMESTAMP_LENGTH)), value);
    }
}

TEST(Base32Test, DecodeIntegerRejectsInvalidCharacters) {
    // I, L, O, U는 알파벳에서 제외됨
    EXPECT_THROW(Base32::DecodeInteger("01ARYZ6S4I"), DecodeException);
    EXPECT_THROW(Base32::DecodeInteger("L"), DecodeException);
    EXPECT_THROW(Base32::DecodeInteger("O"), DecodeException);
    EXPECT_THROW(Base32::DecodeInteger("U"), DecodeException);
    EXPECT_THROW(Base32::DecodeInteger("abc"), DecodeException);

    try {
        Base32::DecodeInteger("00!0");
        FAIL() << "expected DecodeException";
    } catch (const DecodeException& e) {
        EXPECT_NE(std::string(e.what()).find('!'), std::string::npos);
    }
}

TEST(Base32Test, DecodeIntegerRejectsMoreThan64Bits) {
    EXPECT_NO_THROW(Base32::DecodeInteger(std::string(12, 'Z')));
    EXPECT_THROW(Base32::DecodeInteger(std::string(13, '0')), LengthException);
}

TEST(Base32Test, IncrementLastDigit) {
    EXPECT_EQ(Base32::Increment("0000000000000000"), "0000000000000001");
    EXPECT_EQ(Base32::Increment("0000000000000009"), "000000000000000A");
    EXPECT_EQ(Base32::Increment("000000000000000H"), "000000000000000J");
}

TEST(Base32Test, IncrementCarries) {
    EXPECT_EQ(Base32::Increment("000000000000000Z"), "0000000000000010");
    EXPECT_EQ(Base32::Increment("0ZZZZZZZZZZZZZZZ"), "1000000000000000");
    EXPECT_EQ(Base32::Increment("ZY"), "ZZ");
}

TEST(Base32Test, IncrementPreservesOrder) {
    std::string value = "00000000000000ZX";
    for (int i = 0; i < 100; ++i) {
        std::string next = Base32::Increment(value);
        EXPECT_EQ(next.length(), value.length());
        EXPECT_LT(value, next);
        EXPECT_EQ(Base32::DecodeInteger(next.substr(4)), Base32::DecodeInteger(value.substr(4)) + 1);
        value = next;
    }
}

TEST(Base32Test, IncrementOverflow) {
    EXPECT_THROW(Base32::Increment(std::string(RANDOM_LENGTH, 'Z')), OverflowException);
    EXPECT_THROW(Base32::Increment("Z"), OverflowException);
}

TEST(Base32Test, IncrementRejectsBadInput) {
    EXPECT_THROW(Base32::Increment(std::string(RANDOM_LENGTH + 1, '0')), LengthException);
    EXPECT_THROW(Base32::Increment(""), LengthException);
    // 자리올림이 닿지 않는 위치의 잘못된 문자도 거부
    EXPECT_THROW(Base32::Increment("U000000000000000"), DecodeException);
    EXPECT_THROW(Base32::Increment("000000000000000*"), DecodeException);
}

TEST(Base32Test, RandomCharMapsByteRange) {
    FixedRandomSource zero(0x00);
    FixedRandomSource max(0xFF);
    FixedRandomSource mid(0x80);

    EXPECT_EQ(Base32::RandomChar(zero), '0');
    EXPECT_EQ(Base32::RandomChar(max), 'Z');
    // floor(128 / 255 * 32) = 16
    EXPECT_EQ(Base32::RandomChar(mid), 'G');
}

TEST(Base32Test, RandomCharCoversWholeAlphabet) {
    std::vector<uint8_t> bytes;
    for (int b = 0; b <= 0xFF; ++b) {
        bytes.push_back(static_cast<uint8_t>(b));
    }
    SequenceRandomSource source(bytes);

    std::string seen;
    for (int i = 0; i <= 0xFF; ++i) {
        char c = Base32::RandomChar(source);
        ASSERT_GE(Base32::IndexOf(c), 0);
        if (seen.find(c) == std::string::npos) {
            seen.push_back(c);
        }
    }
    EXPECT_EQ(seen.length(), ENCODING_LENGTH);
}

TEST(Base32Test, EncodeRandomLength) {
    OpenSSLRandomSource random;
    EXPECT_EQ(Base32::EncodeRandom(12, random).length(), 12u);
    EXPECT_EQ(Base32::EncodeRandom(0, random), "");

    std::string value = Base32::EncodeRandom(RANDOM_LENGTH, random);
    EXPECT_EQ(value.length(), RANDOM_LENGTH);
    EXPECT_TRUE(Base32::IsValid(value));
}

TEST(Base32Test, EncodeRandomUsesOneBytePerCharacter) {
    SequenceRandomSource source({0x00, 0xFF, 0x08});
    // 0x08 -> floor(8 * 32 / 255) = 1
    EXPECT_EQ(Base32::EncodeRandom(6, source), "0Z10Z1");
}

TEST(Base32Test, SequenceSourceRequiresBytes) {
    EXPECT_THROW(SequenceRandomSource(std::vector<uint8_t>{}), std::invalid_argument);
}

TEST(Base32Test, IndexOf) {
    EXPECT_EQ(Base32::IndexOf('0'), 0);
    EXPECT_EQ(Base32::IndexOf('A'), 10);
    EXPECT_EQ(Base32::IndexOf('Z'), 31);
    EXPECT_EQ(Base32::IndexOf('I'), -1);
    EXPECT_EQ(Base32::IndexOf('a'), -1);
}
