#include "ulidgen/base32.h"
#include "ulidgen/errors.h"
#include "ulidgen/types.h"
#include <vector>

namespace ulidgen {

constexpr char Base32::ENCODING_CHARS[];

std::string Base32::EncodeInteger(uint64_t value, size_t width) {
    std::string result(width, ENCODING_CHARS[0]);

    for (size_t i = width; i > 0; --i) {
        result[i - 1] = ENCODING_CHARS[value % ENCODING_LENGTH];
        value /= ENCODING_LENGTH;
    }

    return result;
}

std::string Base32::EncodeRandom(size_t length, IRandomSource& random) {
    std::vector<uint8_t> bytes(length);
    if (length > 0) {
        random.Fill(bytes.data(), length);
    }

    std::string result;
    result.reserve(length);
    for (uint8_t byte : bytes) {
        result.push_back(ENCODING_CHARS[ByteToIndex(byte)]);
    }
    return result;
}

char Base32::RandomChar(IRandomSource& random) {
    uint8_t byte = 0;
    random.Fill(&byte, 1);
    return ENCODING_CHARS[ByteToIndex(byte)];
}

uint64_t Base32::DecodeInteger(const std::string& str) {
    if (str.length() > MAX_DECODE_LENGTH) {
        throw LengthException("cannot decode more than " +
                              std::to_string(MAX_DECODE_LENGTH) +
                              " characters into 64 bits: " + str);
    }

    uint64_t result = 0;
    for (char c : str) {
        int index = IndexOf(c);
        if (index < 0) {
            throw DecodeException(c);
        }
        result = result * ENCODING_LENGTH + static_cast<uint64_t>(index);
    }

    return result;
}

std::string Base32::Increment(const std::string& str) {
    if (str.empty() || str.length() > RANDOM_LENGTH) {
        throw LengthException("expected 1 to " + std::to_string(RANDOM_LENGTH) +
                              " characters, got " + std::to_string(str.length()));
    }

    // 자리올림이 닿지 않는 문자도 모두 검증
    for (char c : str) {
        if (IndexOf(c) < 0) {
            throw DecodeException(c);
        }
    }

    std::string output = str;
    const int max_index = static_cast<int>(ENCODING_LENGTH) - 1;

    for (size_t i = output.length(); i > 0; --i) {
        int index = IndexOf(output[i - 1]);
        if (index == max_index) {
            output[i - 1] = ENCODING_CHARS[0];
            continue;
        }
        output[i - 1] = ENCODING_CHARS[index + 1];
        return output;
    }

    throw OverflowException(str);
}

int Base32::IndexOf(char c) {
    for (size_t i = 0; i < ENCODING_LENGTH; ++i) {
        if (ENCODING_CHARS[i] == c) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool Base32::IsValid(const std::string& str) {
    for (char c : str) {
        if (IndexOf(c) < 0) {
            return false;
        }
    }
    return true;
}

uint8_t Base32::ByteToIndex(uint8_t byte) {
    // floor(byte / 255 * 32), 255만 32가 되므로 마지막 기호로 고정
    unsigned index = (static_cast<unsigned>(byte) * ENCODING_LENGTH) / 0xFF;
    if (index == ENCODING_LENGTH) {
        index = ENCODING_LENGTH - 1;
    }
    return static_cast<uint8_t>(index);
}

} // namespace ulidgen
