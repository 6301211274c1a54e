#pragma once

#include <string>
#include <stdexcept>

namespace ulidgen {

/**
 * ulidgen 예외 기본 클래스
 */
class UlidException : public std::runtime_error {
public:
    explicit UlidException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * 타임스탬프가 숫자가 아닌 경우 (NaN, 숫자로 해석할 수 없는 문자열)
 */
class TimestampTypeException : public UlidException {
public:
    explicit TimestampTypeException(const std::string& value)
        : UlidException("timestamp must be a number: " + value) {}
};

/**
 * 타임스탬프가 [0, 2^48 - 1] 범위를 벗어난 경우
 */
class TimestampRangeException : public UlidException {
public:
    explicit TimestampRangeException(const std::string& message)
        : UlidException(message) {}
};

/**
 * 타임스탬프에 소수부가 있는 경우
 */
class TimestampValueException : public UlidException {
public:
    explicit TimestampValueException(const std::string& value)
        : UlidException("timestamp must be an integer: " + value) {}
};

/**
 * ULID 문자열의 길이가 올바르지 않은 경우
 */
class MalformedUlidException : public UlidException {
public:
    explicit MalformedUlidException(const std::string& id)
        : UlidException("Malformed ULID: " + id) {}
};

/**
 * Base32 알파벳에 없는 문자
 */
class DecodeException : public UlidException {
public:
    explicit DecodeException(char c)
        : UlidException(std::string("Invalid character: ") + c) {}
};

class LengthException : public UlidException {
public:
    explicit LengthException(const std::string& message)
        : UlidException("Invalid length: " + message) {}
};

/**
 * 랜덤 필드가 이미 최대값이라 증가시킬 수 없는 경우
 */
class OverflowException : public UlidException {
public:
    explicit OverflowException(const std::string& value)
        : UlidException("Failed incrementing string: " + value) {}
};

/**
 * 난수 소스 실패
 */
class RandomSourceException : public UlidException {
public:
    explicit RandomSourceException(const std::string& message)
        : UlidException("Random source failed: " + message) {}
};

} // namespace ulidgen
