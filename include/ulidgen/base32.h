#pragma once

#include "ulidgen/random_source.h"
#include <string>
#include <cstddef>
#include <cstdint>

namespace ulidgen {

/**
 * Crockford Base32 코덱
 *
 * 모든 문자열은 최상위 자릿수가 앞에 오는 고정 폭 32진수로 취급한다.
 * 알파벳은 혼동되기 쉬운 I, L, O, U를 제외한다.
 */
class Base32 {
public:
    static constexpr char ENCODING_CHARS[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    // 64비트에 담을 수 있는 최대 자릿수 (12 * 5 = 60비트)
    static constexpr size_t MAX_DECODE_LENGTH = 12;

    /**
     * 정수를 고정 폭 Base32 문자열로 인코딩
     * 폭이 부족하면 상위 자릿수는 잘린다. 크기 검증은 호출자 책임.
     * @param value 인코딩할 값
     * @param width 출력 문자 수
     * @return 왼쪽이 '0'으로 채워진 문자열
     */
    static std::string EncodeInteger(uint64_t value, size_t width);

    /**
     * 난수 문자열 생성
     * @param length 문자 수
     * @param random 난수 소스 (문자당 1바이트 사용)
     * @return 각 문자가 독립적으로 균등 분포하는 문자열
     */
    static std::string EncodeRandom(size_t length, IRandomSource& random);

    /**
     * 난수 문자 하나 생성
     */
    static char RandomChar(IRandomSource& random);

    /**
     * Base32 문자열을 정수로 디코딩
     * @param str 최대 MAX_DECODE_LENGTH 자
     * @return 디코딩된 값
     * @throws DecodeException 알파벳에 없는 문자
     * @throws LengthException 64비트를 넘는 길이
     */
    static uint64_t DecodeInteger(const std::string& str);

    /**
     * 고정 폭 Base32 문자열에 1을 더함 (자리올림 포함)
     * @param str 1 ~ RANDOM_LENGTH 자
     * @return 증가된 문자열 (길이 동일)
     * @throws LengthException 빈 문자열이거나 RANDOM_LENGTH 초과
     * @throws DecodeException 알파벳에 없는 문자
     * @throws OverflowException 모든 자리가 'Z'인 경우
     */
    static std::string Increment(const std::string& str);

    /**
     * 문자의 알파벳 인덱스
     * @return 0 ~ 31, 알파벳에 없으면 -1
     */
    static int IndexOf(char c);

    static bool IsValid(const std::string& str);

private:
    static uint8_t ByteToIndex(uint8_t byte);
};

} // namespace ulidgen
