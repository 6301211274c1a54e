#pragma once

#include "ulidgen/types.h"
#include <string>
#include <cstdint>

namespace ulidgen {

/**
 * ULID (Universally Unique Lexicographically Sortable Identifier) 파싱 및 생성 유틸리티
 *
 * ULID는 시간순 정렬이 가능한 128비트 식별자입니다.
 * 형식: 01ARYZ6S41TSV4RRFFQ69G5FAV (26자 Base32 인코딩)
 *       앞 10자는 48비트 밀리초 타임스탬프, 뒤 16자는 80비트 난수
 */
class ULID {
public:
    /**
     * 새로운 ULID 생성 (비단조, 현재 시간)
     * 같은 밀리초 안의 순서가 필요하면 CreateGenerator()로 단조 생성기를 사용
     * @return ULID 문자열 (26자 Base32)
     */
    static std::string Generate();

    /**
     * 타임스탬프를 포함한 ULID 생성 (비단조)
     * @param timestamp 밀리초 단위 타임스탬프
     * @return ULID 문자열
     */
    static std::string Generate(int64_t timestamp);

    /**
     * ULID에서 타임스탬프 추출
     * @param id ULID 문자열
     * @return 밀리초 단위 타임스탬프
     * @throws MalformedUlidException 길이가 26자가 아닌 경우
     * @throws DecodeException 시간 부분에 잘못된 문자가 있는 경우
     * @throws TimestampRangeException 시간 부분이 2^48 - 1을 넘는 경우
     */
    static int64_t DecodeTime(const std::string& id);

    /**
     * ULID 유효성 검증 (길이, 문자, 타임스탬프 범위)
     * @param id 검증할 ULID 문자열
     * @return 유효하면 true
     */
    static bool IsValid(const std::string& id);
};

} // namespace ulidgen
