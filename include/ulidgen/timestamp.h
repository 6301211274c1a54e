#pragma once

#include "ulidgen/types.h"
#include <string>
#include <cstddef>
#include <cstdint>

namespace ulidgen {

/**
 * 타임스탬프 검증
 * 검사 순서: 숫자 여부 -> 최대값 초과 -> 음수 -> 정수 여부
 * @param timestamp 밀리초 단위 후보 값
 * @throws TimestampTypeException NaN
 * @throws TimestampRangeException TIME_MAX 초과(무한대 포함) 또는 음수
 * @throws TimestampValueException 소수부가 있는 경우
 */
void ValidateTimestamp(double timestamp);

/**
 * 10진수 문자열을 타임스탬프로 해석 후 검증
 * @param text 설정 파일이나 사용자 입력에서 읽은 값
 * @return 밀리초 단위 타임스탬프
 * @throws TimestampTypeException 숫자로 해석할 수 없는 문자열
 */
int64_t ParseTimestamp(const std::string& text);

/**
 * 타임스탬프를 검증한 뒤 Base32로 인코딩
 * @param timestamp 밀리초 단위 타임스탬프
 * @param width 출력 문자 수 (기본 10자)
 * @return 인코딩된 시간 부분
 */
std::string EncodeTime(int64_t timestamp, size_t width = TIMESTAMP_LENGTH);

} // namespace ulidgen
