#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include "jsonable/Jsonable.hpp"

namespace ulidgen {

constexpr size_t ULID_LENGTH = 26;
constexpr size_t TIMESTAMP_LENGTH = 10;
constexpr size_t RANDOM_LENGTH = 16;
constexpr size_t ENCODING_LENGTH = 32;

// 48비트로 표현 가능한 최대 밀리초 타임스탬프
constexpr int64_t TIME_MAX = (int64_t{1} << 48) - 1;

/**
 * 단조 증가 생성기의 내부 상태
 * last_random이 비어 있으면 아직 ID를 발급하지 않은 상태
 */
struct GeneratorState {
    int64_t last_timestamp = 0;
    std::string last_random;
};

/**
 * 생성기 옵션
 * jsonable을 상속받아 JSON 직렬화/역직렬화 지원
 * 형식: {"monotonic": true}
 */
class GeneratorOptions : public json::Jsonable {
public:
    GeneratorOptions() = default;
    explicit GeneratorOptions(bool monotonic) : monotonic_(monotonic) {}
    ~GeneratorOptions() = default;

    bool IsMonotonic() const { return monotonic_; }
    void SetMonotonic(bool monotonic) { monotonic_ = monotonic; }

    // jsonable 인터페이스 구현
    void saveToJson() override {
        setBool("monotonic", monotonic_);
    }

    void loadFromJson() override {
        if (hasKey("monotonic")) {
            monotonic_ = getBool("monotonic");
        } else {
            monotonic_ = true;
        }
    }

private:
    bool monotonic_ = true;
};

} // namespace ulidgen
