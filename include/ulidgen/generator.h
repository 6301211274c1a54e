#pragma once

#include "ulidgen/types.h"
#include "ulidgen/clock.h"
#include "ulidgen/random_source.h"
#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <cstdint>

namespace ulidgen {

/**
 * ULID 생성기 인터페이스
 */
class IGenerator {
public:
    virtual ~IGenerator() = default;

    /**
     * ULID 생성
     * @param timestamp 밀리초 단위 타임스탬프, 없으면 현재 시간 (0도 유효한 값)
     * @return 26자 ULID 문자열
     * @throws TimestampRangeException 등 타임스탬프 검증 실패시
     */
    virtual std::string Generate(std::optional<int64_t> timestamp) = 0;

    /**
     * 현재 시간으로 ULID 생성
     */
    std::string Generate() { return Generate(std::nullopt); }
};

/**
 * 단조 증가 ULID 생성기
 *
 * 같은 인스턴스에서 발급한 ID는 입력 타임스탬프의 순서와 관계없이 항상
 * 사전순으로 증가한다. 타임스탬프가 앞으로 가지 않으면(정지 또는 역행)
 * 마지막 타임스탬프를 유지하고 랜덤 부분을 1 증가시킨다.
 * 검사와 상태 갱신은 mutex로 보호되므로 여러 스레드에서 공유할 수 있다.
 */
class MonotonicGenerator : public IGenerator {
public:
    MonotonicGenerator(std::shared_ptr<IRandomSource> random,
                       std::shared_ptr<IClock> clock);
    ~MonotonicGenerator() override = default;

    MonotonicGenerator(const MonotonicGenerator&) = delete;
    MonotonicGenerator& operator=(const MonotonicGenerator&) = delete;

    using IGenerator::Generate;

    /**
     * @throws OverflowException 한 타임스탬프에서 2^80개를 넘게 요청한 경우.
     *         이 경우 상태는 변경되지 않는다.
     */
    std::string Generate(std::optional<int64_t> timestamp) override;

    /**
     * 현재 상태의 복사본 (진단/테스트용)
     */
    GeneratorState GetState() const;

private:
    std::shared_ptr<IRandomSource> random_;
    std::shared_ptr<IClock> clock_;
    GeneratorState state_;
    mutable std::mutex mutex_;
};

/**
 * 비단조 ULID 생성기
 * 상태가 없으며 매 호출마다 새 난수를 사용한다.
 */
class NonMonotonicGenerator : public IGenerator {
public:
    NonMonotonicGenerator(std::shared_ptr<IRandomSource> random,
                          std::shared_ptr<IClock> clock);
    ~NonMonotonicGenerator() override = default;

    using IGenerator::Generate;

    std::string Generate(std::optional<int64_t> timestamp) override;

private:
    std::shared_ptr<IRandomSource> random_;
    std::shared_ptr<IClock> clock_;
};

/**
 * 생성기 팩토리
 * @param options monotonic 여부
 * @param random 난수 소스 (nullptr이면 CreateRandomSource())
 * @param clock 벽시계 (nullptr이면 CreateClock())
 * @return 옵션에 맞는 생성기
 */
std::unique_ptr<IGenerator> CreateGenerator(const GeneratorOptions& options = GeneratorOptions(),
                                            std::shared_ptr<IRandomSource> random = nullptr,
                                            std::shared_ptr<IClock> clock = nullptr);

} // namespace ulidgen
