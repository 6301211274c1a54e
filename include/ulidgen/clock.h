#pragma once

#include <cstdint>
#include <memory>

namespace ulidgen {

/**
 * 벽시계 인터페이스
 * 호출자가 타임스탬프를 지정하지 않았을 때만 사용된다.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * 현재 시간
     * @return Unix epoch 기준 밀리초
     */
    virtual int64_t NowMillis() = 0;
};

/**
 * std::chrono::system_clock 기반 구현
 */
class SystemClock : public IClock {
public:
    int64_t NowMillis() override;
};

std::shared_ptr<IClock> CreateClock();

} // namespace ulidgen
