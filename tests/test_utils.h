#pragma once

#include "ulidgen/clock.h"
#include "ulidgen/random_source.h"
#include <atomic>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ulidgen {
namespace test_utils {

/**
 * 항상 0 바이트를 돌려주는 난수 소스
 * 난수 부분이 "0000000000000000"으로 고정되어 결과를 예측할 수 있다.
 */
class ZeroRandomSource : public IRandomSource {
public:
    void Fill(uint8_t* buffer, size_t length) override {
        std::memset(buffer, 0, length);
        calls_++;
    }

    size_t GetCallCount() const { return calls_; }

private:
    std::atomic<size_t> calls_{0};
};

/**
 * 같은 바이트로 버퍼를 채우는 난수 소스
 */
class FixedRandomSource : public IRandomSource {
public:
    explicit FixedRandomSource(uint8_t value) : value_(value) {}

    void Fill(uint8_t* buffer, size_t length) override {
        std::memset(buffer, value_, length);
    }

private:
    uint8_t value_;
};

/**
 * 주어진 바이트 목록을 순환하며 돌려주는 난수 소스
 */
class SequenceRandomSource : public IRandomSource {
public:
    explicit SequenceRandomSource(std::vector<uint8_t> bytes)
        : bytes_(std::move(bytes)) {
        if (bytes_.empty()) {
            throw std::invalid_argument("SequenceRandomSource needs at least one byte");
        }
    }

    void Fill(uint8_t* buffer, size_t length) override {
        for (size_t i = 0; i < length; ++i) {
            buffer[i] = bytes_[position_ % bytes_.size()];
            position_++;
        }
    }

private:
    std::vector<uint8_t> bytes_;
    size_t position_ = 0;
};

/**
 * 테스트에서 직접 조작하는 시계
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(int64_t now = 0) : now_(now) {}

    int64_t NowMillis() override { return now_; }

    void Set(int64_t now) { now_ = now; }
    void Advance(int64_t delta) { now_ += delta; }

private:
    std::atomic<int64_t> now_;
};

} // namespace test_utils
} // namespace ulidgen
