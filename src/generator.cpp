#include "ulidgen/generator.h"
#include "ulidgen/base32.h"
#include "ulidgen/timestamp.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace ulidgen {

namespace {

int64_t ResolveTimestamp(std::optional<int64_t> timestamp, IClock& clock) {
    int64_t resolved = timestamp.has_value() ? *timestamp : clock.NowMillis();
    ValidateTimestamp(static_cast<double>(resolved));
    return resolved;
}

} // namespace

MonotonicGenerator::MonotonicGenerator(std::shared_ptr<IRandomSource> random,
                                       std::shared_ptr<IClock> clock)
    : random_(std::move(random))
    , clock_(std::move(clock)) {
}

std::string MonotonicGenerator::Generate(std::optional<int64_t> timestamp) {
    int64_t resolved = ResolveTimestamp(timestamp, *clock_);

    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.last_random.empty() || resolved > state_.last_timestamp) {
        // 시간이 앞으로 감: 새 난수
        std::string random = Base32::EncodeRandom(RANDOM_LENGTH, *random_);
        state_.last_timestamp = resolved;
        state_.last_random = std::move(random);
    } else {
        if (resolved < state_.last_timestamp) {
            spdlog::debug("ULID clock moved backwards: {} < {}, holding last timestamp",
                          resolved, state_.last_timestamp);
        }
        // 실패하면 상태를 그대로 두고 예외 전파
        state_.last_random = Base32::Increment(state_.last_random);
    }

    return EncodeTime(state_.last_timestamp) + state_.last_random;
}

GeneratorState MonotonicGenerator::GetState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

NonMonotonicGenerator::NonMonotonicGenerator(std::shared_ptr<IRandomSource> random,
                                             std::shared_ptr<IClock> clock)
    : random_(std::move(random))
    , clock_(std::move(clock)) {
}

std::string NonMonotonicGenerator::Generate(std::optional<int64_t> timestamp) {
    int64_t resolved = ResolveTimestamp(timestamp, *clock_);
    return EncodeTime(resolved) + Base32::EncodeRandom(RANDOM_LENGTH, *random_);
}

std::unique_ptr<IGenerator> CreateGenerator(const GeneratorOptions& options,
                                            std::shared_ptr<IRandomSource> random,
                                            std::shared_ptr<IClock> clock) {
    if (!random) {
        random = CreateRandomSource();
    }
    if (!clock) {
        clock = CreateClock();
    }

    if (options.IsMonotonic()) {
        return std::make_unique<MonotonicGenerator>(std::move(random), std::move(clock));
    }
    return std::make_unique<NonMonotonicGenerator>(std::move(random), std::move(clock));
}

} // namespace ulidgen
