#include "ulidgen/clock.h"
#include <chrono>

namespace ulidgen {

int64_t SystemClock::NowMillis() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::shared_ptr<IClock> CreateClock() {
    return std::make_shared<SystemClock>();
}

} // namespace ulidgen
