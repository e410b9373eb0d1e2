#pragma once
#include <chrono>
#include <cstdint>
#include <memory>

namespace snowid {

// Millisecond time source read by IdWorker.
class Clock {
public:
    virtual ~Clock() = default;

    // Milliseconds since the Unix epoch.
    virtual int64_t now_millis() = 0;
};

class SystemClock final : public Clock {
public:
    int64_t now_millis() override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
};

using PClock = std::shared_ptr<Clock>;

// Process-wide system clock, used whenever a null clock is supplied.
inline PClock system_clock() {
    static PClock clock = std::make_shared<SystemClock>();
    return clock;
}

} // namespace snowid
