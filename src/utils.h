#pragma once
#include <chrono>

namespace tp {

// Returns current time in milliseconds on a monotonic clock
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

} // namespace tp
