#include "handoff/core/clock.hpp"

namespace handoff::core {

std::uint64_t unix_time_ms() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

}
