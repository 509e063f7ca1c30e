#include "transferkit/transport.hpp"

namespace transferkit {

void StopSignal::request(StopReason reason) noexcept {
    if (reason == StopReason::None) {
        return;
    }
    if (reason == StopReason::Cancel) {
        reason_.store(StopReason::Cancel);
        return;
    }
    auto expected = StopReason::None;
    reason_.compare_exchange_strong(expected, reason);
}

} // namespace transferkit
