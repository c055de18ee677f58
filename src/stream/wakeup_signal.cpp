
#include "wakeup_signal.hpp"

void WakeupSignal::notify() {
    {
        auto lock = _mtx.getLock();
        _epoch.fetch_add(1, std::memory_order_acq_rel);
    }
    _cond_var.notify();
}

bool WakeupSignal::waitForChange(unsigned long epoch, int timeoutMillis) {
    if (getEpoch() != epoch) return true;
    return _cond_var.waitWithTimeout(_mtx, timeoutMillis, [&]() {
        return getEpoch() != epoch;
    });
}
