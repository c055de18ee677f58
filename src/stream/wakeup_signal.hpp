
#ifndef KMERGE_WAKEUP_SIGNAL_HPP
#define KMERGE_WAKEUP_SIGNAL_HPP

#include <atomic>

#include "util/sys/threading.hpp"

/*
Readiness notification shared between a consuming task and the sources it polls.
A source which answered a poll with PENDING calls notify() as soon as another poll
could make progress. The consumer reads the epoch before polling and, if nothing
was ready, waits until the epoch has changed. Notifications in between the two
calls are therefore never lost.
*/
class WakeupSignal {

private:
    Mutex _mtx;
    ConditionVariable _cond_var;
    std::atomic_ulong _epoch {0};

public:
    unsigned long getEpoch() const {
        return _epoch.load(std::memory_order_acquire);
    }

    void notify();

    // Returns true iff the epoch differs from the provided one upon returning.
    bool waitForChange(unsigned long epoch, int timeoutMillis);
};

#endif
