
#include "threading.hpp"

#include <chrono>

std::unique_lock<std::mutex> Mutex::getLock() {
    return std::unique_lock<std::mutex>(mtx);
}

bool ConditionVariable::waitWithTimeout(Mutex& mutex, int millisecs, std::function<bool()> condition) {
    auto lock = mutex.getLock();
    return condvar.wait_for(lock, std::chrono::milliseconds(millisecs), condition);
}
void ConditionVariable::waitWithLockedMutex(std::unique_lock<std::mutex>& lock, std::function<bool()> condition) {
    while (!condition()) condvar.wait(lock);
}
void ConditionVariable::notify() {
    condvar.notify_all();
}
