
#include "timer.hpp"

timespec Timer::timespecStart;

void Timer::init() {
    clock_gettime(CLOCK_MONOTONIC, &timespecStart);
}
