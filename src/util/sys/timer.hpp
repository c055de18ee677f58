
#ifndef KMERGE_TIMER_HPP
#define KMERGE_TIMER_HPP

#include <sys/time.h>
#include <ctime>

class Timer {

private:
    static timespec timespecStart;

public:
    static void init();

    /**
     * Returns elapsed time since Timer::init() in seconds.
     */
    static inline float elapsedSeconds() {
        timespec now;
        clock_gettime(CLOCK_MONOTONIC, &now);
        return now.tv_sec - timespecStart.tv_sec
            + (0.001f * 0.001f * 0.001f) * (now.tv_nsec - timespecStart.tv_nsec);
    }

    /**
     * Returns the time between the given earlier point in time
     * (as returned by elapsedSeconds()) and now, in milliseconds.
     */
    static inline float millisSince(float earlierElapsedSeconds) {
        return 1000 * (elapsedSeconds() - earlierElapsedSeconds);
    }
};

#endif
