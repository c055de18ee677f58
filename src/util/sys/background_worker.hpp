
#ifndef KMERGE_BACKGROUND_WORKER_HPP
#define KMERGE_BACKGROUND_WORKER_HPP

#include <atomic>
#include <thread>
#include <functional>

class BackgroundWorker {

private:
    std::atomic_bool _terminate {false};
    std::thread _thread;

public:
    BackgroundWorker() {}
    BackgroundWorker(const BackgroundWorker& other) = delete;
    BackgroundWorker& operator=(const BackgroundWorker& other) = delete;

    void run(std::function<void()> runnable) {
        _terminate = false;
        _thread = std::thread(runnable);
    }
    bool continueRunning() const {
        return !_terminate.load(std::memory_order_relaxed);
    }
    void stop() {
        _terminate = true;
        if (_thread.joinable()) _thread.join();
    }
    ~BackgroundWorker() {
        stop();
    }
};

#endif
