#ifndef KMERGE_THREADING_HPP
#define KMERGE_THREADING_HPP

#include <functional>
#include <mutex>
#include <condition_variable>

class Mutex {
private:
	std::mutex mtx;

public:
	std::unique_lock<std::mutex> getLock();
};

class ConditionVariable {
private:
	std::condition_variable condvar;

public:
	// Returns the condition's value after waking up or timing out.
	bool waitWithTimeout(Mutex& mutex, int millisecs, std::function<bool()> condition);
	void waitWithLockedMutex(std::unique_lock<std::mutex>& lock, std::function<bool()> condition);
	void notify();
};

#endif
