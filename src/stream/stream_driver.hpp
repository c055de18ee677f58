
#pragma once

#include "stream_source_interface.hpp"
#include "wakeup_signal.hpp"

/*
Drives a non-blocking source until it yields something other than PENDING.
Between attempts, the calling thread sleeps on the provided signal, which must
be the one installed at the source. The timeout bounds each sleep in case a
source fails to notify.
*/
template <typename T>
PollResult pollBlocking(StreamSourceInterface<T>& source, WakeupSignal& signal,
        T& out, StreamError& err, int timeoutMillis = 100) {
    while (true) {
        // Read the epoch before polling: a notification in between is not lost
        auto epoch = signal.getEpoch();
        auto result = source.poll(out, err);
        if (result != PollResult::PENDING) return result;
        signal.waitForChange(epoch, timeoutMillis);
    }
}

// Owns a source together with the wakeup signal it notifies and
// offers blocking access to its items.
template <typename T>
class StreamDriver {

private:
    // Declared first so that it outlives the source, which may still hold a pointer to it
    WakeupSignal _signal;
    StreamSourcePtr<T> _source;
    int _timeout_millis;

    size_t _num_items {0};
    size_t _num_errors {0};
    bool _ended {false};

public:
    StreamDriver(StreamSourcePtr<T>&& source, int timeoutMillis = 100) :
            _source(std::move(source)), _timeout_millis(timeoutMillis) {
        if (_source) _source->setWakeupSignal(&_signal);
        else _ended = true;
    }

    // Blocks until the source yields ITEM, END or ERROR.
    PollResult next(T& out, StreamError& err) {
        if (_ended) return PollResult::END;
        auto result = pollBlocking(*_source, _signal, out, err, _timeout_millis);
        if (result == PollResult::ITEM) _num_items++;
        if (result == PollResult::ERROR) _num_errors++;
        if (result == PollResult::END) _ended = true;
        return result;
    }

    void cancel() {
        if (_source) _source->cancel();
        _ended = true;
    }

    StreamSourceInterface<T>& getSource() {
        return *_source;
    }
    size_t getNumItems() const {return _num_items;}
    size_t getNumErrors() const {return _num_errors;}
    bool hasEnded() const {return _ended;}
};
