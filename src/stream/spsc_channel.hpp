
#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <vector>

#include "util/sys/threading.hpp"
#include "stream_source_interface.hpp"

/*
Bounded ring buffer connecting one producer thread with one consuming stream.
The producer side blocks while the buffer is full; the consumer side never blocks
but reports PENDING and has the installed wakeup signal notified as soon as an item
arrives or the producer concludes the stream.
*/
template <typename T>
class SPSCChannel {

private:
    std::vector<T> _buffer;
    size_t _buffer_size {0};
    size_t _num_elems {0};

    size_t _read_pos {0};
    size_t _write_pos {0};

    Mutex _buffer_mutex;
    ConditionVariable _buffer_cond_var;

    bool _input_exhausted {false};
    std::optional<StreamError> _input_error;
    bool _cancelled {false};

    WakeupSignal* _wakeup {nullptr};

public:
    SPSCChannel(size_t bufferSize) : _buffer(std::max(bufferSize, (size_t) 1)), _buffer_size(_buffer.size()) {}

    // Producer side. Blocks while full. Returns false if the consumer cancelled the channel.
    bool push(T&& input) {
        auto lock = _buffer_mutex.getLock();
        _buffer_cond_var.waitWithLockedMutex(lock, [&]() {
            return _cancelled || _num_elems < _buffer_size;
        });
        if (_cancelled) return false;

        _buffer[_write_pos] = std::move(input);
        _write_pos = (_write_pos+1) % _buffer_size;
        _num_elems++;
        // Only the transition from empty to non-empty can end a consumer's wait.
        // Notify under the lock: cancel() detaches the signal under the same lock.
        if (_num_elems == 1 && _wakeup) _wakeup->notify();
        return true;
    }

    // Producer side: no more items will follow.
    void markExhausted() {
        conclude(std::optional<StreamError>());
    }

    // Producer side: the stream failed after the items pushed so far.
    void markFailed(StreamError err) {
        conclude(std::optional<StreamError>(std::move(err)));
    }

    // Consumer side, non-blocking.
    PollResult poll(T& out, StreamError& err) {
        auto lock = _buffer_mutex.getLock();
        if (_cancelled) return PollResult::END;
        if (_num_elems == 0) {
            if (_input_error) {
                err = *_input_error;
                return PollResult::ERROR;
            }
            return _input_exhausted ? PollResult::END : PollResult::PENDING;
        }

        out = std::move(_buffer[_read_pos]);
        _read_pos = (_read_pos+1) % _buffer_size;
        bool wasFull = _num_elems == _buffer_size;
        _num_elems--;
        lock.unlock();

        // A full buffer may have a producer waiting for space
        if (wasFull) _buffer_cond_var.notify();
        return PollResult::ITEM;
    }

    // Consumer side: drops all buffered items and makes pending and future pushes fail.
    void cancel() {
        {
            auto lock = _buffer_mutex.getLock();
            _cancelled = true;
            _wakeup = nullptr;
            for (auto& elem : _buffer) elem = T();
            _num_elems = 0;
        }
        _buffer_cond_var.notify();
    }

    void setWakeupSignal(WakeupSignal* signal) {
        auto lock = _buffer_mutex.getLock();
        if (!_cancelled) _wakeup = signal;
    }

    size_t size() {
        auto lock = _buffer_mutex.getLock();
        return _num_elems;
    }

    bool isCancelled() {
        auto lock = _buffer_mutex.getLock();
        return _cancelled;
    }

private:
    void conclude(std::optional<StreamError> err) {
        auto lock = _buffer_mutex.getLock();
        if (_input_exhausted || _input_error || _cancelled) return;
        if (err) _input_error = std::move(err);
        else _input_exhausted = true;
        if (_wakeup) _wakeup->notify();
    }
};

// The consuming end of an SPSCChannel. Destroying it cancels the channel.
template <typename T>
class ChannelSource : public StreamSourceInterface<T> {

private:
    std::shared_ptr<SPSCChannel<T>> _channel;

public:
    ChannelSource(std::shared_ptr<SPSCChannel<T>> channel) : _channel(std::move(channel)) {}
    ~ChannelSource() {
        cancel();
    }

    PollResult poll(T& out, StreamError& err) override {
        return _channel->poll(out, err);
    }

    void setWakeupSignal(WakeupSignal* signal) override {
        _channel->setWakeupSignal(signal);
    }

    void cancel() override {
        _channel->cancel();
    }

    size_t getCurrentSize() const override {
        return _channel->size();
    }
};

template <typename T>
StreamSourcePtr<T> fromChannel(std::shared_ptr<SPSCChannel<T>> channel) {
    return std::make_unique<ChannelSource<T>>(std::move(channel));
}
