
#pragma once

#include <optional>
#include <utility>

#include "util/assert.hpp"
#include "stream_source_interface.hpp"

/*
Holds one upstream source of a merge together with at most one item
which was already pulled from it but not yet emitted.
Once the source ended or failed, it is released and never polled again.
*/
template <typename T>
class SourceSlot {

public:
    enum State {PEEKED, PENDING, EXHAUSTED, FAILED};

private:
    int _index;
    StreamSourcePtr<T> _source;
    std::optional<T> _peeked;
    bool _exhausted {false};
    std::optional<StreamError> _error;

public:
    SourceSlot(int index, StreamSourcePtr<T>&& source) : _index(index), _source(std::move(source)) {
        if (!_source) _exhausted = true;
    }
    SourceSlot(SourceSlot&& moved) = default;
    SourceSlot& operator=(SourceSlot&& moved) = default;
    ~SourceSlot() {
        release();
    }

    State ensurePeeked() {
        if (_exhausted) return _error ? FAILED : EXHAUSTED;
        if (_peeked) return PEEKED;

        T item;
        StreamError err;
        auto result = _source->poll(item, err);
        switch (result) {
        case PollResult::ITEM:
            _peeked.emplace(std::move(item));
            return PEEKED;
        case PollResult::PENDING:
            return PENDING;
        case PollResult::END:
            release();
            return EXHAUSTED;
        case PollResult::ERROR:
            // Keep the attribution of nested merges below this slot
            err.slotPath.insert(err.slotPath.begin(), _index);
            err.sourceIndex = _index;
            _error = std::move(err);
            release();
            return FAILED;
        }
        return PENDING;
    }

    T take() {
        assert(_peeked.has_value());
        T item = std::move(*_peeked);
        _peeked.reset();
        return item;
    }

    const T& peek() const {
        assert(_peeked.has_value());
        return *_peeked;
    }

    bool hasPeeked() const {return _peeked.has_value();}
    bool isExhausted() const {return _exhausted;}
    bool hasError() const {return _error.has_value();}

    StreamError takeError() {
        assert(_error.has_value());
        StreamError err = std::move(*_error);
        _error.reset();
        return err;
    }

    // Cancels and drops the upstream source, discarding any peeked item.
    // The slot is exhausted afterwards.
    void release() {
        _exhausted = true;
        _peeked.reset();
        if (_source) {
            _source->cancel();
            _source.reset();
        }
    }

    void setWakeupSignal(WakeupSignal* signal) {
        if (_source) _source->setWakeupSignal(signal);
    }

    size_t getCurrentSize() const {
        return (_source ? _source->getCurrentSize() : 0) + (_peeked ? 1 : 0);
    }
};
