
#pragma once

#include <functional>
#include <optional>

#include "stream_source_interface.hpp"

/*
Combines runs of adjacent items of a stream. The fold function is called with
the current accumulator and the next item. If it returns true, it has merged
the next item into the accumulator. Otherwise the accumulator is emitted and
the next item becomes the new accumulator. The last accumulator is emitted
when the upstream ends.
*/
template <typename T>
class Coalesce : public StreamSourceInterface<T> {

public:
    typedef std::function<bool(T& accumulator, T& next)> FoldFunction;

private:
    StreamSourcePtr<T> _source;
    FoldFunction _fold;
    std::optional<T> _accumulator;
    // Upstream error to be reported after the accumulator was emitted
    std::optional<StreamError> _deferred_error;
    bool _finished {false};

public:
    Coalesce(StreamSourcePtr<T>&& source, FoldFunction fold) :
        _source(std::move(source)), _fold(std::move(fold)) {
        if (!_source) _finished = true;
    }

    PollResult poll(T& out, StreamError& err) override {
        if (_deferred_error) {
            err = std::move(*_deferred_error);
            _deferred_error.reset();
            return PollResult::ERROR;
        }
        if (_finished) return PollResult::END;

        while (true) {
            T next;
            StreamError upstreamErr;
            auto result = _source->poll(next, upstreamErr);

            if (result == PollResult::PENDING) return PollResult::PENDING;

            if (result == PollResult::END) {
                cancel();
                return emitAccumulator(out) ? PollResult::ITEM : PollResult::END;
            }

            if (result == PollResult::ERROR) {
                if (emitAccumulator(out)) {
                    _deferred_error = std::move(upstreamErr);
                    return PollResult::ITEM;
                }
                err = std::move(upstreamErr);
                return PollResult::ERROR;
            }

            // ITEM
            if (!_accumulator) {
                _accumulator.emplace(std::move(next));
                continue;
            }
            if (_fold(*_accumulator, next)) continue;
            out = std::move(*_accumulator);
            _accumulator.emplace(std::move(next));
            return PollResult::ITEM;
        }
    }

    void setWakeupSignal(WakeupSignal* signal) override {
        if (_source) _source->setWakeupSignal(signal);
    }

    void cancel() override {
        _finished = true;
        if (_source) {
            _source->cancel();
            _source.reset();
        }
    }

    size_t getCurrentSize() const override {
        return (_source ? _source->getCurrentSize() : 0) + (_accumulator ? 1 : 0);
    }

private:
    bool emitAccumulator(T& out) {
        if (!_accumulator) return false;
        out = std::move(*_accumulator);
        _accumulator.reset();
        return true;
    }
};

template <typename T>
StreamSourcePtr<T> coalesce(StreamSourcePtr<T>&& source, typename Coalesce<T>::FoldFunction fold) {
    return std::make_unique<Coalesce<T>>(std::move(source), std::move(fold));
}
