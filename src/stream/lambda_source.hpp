
#pragma once

#include <functional>

#include "stream_source_interface.hpp"

// Adapts a polling function. The function is responsible for being fused.
template <typename T>
class LambdaSource : public StreamSourceInterface<T> {

public:
    typedef std::function<PollResult(T&, StreamError&)> PollFunction;

private:
    PollFunction _poll;
    std::function<void()> _on_cancel;

public:
    LambdaSource(PollFunction poll, std::function<void()> onCancel = std::function<void()>()) :
        _poll(std::move(poll)), _on_cancel(std::move(onCancel)) {}

    PollResult poll(T& out, StreamError& err) override {
        if (!_poll) return PollResult::END;
        return _poll(out, err);
    }

    void cancel() override {
        _poll = PollFunction();
        if (_on_cancel) {
            auto onCancel = std::move(_on_cancel);
            _on_cancel = std::function<void()>();
            onCancel();
        }
    }

    ~LambdaSource() {
        cancel();
    }
};

template <typename T>
StreamSourcePtr<T> fromLambda(typename LambdaSource<T>::PollFunction poll,
        std::function<void()> onCancel = std::function<void()>()) {
    return std::make_unique<LambdaSource<T>>(std::move(poll), std::move(onCancel));
}
