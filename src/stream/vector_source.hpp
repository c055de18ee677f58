
#pragma once

#include <vector>

#include "stream_source_interface.hpp"

// An in-memory sequence which is always ready.
template <typename T>
class VectorSource : public StreamSourceInterface<T> {

private:
    std::vector<T> _items;
    size_t _pos {0};

public:
    VectorSource(std::vector<T> items) : _items(std::move(items)) {}

    PollResult poll(T& out, StreamError& err) override {
        if (_pos >= _items.size()) return PollResult::END;
        out = std::move(_items[_pos++]);
        return PollResult::ITEM;
    }

    void cancel() override {
        _items.clear();
        _pos = 0;
    }

    size_t getCurrentSize() const override {
        return _items.size() - _pos;
    }
};

template <typename T>
StreamSourcePtr<T> fromVector(std::vector<T> items) {
    return std::make_unique<VectorSource<T>>(std::move(items));
}
