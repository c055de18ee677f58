
#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "poll_result.hpp"
#include "stream_error.hpp"
#include "wakeup_signal.hpp"

/*
An ordered, possibly asynchronous sequence of items of type T.
Implementations must be fused: once END (or, for a single upstream, ERROR)
was returned, every further poll returns the same result.
T needs to be default-constructible and movable.
*/
template <typename T>
class StreamSourceInterface {

public:
    // Non-blocking. Writes out on ITEM and err on ERROR.
    virtual PollResult poll(T& out, StreamError& err) = 0;

    // The source notifies the given signal whenever a previously PENDING poll
    // could make progress. Sources which never return PENDING may ignore it.
    virtual void setWakeupSignal(WakeupSignal* signal) {}

    // Releases all upstream resources. Afterwards the source only returns END.
    virtual void cancel() {}

    // Number of items currently buffered inside the source.
    virtual size_t getCurrentSize() const {return 0;}

    virtual ~StreamSourceInterface() {}
};

template <typename T>
using StreamSourcePtr = std::unique_ptr<StreamSourceInterface<T>>;

// Builds a list of owned sources from move-only source pointers.
template <typename T, typename... Ptrs>
std::vector<StreamSourcePtr<T>> makeSourceList(Ptrs&&... ptrs) {
    std::vector<StreamSourcePtr<T>> list;
    list.reserve(sizeof...(ptrs));
    (list.push_back(std::forward<Ptrs>(ptrs)), ...);
    return list;
}
