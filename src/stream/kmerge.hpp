
#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <vector>
#include <list>

#include "util/logger.hpp"
#include "util/assert.hpp"
#include "comparators.hpp"
#include "source_slot.hpp"
#include "stream_source_interface.hpp"

/*
Lazily merges k individually ordered streams into one ordered stream.

Each source is wrapped into a SourceSlot which holds at most one item pulled ahead.
Slots with a pulled item are kept in a binary heap ordered by the precedence
predicate, with the smaller slot index winning among items of equal precedence.
Only slots which just gave away their item are polled again, in index order,
so a single emission costs O(log k) comparisons plus one upstream poll.

As long as a live slot is PENDING, nothing is emitted since its next item
might precede all others. An upstream error is reported as soon as it is
observed and only removes the failing slot; the remaining slots continue to
be merged (unless setFailFast(true) was called).
*/
template <typename T>
class KMerge : public StreamSourceInterface<T> {

private:
    std::vector<SourceSlot<T>> _slots;
    Precedence<T> _precedes;

    // Indices of slots holding a peeked item, as a heap with the next winner on top
    std::vector<int> _ready_heap;
    // Indices of live slots without a peeked item, in ascending order
    std::vector<int> _unpeeked;
    // Indices of failed slots whose error was not reported yet
    std::list<int> _failed;

    WakeupSignal* _wakeup {nullptr};
    bool _fail_fast {false};
    bool _terminated {false};
    std::optional<StreamError> _terminal_error;

    size_t _num_emitted {0};
    size_t _num_errors {0};

public:
    KMerge(Precedence<T> precedes) : _precedes(std::move(precedes)) {}
    KMerge(std::vector<StreamSourcePtr<T>>&& sources, Precedence<T> precedes) : _precedes(std::move(precedes)) {
        _slots.reserve(sources.size());
        for (auto& source : sources) add(std::move(source));
        // No sources at all: the merge is over before it began
        if (_slots.empty()) _terminated = true;
    }
    KMerge(KMerge&& moved) = default;
    KMerge& operator=(KMerge&& moved) = default;

    /*
    Appends another source which takes part in all future rounds with the next
    higher slot index. Possible at any time before the merge has ended.
    */
    bool add(StreamSourcePtr<T>&& source) {
        if (_terminated) {
            LOG(V1_WARN, "[WARN] KMerge: cannot add a source to a finished merge\n");
            return false;
        }
        int index = _slots.size();
        _slots.emplace_back(index, std::move(source));
        _slots.back().setWakeupSignal(_wakeup);
        // The new index is the largest one, so the list stays sorted
        _unpeeked.push_back(index);
        LOG(V5_DEBG, "KMerge: added slot #%i\n", index);
        return true;
    }

    // Makes the first upstream error the final result of the merge.
    void setFailFast(bool failFast) {
        _fail_fast = failFast;
    }

    PollResult poll(T& out, StreamError& err) override {

        if (_terminated) {
            if (_terminal_error) {
                err = *_terminal_error;
                return PollResult::ERROR;
            }
            return PollResult::END;
        }

        // Make every live slot hold an item, if possible without waiting
        bool anyPending = pollUnpeekedSlots();

        // Report errors as soon as they are observed
        if (!_failed.empty()) {
            int index = _failed.front();
            _failed.pop_front();
            err = _slots[index].takeError();
            _num_errors++;
            LOG_ADD_SRC(V4_VVER, "KMerge: slot failed (%s)", index, err.message.c_str());
            if (_fail_fast) {
                terminate();
                _terminal_error = err;
            }
            return PollResult::ERROR;
        }

        if (anyPending) return PollResult::PENDING;

        if (_ready_heap.empty()) {
            // All slots are exhausted
            LOG(V4_VVER, "KMerge: all %lu slots exhausted after %lu items\n", _slots.size(), _num_emitted);
            terminate();
            return PollResult::END;
        }

        // Emit the item of the winning slot
        auto heapOrder = [&](int a, int b) {return emitsAfter(a, b);};
        assert_heavy(std::is_heap(_ready_heap.begin(), _ready_heap.end(), heapOrder));
        std::pop_heap(_ready_heap.begin(), _ready_heap.end(), heapOrder);
        int winner = _ready_heap.back();
        _ready_heap.pop_back();
        out = _slots[winner].take();
        _unpeeked.insert(std::lower_bound(_unpeeked.begin(), _unpeeked.end(), winner), winner);
        _num_emitted++;
        return PollResult::ITEM;
    }

    void setWakeupSignal(WakeupSignal* signal) override {
        _wakeup = signal;
        for (auto& slot : _slots) slot.setWakeupSignal(signal);
    }

    // Releases all sources and discards every peeked item. The merge ends.
    void cancel() override {
        if (!_terminated) {
            LOG(V4_VVER, "KMerge: cancelled after %lu items\n", _num_emitted);
        }
        terminate();
    }

    size_t getCurrentSize() const override {
        size_t size = 0;
        for (auto& slot : _slots) size += slot.getCurrentSize();
        return size;
    }

    // Number of items pulled from the sources but not yet emitted (at most one per slot).
    size_t getNumBufferedItems() const {
        return _ready_heap.size();
    }
    size_t getNumSlots() const {
        return _slots.size();
    }
    size_t getNumLiveSlots() const {
        size_t num = 0;
        for (auto& slot : _slots) if (!slot.isExhausted()) num++;
        return num;
    }
    size_t getNumEmittedItems() const {
        return _num_emitted;
    }
    size_t getNumReportedErrors() const {
        return _num_errors;
    }
    bool isTerminated() const {
        return _terminated;
    }

private:

    // Returns whether some live slot is still pending.
    bool pollUnpeekedSlots() {
        bool anyPending = false;
        size_t numKept = 0;
        for (size_t i = 0; i < _unpeeked.size(); i++) {
            int index = _unpeeked[i];
            auto& slot = _slots[index];
            switch (slot.ensurePeeked()) {
            case SourceSlot<T>::PEEKED:
                _ready_heap.push_back(index);
                std::push_heap(_ready_heap.begin(), _ready_heap.end(), [&](int a, int b) {return emitsAfter(a, b);});
                break;
            case SourceSlot<T>::PENDING:
                anyPending = true;
                _unpeeked[numKept++] = index;
                break;
            case SourceSlot<T>::EXHAUSTED:
                LOG_ADD_SRC(V5_DEBG, "KMerge: slot exhausted", index);
                break;
            case SourceSlot<T>::FAILED:
                _failed.push_back(index);
                break;
            }
        }
        _unpeeked.resize(numKept);
        return anyPending;
    }

    // Heap order: true iff slot a's item is to be emitted after slot b's item.
    bool emitsAfter(int a, int b) const {
        const T& itemA = _slots[a].peek();
        const T& itemB = _slots[b].peek();
        if (_precedes(itemB, itemA)) return true;
        if (_precedes(itemA, itemB)) return false;
        return b < a;
    }

    void terminate() {
        for (auto& slot : _slots) slot.release();
        _ready_heap.clear();
        _unpeeked.clear();
        _failed.clear();
        _terminated = true;
    }
};

template <typename T>
std::unique_ptr<KMerge<T>> kmergeBy(std::vector<StreamSourcePtr<T>>&& sources, Precedence<T> precedes) {
    return std::make_unique<KMerge<T>>(std::move(sources), std::move(precedes));
}

// Emits the smallest available item first.
template <typename T>
std::unique_ptr<KMerge<T>> kmergeMin(std::vector<StreamSourcePtr<T>>&& sources) {
    return kmergeBy<T>(std::move(sources), Comparators::ascending<T>());
}

// Emits the largest available item first.
template <typename T>
std::unique_ptr<KMerge<T>> kmergeMax(std::vector<StreamSourcePtr<T>>&& sources) {
    return kmergeBy<T>(std::move(sources), Comparators::descending<T>());
}
