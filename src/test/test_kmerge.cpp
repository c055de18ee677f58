
#include <vector>
#include <algorithm>

#include "util/assert.hpp"
#include "util/logger.hpp"
#include "util/sys/timer.hpp"
#include "stream/kmerge.hpp"
#include "stream/vector_source.hpp"
#include "stream/lambda_source.hpp"

// Pulls from a source which is never pending until it ends.
template <typename T>
std::vector<T> drain(StreamSourceInterface<T>& source) {
    std::vector<T> out;
    T item;
    StreamError err;
    while (true) {
        auto res = source.poll(item, err);
        assert(res != PollResult::PENDING);
        assert(res != PollResult::ERROR);
        if (res == PollResult::END) break;
        out.push_back(item);
    }
    return out;
}

std::string toStr(const std::vector<int>& vec) {
    std::string out;
    for (int x : vec) out += std::to_string(x) + " ";
    return out;
}

void testTwoAscendingSources() {
    LOG(V2_INFO, "Testing two ascending sources ...\n");
    auto merge = kmergeMin<int>(makeSourceList<int>(
        fromVector<int>({1, 3, 5}),
        fromVector<int>({2, 4, 6})
    ));
    auto out = drain(*merge);
    LOG(V2_INFO, "Output: %s\n", toStr(out).c_str());
    assert(out == std::vector<int>({1, 2, 3, 4, 5, 6}));
}

void testNoSources() {
    LOG(V2_INFO, "Testing merge of zero sources ...\n");
    auto merge = kmergeMin<int>(std::vector<StreamSourcePtr<int>>());
    assert(merge->isTerminated());
    int item;
    StreamError err;
    for (int i = 0; i < 3; i++) {
        auto res = merge->poll(item, err);
        assert(res == PollResult::END);
    }
}

void testSingleSource() {
    LOG(V2_INFO, "Testing pass-through of a single source ...\n");
    // Not sorted: a single source is passed through as is
    std::vector<int> input {5, 1, 4, 1, 3};
    auto merge = kmergeMin<int>(makeSourceList<int>(fromVector<int>(input)));
    auto out = drain(*merge);
    assert(out == input);
}

struct Tagged {
    int key;
    int source;
    int pos;
};

void testLeftmostTieBreak() {
    LOG(V2_INFO, "Testing tie-breaking among sources ...\n");
    std::vector<StreamSourcePtr<Tagged>> sources;
    for (int s = 0; s < 3; s++) {
        std::vector<Tagged> items;
        for (int pos = 0; pos < 4; pos++) items.push_back(Tagged{pos/2, s, pos});
        sources.push_back(fromVector<Tagged>(items));
    }
    auto merge = kmergeBy<Tagged>(std::move(sources), [](const Tagged& a, const Tagged& b) {
        return a.key < b.key;
    });
    auto out = drain(*merge);
    assert(out.size() == 12);
    for (size_t i = 0; i < out.size(); i++) {
        LOG(V5_DEBG, "key=%i src=%i pos=%i\n", out[i].key, out[i].source, out[i].pos);
        // Each key appears twice per source: all of source 0, then source 1, then source 2
        assert(out[i].key == (int) (i / 6));
        assert(out[i].source == (int) ((i % 6) / 2));
        if (i > 0 && out[i].source == out[i-1].source) {
            assert(out[i].pos == out[i-1].pos + 1);
        }
    }
}

void testByPredicate() {
    LOG(V2_INFO, "Testing merge by custom predicate ...\n");
    auto merge = kmergeBy<int>(makeSourceList<int>(
        fromVector<int>({1, 3}),
        fromVector<int>({2, 4})
    ), [](const int& a, const int& b) {return a < b;});
    assert(drain(*merge) == std::vector<int>({1, 2, 3, 4}));

    // Ordered by remainder modulo 3
    merge = kmergeBy<int>(makeSourceList<int>(
        fromVector<int>({6, 4, 5}),
        fromVector<int>({3, 1, 2})
    ), [](const int& a, const int& b) {return a%3 < b%3;});
    auto out = drain(*merge);
    LOG(V2_INFO, "Output: %s\n", toStr(out).c_str());
    assert(out == std::vector<int>({6, 3, 4, 1, 5, 2}));
}

void testPresets() {
    LOG(V2_INFO, "Testing preset orders ...\n");
    auto maxMerge = kmergeMax<int>(makeSourceList<int>(
        fromVector<int>({3, 1}),
        fromVector<int>({4, 2}),
        fromVector<int>({5})
    ));
    assert(drain(*maxMerge) == std::vector<int>({5, 4, 3, 2, 1}));

    // Inputs which are not sorted are not sorted by the merge either:
    // each round simply emits the smallest of the current heads.
    auto minMerge = kmergeMin<int>(makeSourceList<int>(
        fromVector<int>({3, 2}),
        fromVector<int>({4, 1}),
        fromVector<int>({5})
    ));
    auto out = drain(*minMerge);
    LOG(V2_INFO, "Output: %s\n", toStr(out).c_str());
    assert(out == std::vector<int>({3, 2, 4, 1, 5}));

    minMerge = kmergeMin<int>(makeSourceList<int>(
        fromVector<int>({2, 3}),
        fromVector<int>({1, 4}),
        fromVector<int>({5})
    ));
    assert(drain(*minMerge) == std::vector<int>({1, 2, 3, 4, 5}));
}

void testPendingSource() {
    LOG(V2_INFO, "Testing pending sources ...\n");
    WakeupSignal signal;

    // The second source only delivers its item after some attempts
    int numAttempts = 0;
    bool delivered = false;
    auto merge = kmergeMin<int>(makeSourceList<int>(
        fromVector<int>({2, 3}),
        fromLambda<int>([&](int& out, StreamError& err) {
            if (delivered) return PollResult::END;
            if (++numAttempts < 3) return PollResult::PENDING;
            delivered = true;
            out = 1;
            return PollResult::ITEM;
        })
    ));
    merge->setWakeupSignal(&signal);

    int item;
    StreamError err;
    // Nothing may be emitted while an item smaller than all others may still arrive
    auto res = merge->poll(item, err);
    assert(res == PollResult::PENDING);
    assert(merge->getNumBufferedItems() == 1);
    res = merge->poll(item, err);
    assert(res == PollResult::PENDING);
    res = merge->poll(item, err);
    assert(res == PollResult::ITEM);
    assert(item == 1);
    assert(drain(*merge) == std::vector<int>({2, 3}));
    assert(numAttempts == 3);
}

void testFusedEnd() {
    LOG(V2_INFO, "Testing fused end ...\n");
    int numPolls = 0;
    auto merge = kmergeMin<int>(makeSourceList<int>(
        fromLambda<int>([&](int& out, StreamError& err) {
            numPolls++;
            // Violates the fused contract after its end
            if (numPolls == 2) return PollResult::END;
            out = numPolls;
            return PollResult::ITEM;
        })
    ));
    int item;
    StreamError err;
    auto res = merge->poll(item, err);
    assert(res == PollResult::ITEM && item == 1);
    for (int i = 0; i < 5; i++) {
        res = merge->poll(item, err);
        assert(res == PollResult::END);
    }
    // The source was never asked again after it ended
    assert(numPolls == 2);
}

void testAddSources() {
    LOG(V2_INFO, "Testing addition of sources to a live merge ...\n");
    auto merge = kmergeMin<int>(makeSourceList<int>(fromVector<int>({1, 4, 5})));

    int item;
    StreamError err;
    auto res = merge->poll(item, err);
    assert(res == PollResult::ITEM && item == 1);

    bool added = merge->add(fromVector<int>({2, 3}));
    assert(added);
    assert(merge->getNumSlots() == 2);
    assert(drain(*merge) == std::vector<int>({2, 3, 4, 5}));

    // Finished merges take no further sources
    added = merge->add(fromVector<int>({6}));
    assert(!added);

    // An empty merge can be filled before it is polled
    KMerge<int> lateMerge(Comparators::ascending<int>());
    lateMerge.add(fromVector<int>({1, 3}));
    lateMerge.add(fromVector<int>({2}));
    assert(drain(lateMerge) == std::vector<int>({1, 2, 3}));
}

void testMemoryBound() {
    LOG(V2_INFO, "Testing bounded buffering ...\n");
    const int numSources = 16;
    const int numItemsPerSource = 200;
    std::vector<StreamSourcePtr<int>> sources;
    for (int s = 0; s < numSources; s++) {
        std::vector<int> items;
        for (int i = 0; i < numItemsPerSource; i++) items.push_back(i*numSources + s);
        sources.push_back(fromVector<int>(items));
    }
    auto merge = kmergeMin<int>(std::move(sources));

    int item;
    StreamError err;
    int expected = 0;
    while (merge->poll(item, err) == PollResult::ITEM) {
        assert(item == expected);
        expected++;
        assert(merge->getNumBufferedItems() <= (size_t) numSources);
    }
    assert(expected == numSources * numItemsPerSource);
    assert(merge->getNumEmittedItems() == (size_t) expected);
    assert(merge->getNumLiveSlots() == 0);
}

void testInconsistentPredicate() {
    LOG(V2_INFO, "Testing inconsistent predicate ...\n");
    // Irreflexive, but neither transitive nor asymmetric w.r.t. a common order
    Precedence<int> weird = [](const int& a, const int& b) {
        return ((a ^ b) & 1) ? a > b : a < b;
    };
    std::vector<int> all;
    std::vector<StreamSourcePtr<int>> sources;
    for (int s = 0; s < 5; s++) {
        std::vector<int> items;
        for (int i = 0; i < 20; i++) {
            items.push_back((i * 7 + s * 13) % 31);
            all.push_back(items.back());
        }
        sources.push_back(fromVector<int>(items));
    }
    auto merge = kmergeBy<int>(std::move(sources), weird);
    auto out = drain(*merge);
    std::sort(out.begin(), out.end());
    std::sort(all.begin(), all.end());
    // No item lost or duplicated
    assert(out == all);
}

void testCancel() {
    LOG(V2_INFO, "Testing cancellation ...\n");
    int numCancelled = 0;
    auto makeSource = [&](int first) {
        int next = first;
        return fromLambda<int>([next](int& out, StreamError& err) mutable {
            out = next;
            next += 2;
            return PollResult::ITEM;
        }, [&]() {numCancelled++;});
    };
    auto merge = kmergeMin<int>(makeSourceList<int>(makeSource(0), makeSource(1)));

    int item;
    StreamError err;
    for (int i = 0; i < 10; i++) {
        auto res = merge->poll(item, err);
        assert(res == PollResult::ITEM && item == i);
    }
    assert(merge->getNumBufferedItems() == 1);
    merge->cancel();
    assert(numCancelled == 2);
    assert(merge->getNumBufferedItems() == 0);
    auto res = merge->poll(item, err);
    assert(res == PollResult::END);

    // Destruction cancels, too
    numCancelled = 0;
    merge = kmergeMin<int>(makeSourceList<int>(makeSource(0), makeSource(1)));
    merge.reset();
    assert(numCancelled == 2);
}

void testNestedMerge() {
    LOG(V2_INFO, "Testing nested merges ...\n");
    auto inner = kmergeMin<int>(makeSourceList<int>(
        fromVector<int>({1, 5}),
        fromVector<int>({3, 7})
    ));
    auto outer = kmergeMin<int>(makeSourceList<int>(
        std::move(inner),
        fromVector<int>({2, 4, 6})
    ));
    assert(drain(*outer) == std::vector<int>({1, 2, 3, 4, 5, 6, 7}));
}

int main() {
    Timer::init();
    Logger::init(V5_DEBG);

    testTwoAscendingSources();
    testNoSources();
    testSingleSource();
    testLeftmostTieBreak();
    testByPredicate();
    testPresets();
    testPendingSource();
    testFusedEnd();
    testAddSources();
    testMemoryBound();
    testInconsistentPredicate();
    testCancel();
    testNestedMerge();
}
