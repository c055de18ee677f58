
#include <vector>
#include <utility>

#include "util/assert.hpp"
#include "util/logger.hpp"
#include "util/sys/timer.hpp"
#include "stream/coalesce.hpp"
#include "stream/kmerge.hpp"
#include "stream/vector_source.hpp"
#include "stream/lambda_source.hpp"

typedef std::pair<int, int> Run; // value, count

bool foldEqual(Run& acc, Run& next) {
    if (acc.first != next.first) return false;
    acc.second += next.second;
    return true;
}

std::vector<Run> toRuns(std::vector<int> values) {
    std::vector<Run> runs;
    for (int v : values) runs.emplace_back(v, 1);
    return runs;
}

void testDeduplicateMerge() {
    LOG(V2_INFO, "Testing de-duplication of a merge ...\n");
    auto merge = kmergeBy<Run>(makeSourceList<Run>(
        fromVector<Run>(toRuns({1, 2, 2, 5})),
        fromVector<Run>(toRuns({2, 3, 5})),
        fromVector<Run>(toRuns({5}))
    ), [](const Run& a, const Run& b) {return a.first < b.first;});
    auto runs = coalesce<Run>(std::move(merge), foldEqual);

    std::vector<Run> expected {{1, 1}, {2, 3}, {3, 1}, {5, 3}};
    std::vector<Run> out;
    Run run;
    StreamError err;
    while (true) {
        auto res = runs->poll(run, err);
        assert(res != PollResult::PENDING && res != PollResult::ERROR);
        if (res == PollResult::END) break;
        LOG(V4_VVER, "%i x%i\n", run.first, run.second);
        out.push_back(run);
    }
    assert(out == expected);
    auto res = runs->poll(run, err);
    assert(res == PollResult::END);
}

void testEmptyAndPending() {
    LOG(V2_INFO, "Testing empty and pending upstream ...\n");
    auto empty = coalesce<Run>(fromVector<Run>({}), foldEqual);
    Run run;
    StreamError err;
    auto res = empty->poll(run, err);
    assert(res == PollResult::END);

    int numPolls = 0;
    auto runs = coalesce<Run>(fromLambda<Run>([&](Run& out, StreamError& err) {
        numPolls++;
        if (numPolls == 1) {out = Run(4, 1); return PollResult::ITEM;}
        if (numPolls == 2) return PollResult::PENDING;
        if (numPolls == 3) {out = Run(4, 1); return PollResult::ITEM;}
        return PollResult::END;
    }), foldEqual);
    res = runs->poll(run, err);
    assert(res == PollResult::PENDING);
    assert(runs->getCurrentSize() == 1);
    res = runs->poll(run, err);
    assert(res == PollResult::ITEM);
    assert(run == Run(4, 2));
    res = runs->poll(run, err);
    assert(res == PollResult::END);
}

void testUpstreamError() {
    LOG(V2_INFO, "Testing upstream errors ...\n");
    int numPolls = 0;
    auto runs = coalesce<Run>(fromLambda<Run>([&](Run& out, StreamError& err) {
        numPolls++;
        if (numPolls <= 2) {out = Run(9, 1); return PollResult::ITEM;}
        if (numPolls == 3) {
            err = StreamError(StreamError::IO, "lost");
            err.sourceIndex = 1;
            return PollResult::ERROR;
        }
        if (numPolls == 4) {out = Run(10, 1); return PollResult::ITEM;}
        return PollResult::END;
    }), foldEqual);

    Run run;
    StreamError err;
    // The run collected before the error is emitted first
    auto res = runs->poll(run, err);
    assert(res == PollResult::ITEM);
    assert(run == Run(9, 2));
    res = runs->poll(run, err);
    assert(res == PollResult::ERROR);
    assert(err.sourceIndex == 1 && err.message == "lost");
    // A non-terminal upstream error does not end the stream
    res = runs->poll(run, err);
    assert(res == PollResult::ITEM);
    assert(run == Run(10, 1));
    res = runs->poll(run, err);
    assert(res == PollResult::END);
}

int main() {
    Timer::init();
    Logger::init(V5_DEBG);

    testDeduplicateMerge();
    testEmptyAndPending();
    testUpstreamError();
}
