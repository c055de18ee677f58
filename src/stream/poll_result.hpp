
#pragma once

// Outcome of one non-blocking poll of a stream.
enum class PollResult {
    // An item was written to the output argument.
    ITEM,
    // The stream cannot make progress right now; it notifies its wakeup signal once it can.
    PENDING,
    // The stream is finished. Every further poll returns END.
    END,
    // The stream failed; the error argument was written.
    ERROR
};

inline const char* pollResultToStr(PollResult result) {
    switch (result) {
    case PollResult::ITEM: return "ITEM";
    case PollResult::PENDING: return "PENDING";
    case PollResult::END: return "END";
    case PollResult::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}
