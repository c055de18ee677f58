
#pragma once

#include <string>
#include <vector>

struct StreamError {

    enum Code {UNSPECIFIED = 0, IO = 1, PARSE = 2, PRODUCER = 3};

    // Index of the merge slot the error originates from, or -1 if the
    // error was not (yet) attributed to a slot.
    int sourceIndex {-1};
    // Slot indices through nested merges, outermost first. The last entry
    // is the slot whose source actually failed.
    std::vector<int> slotPath;
    int code {UNSPECIFIED};
    std::string message;

    StreamError() {}
    StreamError(int code, const std::string& message) : code(code), message(message) {}

    bool operator==(const StreamError& other) const {
        return sourceIndex == other.sourceIndex && slotPath == other.slotPath
            && code == other.code && message == other.message;
    }
    bool operator!=(const StreamError& other) const {
        return !(*this == other);
    }

    int getInnermostSlot() const {
        return slotPath.empty() ? sourceIndex : slotPath.back();
    }

    std::string toStr() const {
        std::string path;
        for (int index : slotPath) path += (path.empty() ? "" : "/") + std::to_string(index);
        if (path.empty()) path = std::to_string(sourceIndex);
        return "slot " + path + ", code " + std::to_string(code) + ": " + message;
    }
};
