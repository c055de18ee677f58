
#pragma once

#include <fstream>
#include <functional>
#include <optional>
#include <string>

#include "stream_source_interface.hpp"

/*
Reads one item per line from a text file. Lines are converted by a parse
function; a line which cannot be parsed fails the stream. Always ready.
*/
template <typename T>
class LineFileSource : public StreamSourceInterface<T> {

public:
    // Returns false if the line does not describe a valid item.
    typedef std::function<bool(const std::string&, T&)> ParseFunction;

private:
    std::string _filename;
    std::ifstream _ifs;
    ParseFunction _parse;
    size_t _line_nr {0};
    bool _opened {false};
    bool _finished {false};
    std::optional<StreamError> _error;

public:
    LineFileSource(const std::string& filename, ParseFunction parse) :
        _filename(filename), _parse(std::move(parse)) {}

    PollResult poll(T& out, StreamError& err) override {
        if (_error) {
            err = *_error;
            return PollResult::ERROR;
        }
        if (_finished) return PollResult::END;

        if (!_opened) {
            _opened = true;
            _ifs.open(_filename);
            if (!_ifs.is_open()) {
                return fail(StreamError::IO, "cannot open \"" + _filename + "\"", err);
            }
        }

        std::string line;
        while (std::getline(_ifs, line)) {
            _line_nr++;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            // Skip empty lines
            if (line.empty()) continue;
            if (!_parse(line, out)) {
                return fail(StreamError::PARSE, _filename + ":" + std::to_string(_line_nr)
                    + ": invalid item \"" + line + "\"", err);
            }
            return PollResult::ITEM;
        }
        if (_ifs.bad()) {
            return fail(StreamError::IO, "error while reading \"" + _filename + "\"", err);
        }
        cancel();
        return PollResult::END;
    }

    void cancel() override {
        _finished = true;
        if (_ifs.is_open()) _ifs.close();
    }

    size_t getNumReadLines() const {
        return _line_nr;
    }

private:
    PollResult fail(int code, const std::string& message, StreamError& err) {
        _error = StreamError(code, message);
        cancel();
        err = *_error;
        return PollResult::ERROR;
    }
};

template <typename T>
StreamSourcePtr<T> fromLineFile(const std::string& filename, typename LineFileSource<T>::ParseFunction parse) {
    return std::make_unique<LineFileSource<T>>(filename, std::move(parse));
}
