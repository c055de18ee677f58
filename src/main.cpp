
#include <stdlib.h>
#include <errno.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "util/sys/timer.hpp"
#include "util/logger.hpp"
#include "util/params.hpp"
#include "util/sys/background_worker.hpp"
#include "stream/kmerge.hpp"
#include "stream/coalesce.hpp"
#include "stream/line_file_source.hpp"
#include "stream/spsc_channel.hpp"
#include "stream/stream_driver.hpp"

#ifndef KMERGE_VERSION
#define KMERGE_VERSION "(dbg)"
#endif

#define EXIT_CODE_OK 0
#define EXIT_CODE_ABORTED 1
#define EXIT_CODE_INPUTS_SKIPPED 2

// One output line together with the number of equal input lines it stands for.
template <typename T>
struct Record {
    T value;
    size_t multiplicity {1};
};

bool parseNumber(const std::string& line, long long& out) {
    char* end;
    errno = 0;
    out = strtoll(line.c_str(), &end, 10);
    return errno == 0 && end != line.c_str() && *end == '\0';
}
bool parseNumber(const std::string& line, std::string& out) {
    out = line;
    return true;
}

void writeValue(std::ostream& os, long long val) {os << val;}
void writeValue(std::ostream& os, const std::string& val) {os << val;}

struct MergeSummary {
    size_t numEmitted {0};
    size_t numInputItems {0};
    std::vector<StreamError> errors;
    bool aborted {false};
};

// Reads an input file in a dedicated thread and feeds its items into a channel.
template <typename T>
class InputProducer {

private:
    int _index;
    std::string _filename;
    std::shared_ptr<SPSCChannel<Record<T>>> _channel;
    BackgroundWorker _worker;

public:
    InputProducer(int index, const std::string& filename, int capacity) :
        _index(index), _filename(filename),
        _channel(std::make_shared<SPSCChannel<Record<T>>>(capacity)) {}

    StreamSourcePtr<Record<T>> getSource() {
        return fromChannel<Record<T>>(_channel);
    }

    void start() {
        _worker.run([this]() {run();});
    }

    void stop() {
        _channel->cancel();
        _worker.stop();
    }

    ~InputProducer() {
        stop();
    }

private:
    void run() {
        Logger logger = Logger::getMainInstance().copy("<P" + std::to_string(_index) + ">",
            ".p" + std::to_string(_index));
        LineFileSource<Record<T>> reader(_filename, [](const std::string& line, Record<T>& out) {
            return parseNumber(line, out.value);
        });

        size_t numPushed = 0;
        Record<T> record;
        StreamError err;
        while (_worker.continueRunning()) {
            auto result = reader.poll(record, err);
            if (result == PollResult::ITEM) {
                if (!_channel->push(std::move(record))) {
                    LOGGER(logger, V4_VVER, "consumer cancelled input after %lu items\n", numPushed);
                    return;
                }
                numPushed++;
                continue;
            }
            if (result == PollResult::ERROR) {
                LOGGER(logger, V3_VERB, "input failed after %lu items: %s\n", numPushed, err.message.c_str());
                _channel->markFailed(err);
                return;
            }
            if (result == PollResult::END) {
                LOGGER(logger, V4_VVER, "input exhausted after %lu items\n", numPushed);
                _channel->markExhausted();
                return;
            }
        }
        _channel->markFailed(StreamError(StreamError::PRODUCER, "producer of \"" + _filename + "\" interrupted"));
    }
};

template <typename T>
MergeSummary mergeInputs(const Parameters& params, std::ostream& out) {

    MergeSummary summary;
    auto& files = params.getInputFiles();

    // Set up input sources
    std::vector<std::unique_ptr<InputProducer<T>>> producers;
    std::vector<StreamSourcePtr<Record<T>>> sources;
    for (size_t i = 0; i < files.size(); i++) {
        if (params.async()) {
            producers.push_back(std::make_unique<InputProducer<T>>(i, files[i], params.channelCapacity()));
            sources.push_back(producers.back()->getSource());
        } else {
            sources.push_back(fromLineFile<Record<T>>(files[i], [](const std::string& line, Record<T>& out) {
                return parseNumber(line, out.value);
            }));
        }
    }

    Precedence<Record<T>> precedes;
    if (params.order() == KMERGE_ORDER_DESC) {
        precedes = [](const Record<T>& a, const Record<T>& b) {return b.value < a.value;};
    } else {
        precedes = [](const Record<T>& a, const Record<T>& b) {return a.value < b.value;};
    }
    auto merge = kmergeBy<Record<T>>(std::move(sources), precedes);
    merge->setFailFast(params.failFast());

    StreamSourcePtr<Record<T>> result = std::move(merge);
    if (params.dedup()) {
        result = coalesce<Record<T>>(std::move(result), [](Record<T>& acc, Record<T>& next) {
            if (acc.value < next.value || next.value < acc.value) return false;
            acc.multiplicity += next.multiplicity;
            return true;
        });
    }

    StreamDriver<Record<T>> driver(std::move(result), params.wakeupTimeoutMillis());
    for (auto& producer : producers) producer->start();

    // Pull merged items until the end of all inputs
    Record<T> record;
    StreamError err;
    PollResult res;
    while (true) {
        res = driver.next(record, err);
        if (res == PollResult::END) break;
        if (res == PollResult::ERROR) {
            LOG(V1_WARN, "[WARN] Input #%i (%s) failed: %s\n", err.sourceIndex,
                err.sourceIndex >= 0 && err.sourceIndex < (int)files.size() ?
                    files[err.sourceIndex].c_str() : "?",
                err.message.c_str());
            summary.errors.push_back(err);
            if (params.failFast()) {
                summary.aborted = true;
                break;
            }
            continue;
        }
        if (params.countDuplicates()) out << record.multiplicity << " ";
        writeValue(out, record.value);
        out << "\n";
        summary.numEmitted++;
        summary.numInputItems += record.multiplicity;
    }

    LOG(V4_VVER, "Merged stream stopped at %s after %lu items and %lu errors\n",
        pollResultToStr(res), driver.getNumItems(), driver.getNumErrors());
    driver.cancel();
    for (auto& producer : producers) producer->stop();
    out.flush();
    return summary;
}

void writeReport(const Parameters& params, const MergeSummary& summary, float elapsed) {
    nlohmann::json json = {
        {"version", KMERGE_VERSION},
        {"inputs", params.getInputFiles()},
        {"order", params.order()},
        {"numeric", params.numeric()},
        {"async", params.async()},
        {"dedup", params.dedup()},
        {"emitted_items", summary.numEmitted},
        {"input_items", summary.numInputItems},
        {"aborted", summary.aborted},
        {"elapsed_seconds", elapsed}
    };
    json["errors"] = nlohmann::json::array();
    for (auto& err : summary.errors) {
        json["errors"].push_back({
            {"source", err.sourceIndex},
            {"code", err.code},
            {"message", err.message}
        });
    }

    std::ofstream ofs(params.reportFile());
    if (!ofs.is_open()) {
        LOG(V1_WARN, "[WARN] Cannot write report to \"%s\"\n", params.reportFile().c_str());
        return;
    }
    ofs << std::setw(4) << json << std::endl;
}

int main(int argc, char *argv[]) {

    Timer::init();

    // Messages about the arguments must not end up among merged output on stdout
    Logger::LoggerConfig earlyConfig;
    earlyConfig.logToStderr = true;
    if (!Logger::init(earlyConfig)) return EXIT_CODE_ABORTED;

    Parameters params;
    bool paramsValid = params.init(argc, argv);

    Logger::LoggerConfig config;
    config.verbosity = params.verbosity();
    config.coloredOutput = params.coloredOutput();
    config.quiet = params.quiet();
    config.flushFileImmediately = params.immediateFileFlush();
    // Keep stdout free for the merged output
    config.logToStderr = params.outputFile().empty();
    std::string logDir = params.logDirectory();
    std::string logFilename = "kmerge.log";
    if (!logDir.empty()) {
        config.logDirOrNull = &logDir;
        config.logFilenameOrNull = &logFilename;
    }
    if (!Logger::init(config)) return EXIT_CODE_ABORTED;
    if (!logDir.empty()) {
        LOG(V3_VERB, "Logging into %s\n", Logger::getMainInstance().getLogFilename().c_str());
    }

    if (params.help()) {
        params.printUsage();
        return EXIT_CODE_OK;
    }
    if (!paramsValid) {
        LOG(V0_CRIT, "[ERROR] Invalid arguments; run with -h for usage information\n");
        return EXIT_CODE_ABORTED;
    }
    if (params.getInputFiles().empty()) {
        params.printUsage();
        return EXIT_CODE_ABORTED;
    }

    params.printBanner();
    LOG(V2_INFO, "kmerge %s\n", KMERGE_VERSION);
    LOG(V3_VERB, "Program options: %s\n", params.getParamsAsString().c_str());

    std::ofstream ofs;
    if (!params.outputFile().empty()) {
        ofs.open(params.outputFile());
        if (!ofs.is_open()) {
            LOG(V0_CRIT, "[ERROR] Cannot open output file \"%s\"\n", params.outputFile().c_str());
            return EXIT_CODE_ABORTED;
        }
    }
    std::ostream& out = params.outputFile().empty() ? std::cout : ofs;

    float mergeStart = Timer::elapsedSeconds();
    MergeSummary summary = params.numeric() ?
        mergeInputs<long long>(params, out) :
        mergeInputs<std::string>(params, out);

    float elapsed = Timer::elapsedSeconds();
    LOG(V2_INFO, "Merged %lu input items from %lu inputs into %lu items in %.3fms (%lu errors)\n",
        summary.numInputItems, params.getInputFiles().size(), summary.numEmitted,
        Timer::millisSince(mergeStart), summary.errors.size());

    if (!params.reportFile().empty()) writeReport(params, summary, elapsed);

    Logger::getMainInstance().flush();
    if (summary.aborted) {
        LOG(V0_CRIT, "[ERROR] Merge aborted on the first input error\n");
        return EXIT_CODE_ABORTED;
    }
    return summary.errors.empty() ? EXIT_CODE_OK : EXIT_CODE_INPUTS_SKIPPED;
}
