
#include <stdlib.h>
#include <fstream>
#include <string>
#include <vector>

#include "util/assert.hpp"
#include "util/logger.hpp"
#include "util/sys/timer.hpp"
#include "util/sys/fileutils.hpp"
#include "stream/kmerge.hpp"
#include "stream/line_file_source.hpp"

const std::string testDir = "/tmp/kmerge_test_line_file_source";

std::string writeFile(const std::string& name, const std::string& content) {
    std::string path = testDir + "/" + name;
    std::ofstream ofs(path);
    ofs << content;
    return path;
}

bool parseInt(const std::string& line, int& out) {
    char* end;
    long val = strtol(line.c_str(), &end, 10);
    if (end == line.c_str() || *end != '\0') return false;
    out = (int) val;
    return true;
}

void testReadFile() {
    LOG(V2_INFO, "Testing reading of a file ...\n");
    auto path = writeFile("numbers.txt", "1\n3\n\n7\r\n10");
    LineFileSource<int> source(path, parseInt);

    std::vector<int> items;
    int item;
    StreamError err;
    while (true) {
        auto res = source.poll(item, err);
        assert(res != PollResult::PENDING && res != PollResult::ERROR);
        if (res == PollResult::END) break;
        items.push_back(item);
    }
    assert(items == std::vector<int>({1, 3, 7, 10}));
    assert(source.getNumReadLines() == 5);
    auto res = source.poll(item, err);
    assert(res == PollResult::END);
}

void testParseError() {
    LOG(V2_INFO, "Testing parse errors ...\n");
    auto path = writeFile("broken.txt", "1\n2\nthree\n4\n");
    LineFileSource<int> source(path, parseInt);

    int item;
    StreamError err;
    auto res = source.poll(item, err);
    assert(res == PollResult::ITEM && item == 1);
    res = source.poll(item, err);
    assert(res == PollResult::ITEM && item == 2);
    for (int i = 0; i < 2; i++) {
        res = source.poll(item, err);
        assert(res == PollResult::ERROR);
        assert(err.code == StreamError::PARSE);
        assert(err.message.find(":3:") != std::string::npos);
        LOG(V2_INFO, "%s\n", err.message.c_str());
    }
}

void testMissingFile() {
    LOG(V2_INFO, "Testing missing files ...\n");
    auto merge = kmergeMin<int>(makeSourceList<int>(
        fromLineFile<int>(writeFile("a.txt", "1\n4\n"), parseInt),
        fromLineFile<int>(testDir + "/does_not_exist.txt", parseInt),
        fromLineFile<int>(writeFile("b.txt", "2\n3\n"), parseInt)
    ));
    std::vector<int> items;
    int numErrors = 0;
    int item;
    StreamError err;
    while (true) {
        auto res = merge->poll(item, err);
        assert(res != PollResult::PENDING);
        if (res == PollResult::END) break;
        if (res == PollResult::ERROR) {
            assert(err.code == StreamError::IO);
            assert(err.sourceIndex == 1);
            numErrors++;
            continue;
        }
        items.push_back(item);
    }
    assert(numErrors == 1);
    assert(items == std::vector<int>({1, 2, 3, 4}));
}

int main() {
    Timer::init();
    Logger::init(V5_DEBG);
    FileUtils::mkdir(testDir);

    testReadFile();
    testParseError();
    testMissingFile();
}
