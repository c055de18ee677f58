
#ifndef KMERGE_LOGGER_HPP
#define KMERGE_LOGGER_HPP

#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <string>

#define V0_CRIT 0
#define V1_WARN 1
#define V2_INFO 2
#define V3_VERB 3
#define V4_VVER 4
#define V5_DEBG 5
#define V6_DEBGV 6

#define LOG_ADD_SRCSLOT  (1<<7)
#define LOG_NO_PREFIX    (1<<8)

class Logger {

// Singleton for main console instance
private:
    static Logger _main_instance;
    Logger() {}
    Logger(const Logger& other) = delete;
    Logger& operator=(const Logger& other) = delete;
public:
    struct LoggerConfig {
        int verbosity {2};
        bool coloredOutput = false;
        bool quiet = false;
        bool flushFileImmediately = false;
        // Console output goes to stderr instead of stdout
        bool logToStderr = false;
        const std::string* logDirOrNull = nullptr;
        const std::string* logFilenameOrNull = nullptr;
    };

    static void init(int verbosity);
    static bool init(const LoggerConfig& config);
    static Logger& getMainInstance() {
        return _main_instance;
    }
    Logger(Logger&& other);
    Logger& operator=(Logger&& other);
    ~Logger();

// Usual class members
private:
    std::string _log_directory;
    std::string _log_filename;
    std::string _line_prefix;
    FILE* _log_cfile = nullptr;
    int _verbosity = 2;
    bool _colored_output = false;
    bool _quiet = false;
    bool _flush_file_immediately = false;
    FILE* _console = stdout;

public:
    std::string getLogFilename() const {
        return _log_filename;
    }

    /*
    Creates a child logger which writes with an extended line prefix
    into "<log file><filenameSuffix>" if the parent writes to a file.
    */
    Logger copy(const std::string& linePrefix, const std::string& filenameSuffix, int verbosityOffset = 0) const;

    void log(unsigned int options, const char* str, ...) const;
    void flush() const;

    friend bool log_return_false(const char* str, ...);

private:

    void log(va_list& args, unsigned int options, const char* str) const;
};

bool log_return_false(const char* str, ...);

#include "logger_defs.h"

#endif
