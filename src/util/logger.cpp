#include <iostream>
#include <ostream>
#include <algorithm>
#include <cerrno>

#include "util/sys/fileutils.hpp"
#include "util/sys/timer.hpp"

#include "logger.hpp"

// ANSI color codes for terminal output
enum Code {
    FG_DEFAULT = 39,
    FG_RED = 31,
    FG_BLUE = 34,
    FG_MAGENTA = 35,
    FG_CYAN = 36,
    FG_DARK_GRAY = 90,
    FG_LIGHT_RED = 91,
    FG_LIGHT_BLUE = 94,
    FG_LIGHT_CYAN = 96,
};
class Modifier {
    Code code;
public:
    Modifier(Code pCode) : code(pCode) {}
    friend std::ostream&
    operator<<(std::ostream& os, const Modifier& mod) {
        return os << "\033[" << mod.code << "m";
    }
};

Logger Logger::_main_instance;

bool log_return_false(const char* str, ...) {
    va_list args;
    va_start(args, str);
    Logger::getMainInstance().log(args, V0_CRIT, str);
    va_end(args);
    return false;
}

void Logger::init(int verbosity) {
    LoggerConfig config;
    config.verbosity = verbosity;
    Logger::init(config);
}

bool Logger::init(const LoggerConfig& config) {
    if (_main_instance._log_cfile != nullptr) {
        fclose(_main_instance._log_cfile);
        _main_instance._log_cfile = nullptr;
    }
    _main_instance._verbosity = std::min(7, config.verbosity);
    _main_instance._colored_output = config.coloredOutput;
    _main_instance._quiet = config.quiet;
    _main_instance._flush_file_immediately = config.flushFileImmediately;
    _main_instance._console = config.logToStderr ? stderr : stdout;

    if (config.logDirOrNull == nullptr || config.logFilenameOrNull == nullptr) return true;

    // Create logging directory as necessary
    const std::string& logDir = *config.logDirOrNull;
    _main_instance._log_directory = (logDir.size() == 0 ? "." : logDir);
    if (!FileUtils::isDirectory(_main_instance._log_directory)) {
        int status = FileUtils::mkdir(_main_instance._log_directory);
        if (status != 0) {
            _main_instance._quiet = false;
            LOGGER(_main_instance, V0_CRIT, "[ERROR] status %i while trying to create / access log directory \"%s\"\n",
                status, _main_instance._log_directory.c_str());
            return false;
        }
    }
    _main_instance._log_directory += "/";

    // Open logging file
    _main_instance._log_filename = _main_instance._log_directory + *config.logFilenameOrNull;
    _main_instance._log_cfile = fopen(_main_instance._log_filename.c_str(), "a");
    if (_main_instance._log_cfile == nullptr) {
        _main_instance._quiet = false;
        LOGGER(_main_instance, V0_CRIT, "[ERROR] cannot open log file \"%s\", errno=%i\n",
            _main_instance._log_filename.c_str(), errno);
        return false;
    }
    return true;
}

Logger::Logger(Logger&& other) :
    _log_directory(std::move(other._log_directory)), _log_filename(std::move(other._log_filename)),
    _line_prefix(std::move(other._line_prefix)), _log_cfile(other._log_cfile),
    _verbosity(other._verbosity), _colored_output(other._colored_output), _quiet(other._quiet),
    _flush_file_immediately(other._flush_file_immediately), _console(other._console) {

    other._log_cfile = nullptr;
}
Logger& Logger::operator=(Logger&& other) {
    if (_log_cfile != nullptr && _log_cfile != other._log_cfile) fclose(_log_cfile);
    _log_directory = std::move(other._log_directory);
    _log_filename = std::move(other._log_filename);
    _line_prefix = std::move(other._line_prefix);
    _log_cfile = other._log_cfile;
    _verbosity = other._verbosity;
    _colored_output = other._colored_output;
    _quiet = other._quiet;
    _flush_file_immediately = other._flush_file_immediately;
    _console = other._console;

    other._log_cfile = nullptr;
    return *this;
}
Logger::~Logger() {
    flush();
    if (_log_cfile != nullptr) fclose(_log_cfile);
}

Logger Logger::copy(const std::string& linePrefix, const std::string& filenameSuffix, int verbosityOffset) const {
    Logger c;
    if (_log_cfile != nullptr) {
        c._log_directory = _log_directory;
        c._log_filename = _log_filename + filenameSuffix;
        c._log_cfile = fopen(c._log_filename.c_str(), "a");
        if (c._log_cfile == nullptr) {
            // Fall back to console output only
            LOG(V1_WARN, "[WARN] cannot open child log file \"%s\", errno=%i\n", c._log_filename.c_str(), errno);
        }
    }
    c._line_prefix = _line_prefix + " " + linePrefix;
    c._verbosity = _verbosity + verbosityOffset;
    c._colored_output = _colored_output;
    c._quiet = _quiet;
    c._flush_file_immediately = _flush_file_immediately;
    c._console = _console;
    return c;
}

void Logger::log(unsigned int options, const char* str, ...) const {
    va_list args;
    va_start(args, str);
    log(args, options, str);
    va_end(args);
}

void Logger::flush() const {
    if (!_quiet) fflush(_console);
    if (_log_cfile != nullptr) fflush(_log_cfile);
}

void Logger::log(va_list& args, unsigned int options, const char* str) const {

    int verbosity = options & 7;
    if (verbosity > _verbosity) return;
    bool prefix = (options & LOG_NO_PREFIX) == 0;
    bool withSrcSlot = (options & LOG_ADD_SRCSLOT) != 0;

    // The slot a message refers to precedes the actual arguments
    int srcSlot = -1;
    if (withSrcSlot) {
        srcSlot = va_arg(args, int);
    }

    std::ostream& console = _console == stderr ? std::cerr : std::cout;

    // Colored output, if applicable
    if (!_quiet && _colored_output) {
        fflush(_console);
        if (verbosity <= V0_CRIT) {
            console << Modifier(Code::FG_LIGHT_RED);
        } else if (verbosity == V1_WARN) {
            console << Modifier(Code::FG_RED);
        } else if (verbosity == V2_INFO) {
            console << Modifier(Code::FG_LIGHT_BLUE);
        } else if (verbosity == V3_VERB) {
            console << Modifier(Code::FG_BLUE);
        } else if (verbosity == V4_VVER) {
            console << Modifier(Code::FG_MAGENTA);
        } else {
            console << Modifier(Code::FG_DARK_GRAY);
        }
        console.flush();
    }

    // Timestamp and line prefix
    if (prefix) {
        // Relative time to program start
        float elapsedRel = Timer::elapsedSeconds();
        if (!_quiet) fprintf(_console, "%.3f%s ", elapsedRel, _line_prefix.c_str());
        if (_log_cfile != nullptr) {
            fprintf(_log_cfile, "%.3f%s ", elapsedRel, _line_prefix.c_str());
        }
    }

    // logging message
    va_list argsCopy; va_copy(argsCopy, args); // retrieve copy of "args"
    if (!_quiet) vfprintf(_console, str, args); // consume original args
    if (_log_cfile != nullptr) vfprintf(_log_cfile, str, argsCopy); // consume copied args
    if (srcSlot >= 0) {
        if (!_quiet) fprintf(_console, " <= [%i]\n", srcSlot);
        if (_log_cfile != nullptr) {
            fprintf(_log_cfile, " <= [%i]\n", srcSlot);
        }
    }
    va_end(argsCopy); // destroy copy

    // Immediate file flushing if desired
    if (_log_cfile != nullptr && _flush_file_immediately) fflush(_log_cfile);

    // Reset terminal colors
    if (!_quiet && _colored_output) {
        fflush(_console);
        console << Modifier(Code::FG_DEFAULT);
        console.flush();
    }
}

