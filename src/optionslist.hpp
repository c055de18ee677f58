
#ifndef KMERGE_OPTIONS_LIST_HPP
#define KMERGE_OPTIONS_LIST_HPP

#include "util/option.hpp"

#define KMERGE_ORDER_ASC "asc"
#define KMERGE_ORDER_DESC "desc"

// All declared options will be stored in this member of the Parameters class.
OptMap _global_map;
GroupedOptionsList _grouped_list;

// New options can be added here. They will then be initialized as member fields in the Parameters class.
// The value of an option can be queried on a Parameters object _params as such:
// _params.optionmember()
// The columns for OPT_* are defined as follows:
// TYPE  member name                      option ID (short, long)                      default (, min, max)     description

///////////////////////////////////////////////////////////////////////

OPTION_GROUP(grpGeneral, "general", "General")
 OPT_BOOL(help,                           "h", "help",                                 false,                   "Print help and exit")
 OPT_STRING(order,                        "order", "",                                 KMERGE_ORDER_ASC,        "Order of the (already sorted) inputs and of the output: asc or desc")
 OPT_BOOL(numeric,                        "n", "numeric",                              false,                   "Compare lines as signed 64-bit integers instead of byte strings")
 OPT_STRING(outputFile,                   "o", "output",                               "",                      "Write merged output to this file instead of stdout") //[[AUTOCOMPLETE_FILE]]
 OPT_BOOL(dedup,                          "u", "dedup",                                false,                   "Collapse runs of equal adjacent output items into one item")
 OPT_BOOL(countDuplicates,                "c", "count",                                false,                   "With -dedup: prefix each output item with the size of its run")

///////////////////////////////////////////////////////////////////////

OPTION_GROUP(grpStreams, "streams", "Input streams")
 OPT_BOOL(async,                          "async", "",                                 false,                   "Read each input in its own producer thread feeding a bounded channel")
 OPT_INT(channelCapacity,                 "cc", "channel-capacity",                    1024, 1, LARGE_INT,      "Capacity (in items) of each input channel with -async")
 OPT_BOOL(failFast,                       "ff", "fail-fast",                           false,                   "Abort the merge on the first input error instead of skipping the failed input")
 OPT_INT(wakeupTimeoutMillis,             "wt", "wakeup-timeout",                      100,  1, LARGE_INT,      "Max. milliseconds to sleep between polls of pending inputs")

///////////////////////////////////////////////////////////////////////

OPTION_GROUP(grpOutput, "output", "Output")
 OPT_BOOL(coloredOutput,                  "colors", "",                                false,                   "Colored terminal output based on messages' verbosity")
 OPT_BOOL(immediateFileFlush,             "iff", "immediate-file-flush",               false,                   "Flush log files after each line instead of buffering")
 OPT_STRING(logDirectory,                 "log", "log-directory",                      "",                      "Directory to save logs in") //[[AUTOCOMPLETE_DIRECTORY]]
 OPT_BOOL(quiet,                          "q", "quiet",                                false,                   "Do not log to stdout besides critical information")
 OPT_STRING(reportFile,                   "report", "",                                "",                      "Write a JSON summary of the merge to this file") //[[AUTOCOMPLETE_FILE]]
 OPT_INT(verbosity,                       "v", "verbosity",                            1,    0, 6,              "Logging verbosity: 0=CRIT 1=WARN 2=INFO 3=VERB 4=VVERB 5=DEBG")

#endif
