
#include <string.h>
#include <map>

#include "params.hpp"
#include "logger.hpp"

const char* BANNER = "\nkmerge -- lazy k-way merging of sorted streams\n";
const char* USAGE = "Usage: kmerge [options] <sorted-input-file> [<sorted-input-file> ...]\n";

Parameters::Parameters(const Parameters& other) : _input_files(other._input_files) {
    for (const auto& [id, opt] : other._global_map) {
        _global_map.at(id)->copyValue(*opt);
    }
}

bool Parameters::init(int argc, char** argv) {

    // Create dictionary mapping long option names to short option names
    robin_hood::unordered_node_map<std::string, std::string> longToShortOpt;
    for (const auto& [id, opt] : _global_map) {
        if (opt->hasLongOption()) {
            longToShortOpt[opt->longid] = opt->id;
        }
    }

    bool success = true;

    // Iterate over all arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        // Arguments without option dash denote input files
        if (arg.empty() || arg[0] != '-' || arg == "-") {
            _input_files.push_back(arg);
            continue;
        }
        arg = arg.substr(1);
        // optional second option dash
        if (!arg.empty() && arg[0] == '-') arg = arg.substr(1);

        // No equals sign in this argument: set arg to 1 implicitly
        std::string left = arg;
        std::string right = "1";
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            // Divide string at equals sign, set arg to given value
            left = arg.substr(0, eq);
            right = arg.substr(eq+1);
        }
        if (longToShortOpt.count(left)) left = longToShortOpt[left];
        if (!_global_map.count(left)) {
            LOG(V1_WARN, "[WARN] Unknown option \"%s\"\n", argv[i]);
            continue;
        }
        if (!_global_map.at(left)->setValAsString(right)) success = false;
    }

    // Expand and propagate options as necessary
    return expand() && success;
}

bool Parameters::expand() {
    if (order() != KMERGE_ORDER_ASC && order() != KMERGE_ORDER_DESC) {
        LOG(V0_CRIT, "[ERROR] Invalid order \"%s\", expected \"%s\" or \"%s\"\n",
            order().c_str(), KMERGE_ORDER_ASC, KMERGE_ORDER_DESC);
        return false;
    }
    if (countDuplicates() && !dedup()) {
        // Counting runs implies collapsing them
        dedup.set(true);
    }
    return true;
}

void Parameters::printBanner() const {
    LOG_OMIT_PREFIX(V2_INFO, "%s\n", BANNER);
}

void Parameters::printUsage() const {
    LOG_OMIT_PREFIX(V0_CRIT, USAGE);
    LOG_OMIT_PREFIX(V0_CRIT, "Each option must be given as \"-key=value\" or \"--key=value\" or (for boolean options only) just \"-[-]key\".\n");

    for (const auto* group : _grouped_list) {
        LOG_OMIT_PREFIX(V0_CRIT, "\n%s:\n", group->desc.c_str());
        for (const auto* opt : group->opts) {
            std::string defaultVal = opt->getValAsString();
            if (!defaultVal.empty()) defaultVal = ", default: " + defaultVal;

            const char* typeStr = opt->getTypeString();

            if (opt->hasLongOption()) {
                LOG_OMIT_PREFIX(V0_CRIT, "-%s , -%s (%s%s)\n\t\t%s\n",
                    opt->id.c_str(), opt->longid.c_str(), typeStr, defaultVal.c_str(), opt->desc.c_str());
            } else {
                LOG_OMIT_PREFIX(V0_CRIT, "-%s (%s%s)\n\t\t%s\n",
                    opt->id.c_str(), typeStr, defaultVal.c_str(), opt->desc.c_str());
            }
        }
    }
}

std::string Parameters::getParamsAsString() const {
    std::string out = "";
    std::map<std::string, std::string> sortedParams;
    for (const auto& [id, opt] : _global_map) {
        sortedParams[id] = opt->getValAsString();
    }
    for (const auto& it : sortedParams) {
        if (!it.second.empty()) {
            out += "-" + it.first + "=" + it.second + " ";
        }
    }
    for (const auto& file : _input_files) out += file + " ";
    return out;
}

const std::vector<std::string>& Parameters::getInputFiles() const {
    return _input_files;
}
