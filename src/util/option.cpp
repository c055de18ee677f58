
#include "option.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

#include "util/logger.hpp"

Option::Option(OptMap& map, GroupedOptionsList& groupedOpts, const std::string& id, const std::string& longid, const std::string& desc):
    id(id), longid(longid), desc(desc) {
    map[id] = this;
    // An option belongs to the group declared most recently
    if (!groupedOpts.empty()) groupedOpts.back()->opts.push_back(this);
}
bool Option::hasLongOption() const {
    return !longid.empty();
}

// Parses the full string as an integer, rejecting trailing garbage
static bool parseInt(const std::string& valStr, int& out) {
    if (valStr.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long parsed = strtol(valStr.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    if (parsed < INT32_MIN || parsed > INT32_MAX) return false;
    out = (int) parsed;
    return true;
}

bool BoolOption::operator()() const {return val;}
void BoolOption::set(bool val) {this->val = val;}
std::string BoolOption::getValAsString() const {return val ? "1" : "0";}
bool BoolOption::setValAsString(const std::string& valStr) {
    if (valStr == "1" || valStr == "true") set(true);
    else if (valStr == "0" || valStr == "false") set(false);
    else {
        LOG(V0_CRIT, "[ERROR] Option %s: \"%s\" is not a boolean\n", id.c_str(), valStr.c_str());
        return false;
    }
    return true;
}
void BoolOption::copyValue(const Option& other) {set( ((const BoolOption&)other)() );}
const char* BoolOption::getTypeString() const {return "bool";}

int IntOption::operator()() const {return val;}
bool IntOption::set(int val) {
    if (val < min) {
        LOG(V0_CRIT, "[ERROR] Option %s: %i < %i (min)\n", id.c_str(), val, min);
        return false;
    }
    if (val > max) {
        LOG(V0_CRIT, "[ERROR] Option %s: %i > %i (max)\n", id.c_str(), val, max);
        return false;
    }
    this->val = val;
    return true;
}
std::string IntOption::getValAsString() const {return std::to_string(val);}
bool IntOption::setValAsString(const std::string& valStr) {
    int parsed;
    if (!parseInt(valStr, parsed)) {
        LOG(V0_CRIT, "[ERROR] Option %s: \"%s\" is not an integer\n", id.c_str(), valStr.c_str());
        return false;
    }
    return set(parsed);
}
void IntOption::copyValue(const Option& other) {val = ((const IntOption&)other)();}
const char* IntOption::getTypeString() const {return "int";}

const std::string& StringOption::operator()() const {return val;}
void StringOption::set(const std::string& val) {this->val = val;}
std::string StringOption::getValAsString() const {return val;}
bool StringOption::setValAsString(const std::string& valStr) {set(valStr); return true;}
void StringOption::copyValue(const Option& other) {set( ((const StringOption&)other)() );}
const char* StringOption::getTypeString() const {return "string";}
