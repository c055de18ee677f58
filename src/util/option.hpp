#ifndef KMERGE_OPTION_HPP
#define KMERGE_OPTION_HPP

#include <stdint.h>
#include <string>
#include <list>

#include <robin_hood.h>

struct Option;

typedef robin_hood::unordered_node_map<std::string, Option*> OptMap;
struct OptGroup {
    std::string groupId; std::string desc; std::list<Option*> opts;
    OptGroup(std::list<OptGroup*>& groupedOpts, const std::string& groupId, const std::string& desc) :
            groupId(groupId), desc(desc) {
        groupedOpts.push_back(this);
    }
};
typedef std::list<OptGroup*> GroupedOptionsList;

#define OPTION_GROUP(member, id, desc) OptGroup member = OptGroup(_grouped_list, id, desc);
#define OPT_BOOL(member, id, longid, val, desc) BoolOption member = BoolOption(_global_map, _grouped_list, id, longid, desc, val);
#define OPT_STRING(member, id, longid, val, desc) StringOption member = StringOption(_global_map, _grouped_list, id, longid, desc, val);
#define OPT_INT(member, id, longid, val, min, max, desc) IntOption member = IntOption(_global_map, _grouped_list, id, longid, desc, val, min, max);

#define LARGE_INT 9999999
#define MAX_INT INT32_MAX

struct Option {
	std::string id;
	std::string longid;
	std::string desc;
	Option(OptMap& map, GroupedOptionsList& groupedOpts, const std::string& id, const std::string& longid, const std::string& desc);
    virtual ~Option() {}
    bool hasLongOption() const;
    virtual std::string getValAsString() const = 0;
    // Returns false if the value could not be parsed or violates the option's bounds.
    virtual bool setValAsString(const std::string& valStr) = 0;
    virtual void copyValue(const Option& other) = 0;
    virtual const char* getTypeString() const = 0;
};

struct BoolOption : public Option {
	bool val;
	BoolOption(OptMap& map, GroupedOptionsList& groupedOpts, const std::string& id, const std::string& longid, const std::string& desc, bool val):
        Option(map, groupedOpts, id, longid, desc), val(val) {}
	bool operator()() const;
    void set(bool val);
    std::string getValAsString() const override;
    bool setValAsString(const std::string& valStr) override;
    void copyValue(const Option& other) override;
    const char* getTypeString() const override;
};
struct IntOption : public Option {
	int val;
	int min;
	int max;
	IntOption(OptMap& map, GroupedOptionsList& groupedOpts, const std::string& id, const std::string& longid, const std::string& desc, int val, int min, int max):
        Option(map, groupedOpts, id, longid, desc), val(val), min(min), max(max) {}
	int operator()() const;
    bool set(int val);
    std::string getValAsString() const override;
    bool setValAsString(const std::string& valStr) override;
    void copyValue(const Option& other) override;
    const char* getTypeString() const override;
};
struct StringOption : public Option {
	std::string val;
	StringOption(OptMap& map, GroupedOptionsList& groupedOpts, const std::string& id, const std::string& longid, const std::string& desc, const std::string& val):
        Option(map, groupedOpts, id, longid, desc), val(val) {}
	const std::string& operator()() const;
    void set(const std::string& val);
    std::string getValAsString() const override;
    bool setValAsString(const std::string& valStr) override;
    void copyValue(const Option& other) override;
    const char* getTypeString() const override;
};

#endif
