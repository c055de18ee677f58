#ifndef KMERGE_PARAMETERS_HPP
#define KMERGE_PARAMETERS_HPP

#include <string>
#include <vector>

#include "util/option.hpp"

class Parameters {

public:
	#include "optionslist.hpp"

public:
	Parameters() = default;
	Parameters(const Parameters& other);

	// Returns false if some argument could not be applied.
	bool init(int argc, char** argv);
	bool expand();

	void printBanner() const;
	void printUsage() const;
	std::string getParamsAsString() const;

	const std::vector<std::string>& getInputFiles() const;

private:
	std::vector<std::string> _input_files;
};

#endif
