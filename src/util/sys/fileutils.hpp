#ifndef KMERGE_FILE_UTILS_HPP
#define KMERGE_FILE_UTILS_HPP

#include <string>

class FileUtils {

public:
    static int mkdir(const std::string& dir);
    static bool isDirectory(const std::string& dirpath);
};

#endif
