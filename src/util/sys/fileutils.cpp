#include "fileutils.hpp"

#include <cerrno>
#include <sys/stat.h>

#include "util/logger.hpp"

bool FileUtils::isDirectory(const std::string& dirpath) {
    struct stat sb;
    return stat(dirpath.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}

int FileUtils::mkdir(const std::string& dir) {
    // Create each missing parent directory first, like "mkdir -p"
    for (size_t i = 0; i < dir.size(); i++) {
        if (dir[i] == '/' && i > 0 && i+1 < dir.size()) {
            std::string subdir(dir.begin(), dir.begin() + i);
            int res = ::mkdir(subdir.c_str(), S_IRWXU | S_IRWXG | S_IRWXO);
            if (res != 0 && errno != EEXIST) {
                LOG(V0_CRIT, "[ERROR] mkdir -p \"%s\" failed, errno %i\n", subdir.c_str(), errno);
                return res;
            }
        }
    }
    auto res = ::mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IRWXO);
    if (res == 0 || errno == EEXIST) return 0;
    LOG(V0_CRIT, "[ERROR] mkdir -p \"%s\" failed, errno %i\n", dir.c_str(), errno);
    return res;
}
