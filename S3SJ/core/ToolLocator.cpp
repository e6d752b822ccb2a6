#include "ToolLocator.h"

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
bool isExecutableFile(const std::string& candidate) {
    struct stat st {};
    if (stat(candidate.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return false;
    return access(candidate.c_str(), X_OK) == 0;
}
}

ToolLocator::ToolLocator() {
    const char* env = std::getenv("PATH");
    path = env ? env : "";
}

ToolLocator::ToolLocator(std::string searchPath)
    : path(std::move(searchPath)) {
}

bool ToolLocator::find(const std::string& name, std::string& out) const {
    if (name.empty())
        return false;

    if (name.find('/') != std::string::npos) {
        if (!isExecutableFile(name))
            return false;
        std::error_code ec;
        fs::path abs = fs::absolute(name, ec);
        out = ec ? name : abs.lexically_normal().string();
        return true;
    }

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        // Empty PATH element means the current directory
        if (dir.empty())
            dir = ".";

        std::error_code ec;
        fs::path candidate = fs::absolute(fs::path(dir) / name, ec);
        if (ec)
            continue;

        if (isExecutableFile(candidate.string())) {
            out = candidate.lexically_normal().string();
            return true;
        }
    }

    return false;
}
