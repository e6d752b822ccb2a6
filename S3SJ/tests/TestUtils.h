#pragma once
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace s3sj_test {

inline int& failures() {
    static int count = 0;
    return count;
}

inline void check(bool cond, const std::string& what) {
    printf("%s: %s\n", cond ? "PASS" : "FAIL", what.c_str());
    if (!cond)
        ++failures();
}

inline int finish() {
    printf("%d errors.\n", failures());
    return failures() == 0 ? 0 : 1;
}

// Scratch directory, removed on destruction.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/s3sj_test.XXXXXX";
        const char* made = mkdtemp(tmpl);
        dir = made ? made : "";
    }

    ~TempDir() {
        if (!dir.empty()) {
            const std::string cmd = "rm -rf '" + dir + "'";
            int rc = std::system(cmd.c_str());
            (void)rc;
        }
    }

    const std::string& path() const { return dir; }
    std::string file(const std::string& name) const { return dir + "/" + name; }

    // Writes an executable /bin/sh script standing in for a real tool.
    std::string script(const std::string& name, const std::string& body) const {
        const std::string p = file(name);
        std::ofstream out(p, std::ios::trunc);
        out << "#!/bin/sh\n" << body << "\n";
        out.close();
        chmod(p.c_str(), 0755);
        return p;
    }

private:
    std::string dir;
};

inline std::string readFile(const std::string& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace s3sj_test
