#pragma once
#include <string>
#include "../core/utils.h"

class ArgumentParser {
public:
    bool parse(int argc, char* argv[], SubmitOptions& out);
    void printUsage(const std::string& program) const;
};
