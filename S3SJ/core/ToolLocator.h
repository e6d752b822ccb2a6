#pragma once
#include <string>

// `which` for the tools we drive: aws, sbatch, scontrol.
class ToolLocator {
public:
    ToolLocator();
    explicit ToolLocator(std::string searchPath);

    bool find(const std::string& name, std::string& out) const;

private:
    std::string path;
};
