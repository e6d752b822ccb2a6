#pragma once
#include <csignal>
#include <istream>
#include <string>
#include <vector>

#include "../core/utils.h"

enum class ParseStatus {
    Complete,
    Interrupted,
    Incomplete,
    ReadError
};

struct ParseResult {
    ParseStatus status{ ParseStatus::ReadError };
    ConfigField missing{ ConfigField::None };
};

// Pulls the credentials and the sync URL out of a pasted download script.
class InputParser {
public:
    explicit InputParser(volatile std::sig_atomic_t* interrupt = nullptr);

    ParseResult parse(std::istream& in, SyncConfig& out);

    // Exposed for tests; each returns true if it stored something.
    bool processLine(const std::string& line, SyncConfig& out) const;

    static std::vector<std::string> tokenize(const std::string& line);

private:
    bool processExport(const std::string& assignment, SyncConfig& out) const;
    bool processAws(const std::vector<std::string>& words, SyncConfig& out) const;
    bool interrupted() const;

private:
    volatile std::sig_atomic_t* interruptFlag{ nullptr };
};
