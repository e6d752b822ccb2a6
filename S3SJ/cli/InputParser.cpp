#include "InputParser.h"

#include <cctype>

namespace {
std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        const char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first)
            return value.substr(1, value.size() - 2);
    }
    return value;
}
}

InputParser::InputParser(volatile std::sig_atomic_t* interrupt)
    : interruptFlag(interrupt) {
}

bool InputParser::interrupted() const {
    return interruptFlag && *interruptFlag != 0;
}

std::vector<std::string> InputParser::tokenize(const std::string& line) {
    std::vector<std::string> words;
    std::string current;

    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        }
        else {
            current += c;
        }
    }
    if (!current.empty())
        words.push_back(current);

    return words;
}

ParseResult InputParser::parse(std::istream& in, SyncConfig& out) {
    ParseResult result;
    std::string line;

    for (;;) {
        if (interrupted()) {
            result.status = ParseStatus::Interrupted;
            return result;
        }

        if (!std::getline(in, line))
            break;

        processLine(line, out);
    }

    // A SIGINT during the read shows up as a failed stream
    if (interrupted()) {
        result.status = ParseStatus::Interrupted;
        return result;
    }

    if (!in.eof() || in.bad()) {
        result.status = ParseStatus::ReadError;
        return result;
    }

    result.missing = firstMissingField(out);
    result.status = result.missing == ConfigField::None
        ? ParseStatus::Complete
        : ParseStatus::Incomplete;
    return result;
}

bool InputParser::processLine(const std::string& line, SyncConfig& out) const {
    const auto words = tokenize(line);
    if (words.empty())
        return false;

    if (words[0] == "export") {
        // "export" alone, or "export -p", carries nothing for us
        if (words.size() < 2)
            return false;
        return processExport(words[1], out);
    }

    if (words[0] == "aws")
        return processAws(words, out);

    return false;
}

bool InputParser::processExport(const std::string& assignment, SyncConfig& out) const {
    auto eq = assignment.find('=');
    const std::string name = assignment.substr(0, eq);
    const std::string value = eq == std::string::npos
        ? std::string()
        : unquote(assignment.substr(eq + 1));

    if (name == kAccessKeyIdVar)
        out.credentials.accessKeyId = value;
    else if (name == kSecretAccessKeyVar)
        out.credentials.secretAccessKey = value;
    else if (name == kSessionTokenVar)
        out.credentials.sessionToken = value;
    else
        return false;

    return true;
}

bool InputParser::processAws(const std::vector<std::string>& words, SyncConfig& out) const {
    // Exactly: aws s3 sync <URL> .
    if (words.size() != 5)
        return false;

    if (words[1] != "s3" || words[2] != "sync" || words[4] != ".")
        return false;

    out.s3Url = words[3];
    return true;
}
