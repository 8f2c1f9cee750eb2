#include "path-parser.h"
#include <ytrace/ytrace.hpp>
#include <fmt/format.h>
#include <cctype>
#include <cstdlib>

namespace ycard::svg {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Matches [-+]?[0-9]*\.?[0-9]+([eE][-+]?[0-9]+)? starting at pos.
// Returns the token length, 0 when nothing matches.
size_t matchNumber(const std::string& s, size_t pos) {
    size_t i = pos;
    size_t n = s.size();
    if (i < n && (s[i] == '-' || s[i] == '+')) i++;

    size_t intStart = i;
    while (i < n && isDigit(s[i])) i++;
    size_t intDigits = i - intStart;

    if (i < n && s[i] == '.' && i + 1 < n && isDigit(s[i + 1])) {
        i++;
        while (i < n && isDigit(s[i])) i++;
    } else if (intDigits == 0) {
        return 0;
    }

    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        size_t e = i + 1;
        if (e < n && (s[e] == '-' || s[e] == '+')) e++;
        if (e < n && isDigit(s[e])) {
            while (e < n && isDigit(s[e])) e++;
            i = e;
        }
    }
    return i - pos;
}

} // namespace

Result<PathParser::Ptr> PathParser::create() {
    return Ok(Ptr(new PathParser()));
}

int PathParser::paramCount(char letter) {
    switch (std::toupper(static_cast<unsigned char>(letter))) {
        case 'M': return 2;
        case 'L': return 2;
        case 'H': return 1;
        case 'V': return 1;
        case 'C': return 6;
        case 'S': return 4;
        case 'Q': return 4;
        case 'T': return 2;
        case 'A': return 7;
        case 'Z': return 0;
    }
    return -1;
}

bool PathParser::isCommand(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) && paramCount(c) >= 0;
}

Result<void> PathParser::checkParams(const PathCommand& cmd) {
    int k = paramCount(cmd.letter);
    size_t count = cmd.params.size();
    if (k == 0) {
        if (count != 0) {
            return Err(fmt::format("Command {} takes no parameters, got {}", cmd.letter, count));
        }
        return Ok();
    }
    // zero groups is a multiple too, the command then draws nothing
    if (count % static_cast<size_t>(k) != 0) {
        return Err(fmt::format("Command {} expects {} parameters (or a multiple), got {}",
                               cmd.letter, k, count));
    }
    return Ok();
}

Result<std::vector<PathCommand>> PathParser::parse(const std::string& input) const {
    if (input.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
        return Err<std::vector<PathCommand>>("SVG path data cannot be empty");
    }

    std::vector<PathCommand> commands;
    bool open = false;      // commands.back() still takes numbers
    bool skipping = false;  // inside an unknown command's numbers

    size_t i = 0;
    while (i < input.size()) {
        char c = input[i];

        if (isCommand(c)) {
            if (open) {
                if (auto res = checkParams(commands.back()); !res) {
                    return Err<std::vector<PathCommand>>("Invalid path data", res);
                }
            }
            commands.push_back(PathCommand{c, {}});
            open = true;
            skipping = false;
            i++;
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c))) {
            ywarn("Skipping unsupported SVG command '{}' at offset {}", c, i);
            if (open) {
                if (auto res = checkParams(commands.back()); !res) {
                    return Err<std::vector<PathCommand>>("Invalid path data", res);
                }
            }
            open = false;
            skipping = true;
            i++;
            continue;
        }

        size_t len = matchNumber(input, i);
        if (len == 0) {
            // separators and stray punctuation
            i++;
            continue;
        }

        std::string token = input.substr(i, len);
        i += len;
        if (skipping) continue;
        if (!open) {
            return Err<std::vector<PathCommand>>("Expected command, got: " + token);
        }
        commands.back().params.push_back(std::strtof(token.c_str(), nullptr));
    }

    if (open) {
        if (auto res = checkParams(commands.back()); !res) {
            return Err<std::vector<PathCommand>>("Invalid path data", res);
        }
    }

    ydebug("Parsed SVG path: {} commands", commands.size());
    return Ok(std::move(commands));
}

Result<std::vector<PathCommand>> parsePath(const std::string& input) {
    auto parser = PathParser::create();
    if (!parser) {
        return Err<std::vector<PathCommand>>("Failed to create path parser", parser);
    }
    return (*parser)->parse(input);
}

} // namespace ycard::svg
