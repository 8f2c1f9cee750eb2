#pragma once

#include <ycard/result.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ycard::svg {

// One command letter with every number that followed it. Uppercase is
// absolute, lowercase relative; a repeated parameter group stays in one
// command (e.g. "L 1 2 3 4" has 4 params).
struct PathCommand {
    char letter = 'M';
    std::vector<float> params;

    bool relative() const { return letter >= 'a' && letter <= 'z'; }
    char absolute() const { return relative() ? static_cast<char>(letter - 'a' + 'A') : letter; }
};

//=============================================================================
// PathParser - tokenizes SVG path data into PathCommands
//
// Supported letters: M L H V C S Q T A Z (either case).
// Numbers may be separated by spaces, commas or a sign, and may use
// scientific notation ("1e-3"). Unknown letters are skipped together with
// their numbers. Parameter counts must be a whole number of groups:
//   M/L/T 2, H/V 1, C 6, S/Q 4, A 7, Z 0
// No coordinates are interpreted here.
//=============================================================================
class PathParser {
public:
    using Ptr = std::shared_ptr<PathParser>;

    static Result<Ptr> create();

    Result<std::vector<PathCommand>> parse(const std::string& input) const;

    // Group size for a command letter, -1 when the letter is not supported
    static int paramCount(char letter);
    static bool isCommand(char c);

private:
    PathParser() = default;

    static Result<void> checkParams(const PathCommand& cmd);
};

// Convenience for one-shot callers
Result<std::vector<PathCommand>> parsePath(const std::string& input);

} // namespace ycard::svg
