#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// Tokenizing and number parsing for operator command lines
class CommandParser {
public:
    static std::string toUpper(std::string s);

    // Whitespace-separated words; runs of whitespace collapse
    static std::vector<std::string> splitWords(const std::string& line);

    // Whole token must be a base-10 integer that fits in int
    static bool parseInt(const std::string& text, int& value);

    // Whole token must be a finite float
    static bool parseFloat(const std::string& text, float& value);

    // "<ch>:<start>:<end>:<steps>", four integers; out is untouched on failure
    static bool parseSchedule(const std::string& text, SweepSchedule& out);
};
