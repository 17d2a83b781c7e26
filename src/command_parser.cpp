#include "../include/command_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

std::string CommandParser::toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)toupper(c); });
    return s;
}

std::vector<std::string> CommandParser::splitWords(const std::string& line) {
    std::vector<std::string> words;
    std::string word;
    for (char c : line) {
        if (isspace((unsigned char)c)) {
            if (!word.empty()) words.push_back(word);
            word.clear();
        } else {
            word += c;
        }
    }
    if (!word.empty()) words.push_back(word);
    return words;
}

bool CommandParser::parseInt(const std::string& text, int& value) {
    const char* s = text.c_str();
    char* end = nullptr;
    errno = 0;
    long v = strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE) return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    value = (int)v;
    return true;
}

bool CommandParser::parseFloat(const std::string& text, float& value) {
    const char* s = text.c_str();
    char* end = nullptr;
    errno = 0;
    float v = strtof(s, &end);
    if (end == s || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return false;
    value = v;
    return true;
}

bool CommandParser::parseSchedule(const std::string& text, SweepSchedule& out) {
    std::vector<std::string> fields;
    size_t begin = 0;
    while (true) {
        size_t colon = text.find(':', begin);
        fields.push_back(text.substr(begin, colon == std::string::npos ? std::string::npos : colon - begin));
        if (colon == std::string::npos) break;
        begin = colon + 1;
    }
    if (fields.size() != 4) return false;

    SweepSchedule s;
    if (!parseInt(fields[0], s.channel) || !parseInt(fields[1], s.start) || !parseInt(fields[2], s.end) ||
        !parseInt(fields[3], s.steps)) {
        return false;
    }
    out = s;
    return true;
}
