#include "text.hpp"

#include <sstream>

static constexpr const char *whitespace = " \t\r\n\f\v";

std::string text::strip_whitespace(const std::string &str)
{
    size_t start = str.find_first_not_of(whitespace);
    size_t end = str.find_last_not_of(whitespace);
    if (start == std::string::npos || end == std::string::npos)
        return "";
    return str.substr(start, end - start + 1);
}

std::string text::strip_leading_whitespace(const std::string &str)
{
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos)
        return "";
    return str.substr(start);
}

std::vector<std::string> text::split_words(const std::string &line)
{
    std::vector<std::string> words;
    std::istringstream iss(line);
    std::string word;
    while (iss >> word)
    {
        words.push_back(word);
    }
    return words;
}
