#pragma once

#include <string>
#include <vector>

namespace text
{
std::string strip_whitespace(const std::string &str);
std::string strip_leading_whitespace(const std::string &str);
std::vector<std::string> split_words(const std::string &line);
} // namespace text
