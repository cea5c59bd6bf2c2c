#include <xprimary/config.hpp>
#include "text.hpp"
#include <fstream>
#include <sstream>
#include <string_view>

static constexpr char comment_marker = '#';
static constexpr std::string_view declaration_keyword = "output";

std::vector<std::string> config::split_lines(const std::string &text)
{
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

static std::optional<size_t>
find_line_containing(const std::vector<std::string> &lines,
                     size_t from,
                     const std::string &marker)
{
    for (size_t i = from; i < lines.size(); ++i)
    {
        if (lines[i].find(marker) != std::string::npos)
            return i;
    }
    return std::nullopt;
}

std::vector<config::block>
config::find_blocks(const std::vector<std::string> &lines, const markers &marks)
{
    std::vector<block> blocks;
    size_t search_from = 0;

    while (auto start = find_line_containing(lines, search_from, marks.start))
    {
        auto end = find_line_containing(lines, *start + 1, marks.end);
        // An unterminated block ends the scan.
        if (!end)
            break;

        blocks.push_back({*start, *end});
        search_from = *end + 1;
    }

    return blocks;
}

// Value of `output "<value>"`, or nothing when the line is another directive.
static std::optional<std::string> parse_declaration(const std::string &line)
{
    std::string rest = text::strip_leading_whitespace(line);
    if (!rest.starts_with(declaration_keyword))
        return std::nullopt;

    rest = rest.substr(declaration_keyword.size());
    std::string value = text::strip_leading_whitespace(rest);
    if (value.size() == rest.size() || value.empty() || value.front() != '"')
        return std::nullopt;

    size_t closing = value.find('"', 1);
    if (closing == std::string::npos || closing == 1)
        return std::nullopt;

    return value.substr(1, closing - 1);
}

std::optional<std::string>
config::find_declaration(const std::vector<std::string> &lines,
                         const block &block)
{
    for (size_t i = block.start; i <= block.end && i < lines.size(); ++i)
    {
        std::string trimmed = text::strip_leading_whitespace(lines[i]);
        if (!trimmed.empty() && trimmed.front() == comment_marker)
            continue;

        if (auto value = parse_declaration(lines[i]))
            return value;
    }
    return std::nullopt;
}

std::optional<std::string>
config::get_preference(const std::string &config_text, const markers &marks)
{
    std::vector<std::string> lines = split_lines(config_text);

    for (const block &block : find_blocks(lines, marks))
    {
        if (auto value = find_declaration(lines, block))
            return value;
    }
    return std::nullopt;
}

std::optional<std::string>
config::read_preference(const std::filesystem::path &path, const markers &marks)
{
    if (path.empty())
        return std::nullopt;

    std::ifstream file_stream(path, std::ios::in | std::ios::binary);
    if (!file_stream)
        return std::nullopt;

    std::ostringstream ss;
    ss << file_stream.rdbuf();
    if (file_stream.bad())
        return std::nullopt;

    return get_preference(ss.str(), marks);
}
