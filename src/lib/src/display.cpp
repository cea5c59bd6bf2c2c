#include <xprimary/display.hpp>
#include "text.hpp"
#include "backends.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

static bool is_connector_char(char c)
{
    if (std::isalnum(static_cast<unsigned char>(c)))
        return true;

    switch (c)
    {
    case '-':
    case '_':
    case '.':
    case '+':
    case ':':
    case '/':
        return true;
    default:
        return false;
    }
}

static bool is_connector_token(const std::string &token)
{
    if (token.empty())
        return false;
    for (char c : token)
    {
        if (!is_connector_char(c))
            return false;
    }
    return true;
}

std::vector<display::output>
display::parse_outputs(const std::string &query_text)
{
    std::vector<display::output> result;
    std::istringstream ss(query_text);
    std::string line;

    while (std::getline(ss, line))
    {
        // Mode lines are indented and belong to the output above them.
        if (line.empty() || std::isspace(static_cast<unsigned char>(line[0])))
            continue;

        std::vector<std::string> words = text::split_words(line);
        if (words.size() < 2 || !is_connector_token(words[0]))
            continue;

        // Disconnected outputs can never become primary.
        if (words[1] != "connected")
            continue;

        display::output &output = result.emplace_back();
        output.name = words[0];
        output.is_connected = true;
        for (size_t i = 2; i < words.size(); ++i)
        {
            if (words[i] == "primary")
            {
                output.is_primary = true;
                break;
            }
        }
    }

    return result;
}

const display::output *
display::find_output_by_name(const std::vector<display::output> &outputs,
                             const std::string &name)
{
    for (auto &output : outputs)
    {
        if (output.name == name)
        {
            return &output;
        }
    }
    return nullptr;
}

std::unique_ptr<display::backend> display::make_backend(backend_kind kind)
{
    switch (kind)
    {
    case backend_kind::XRANDR:
        return std::make_unique<xrandr::backend>();
    case backend_kind::X11:
        return std::make_unique<x11::backend>();
    }
    throw std::invalid_argument("Unknown display backend.");
}
