#include <xprimary/primary.hpp>
#include "text.hpp"
#include <algorithm>
#include <stdexcept>

std::optional<size_t>
primary::find_primary(const std::vector<display::output> &outputs)
{
    for (size_t i = 0, size = outputs.size(); i < size; i++)
    {
        if (outputs[i].is_primary)
            return i;
    }
    return std::nullopt;
}

size_t primary::next_index(const std::vector<display::output> &outputs)
{
    if (outputs.empty())
        throw std::invalid_argument("No outputs to choose from.");

    std::optional<size_t> current = find_primary(outputs);
    if (!current)
        return 0;
    return (*current + 1) % outputs.size();
}

static std::optional<std::string>
primary_name(const std::vector<display::output> &outputs)
{
    std::optional<size_t> index = primary::find_primary(outputs);
    if (!index)
        return std::nullopt;
    return outputs[*index].name;
}

primary::resolution
primary::select_next(const std::vector<display::output> &outputs)
{
    size_t index = next_index(outputs);
    return {
        .target = outputs[index].name,
        .previous = primary_name(outputs),
        .reason = reason::CYCLED,
    };
}

primary::resolution
primary::select_default(const std::vector<display::output> &outputs,
                        const std::optional<std::string> &preference,
                        const std::optional<std::string> &resolved)
{
    if (outputs.empty())
        throw std::invalid_argument("No outputs to choose from.");

    resolution result = {
        .target = outputs.front().name,
        .previous = primary_name(outputs),
        .reason = reason::NO_PREFERENCE,
    };
    if (!preference)
        return result;

    std::string wanted = resolved ? *resolved : *preference;
    if (!display::find_output_by_name(outputs, wanted))
    {
        result.reason = reason::NOT_CONNECTED;
        return result;
    }

    result.target = wanted;
    result.reason = resolved ? reason::RESOLVED_HINT : reason::LITERAL_HINT;
    return result;
}

std::optional<size_t> primary::parse_selection(const std::string &input,
                                               size_t count)
{
    std::string digits = text::strip_whitespace(input);
    if (digits.empty() || digits.size() > 9 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) {
            return c >= '0' && c <= '9';
        }))
        return std::nullopt;

    size_t choice = std::stoul(digits);
    if (choice < 1 || choice > count)
        return std::nullopt;
    return choice - 1;
}

primary::resolution
primary::select_index(const std::vector<display::output> &outputs,
                      size_t index)
{
    if (index >= outputs.size())
        throw std::out_of_range("Output index out of range.");

    return {
        .target = outputs[index].name,
        .previous = primary_name(outputs),
        .reason = reason::SELECTED,
    };
}
