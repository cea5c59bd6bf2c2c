#include <xprimary/compositor.hpp>
#include <xprimary/process.hpp>
#include "text.hpp"
#include <array>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string_view>

using json = nlohmann::json;

static constexpr std::array<std::string_view, 9> connector_families = {
    "eDP", "DP", "HDMI", "DVI", "VGA", "USB-C", "LVDS", "Virtual", "X11",
};

std::string compositor::swaymsg_source::get_outputs()
{
    process::result result = process::run({"swaymsg", "-t", "get_outputs"});
    if (!result.success())
        throw std::runtime_error("swaymsg -t get_outputs failed.");
    return result.out;
}

static std::string string_field(const json &object, const char *key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return "";
    return it->get<std::string>();
}

std::vector<compositor::output>
compositor::parse_outputs(const std::string &json_text)
{
    json document;
    try
    {
        document = json::parse(json_text);
    }
    catch (const json::parse_error &e)
    {
        throw std::runtime_error(std::string("Malformed output list: ") +
                                 e.what());
    }

    if (!document.is_array())
        throw std::runtime_error("Output list is not a JSON array.");

    std::vector<output> result;
    for (const json &item : document)
    {
        if (!item.is_object())
            continue;

        output &output = result.emplace_back();
        output.name = string_field(item, "name");
        output.make = string_field(item, "make");
        output.model = string_field(item, "model");
        output.serial = string_field(item, "serial");
        output.description = string_field(item, "description");
    }
    return result;
}

bool compositor::is_connector_name(const std::string &hint)
{
    for (std::string_view family : connector_families)
    {
        if (hint.size() > family.size() && hint.starts_with(family) &&
            hint[family.size()] == '-')
            return true;
    }
    return false;
}

std::string compositor::hardware_id(const output &output)
{
    return text::strip_whitespace(output.make + " " + output.model + " " +
                                  output.serial);
}

std::optional<std::string>
compositor::find_connector(const std::vector<output> &outputs,
                           const std::string &hint)
{
    for (const output &output : outputs)
    {
        if (!output.description.empty() && output.description == hint)
            return output.name;

        std::string id = hardware_id(output);
        if (!id.empty() && id == hint)
            return output.name;
    }
    return std::nullopt;
}

std::optional<std::string> compositor::resolve_hint(const std::string &hint,
                                                    source &source)
{
    if (is_connector_name(hint))
        return hint;

    try
    {
        return find_connector(parse_outputs(source.get_outputs()), hint);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "Warning: " << e.what() << std::endl;
        return std::nullopt;
    }
}
