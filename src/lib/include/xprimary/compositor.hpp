#pragma once

#include <optional>
#include <string>
#include <vector>

namespace compositor
{
struct output
{
    std::string name;
    std::string make;
    std::string model;
    std::string serial;
    std::string description;
};

class source
{
  public:
    virtual ~source() = default;

    // Raw JSON array of outputs. Throws std::runtime_error on failure.
    virtual std::string get_outputs() = 0;
};

class swaymsg_source : public source
{
  public:
    std::string get_outputs() override;
};

// Throws std::runtime_error on malformed JSON or a non-array payload.
std::vector<output> parse_outputs(const std::string &json_text);

bool is_connector_name(const std::string &hint);

// "make model serial", trimmed.
std::string hardware_id(const output &output);

std::optional<std::string> find_connector(const std::vector<output> &outputs,
                                          const std::string &hint);

std::optional<std::string> resolve_hint(const std::string &hint,
                                        source &source);

} // namespace compositor
