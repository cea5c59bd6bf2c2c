#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace display
{
struct output
{
    std::string name;
    bool is_connected = false;
    bool is_primary = false;
};

enum class backend_kind : uint8_t
{
    XRANDR,
    X11,
};

class backend
{
  public:
    virtual ~backend() = default;

    // Lines in the "NAME connected|disconnected [primary] ..." format of
    // `xrandr --query`. Throws std::runtime_error when the display is unusable.
    virtual std::string query() = 0;
    virtual bool set_primary(const std::string &name) = 0;
};

std::unique_ptr<backend> make_backend(backend_kind kind);

std::vector<output> parse_outputs(const std::string &query_text);

const output *find_output_by_name(const std::vector<output> &outputs,
                                  const std::string &name);

} // namespace display
