#pragma once

#include <xprimary/display.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace primary
{
enum class mode : uint8_t
{
    STATUS,
    AUTO_SWITCH,
    DEFAULT,
    INTERACTIVE,
};

enum class reason : uint8_t
{
    CYCLED,
    SELECTED,
    NO_PREFERENCE,
    RESOLVED_HINT,
    LITERAL_HINT,
    NOT_CONNECTED,
};

struct resolution
{
    std::string target;
    std::optional<std::string> previous;
    enum reason reason;
};

std::optional<size_t> find_primary(const std::vector<display::output> &outputs);

// Index after the current primary, wrapping around. Without a primary this is
// the first output.
size_t next_index(const std::vector<display::output> &outputs);

resolution select_next(const std::vector<display::output> &outputs);

resolution select_default(const std::vector<display::output> &outputs,
                          const std::optional<std::string> &preference,
                          const std::optional<std::string> &resolved);

// 1-based user input to an index into `count` outputs.
std::optional<size_t> parse_selection(const std::string &input, size_t count);

resolution select_index(const std::vector<display::output> &outputs,
                        size_t index);

} // namespace primary
