#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace process
{
enum class output_mode : uint8_t
{
    CAPTURE,
    DISCARD,
    INHERIT,
};

struct result
{
    int exit_status = -1;
    std::string out;

    bool success() const
    {
        return exit_status == 0;
    }
};

// Runs argv[0] looked up in PATH and waits for it. A command that cannot be
// executed exits with 127. Throws std::runtime_error if no child could be
// started at all.
result run(const std::vector<std::string> &argv,
           output_mode mode = output_mode::CAPTURE);

} // namespace process
