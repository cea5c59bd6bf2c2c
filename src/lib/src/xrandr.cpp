#include "backends.hpp"
#include <xprimary/process.hpp>
#include <iostream>
#include <stdexcept>

std::string xrandr::backend::query()
{
    process::result result = process::run({"xrandr", "--query"});
    if (!result.success())
        throw std::runtime_error("xrandr --query failed.");
    return result.out;
}

bool xrandr::backend::set_primary(const std::string &name)
{
    try
    {
        return process::run({"xrandr", "--output", name, "--primary"},
                            process::output_mode::INHERIT)
            .success();
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "Warning: " << e.what() << std::endl;
        return false;
    }
}
