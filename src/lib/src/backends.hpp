#pragma once

#include <xprimary/display.hpp>
#include <string>

namespace xrandr
{
// Drives the `xrandr` command line tool.
class backend : public display::backend
{
  public:
    std::string query() override;
    bool set_primary(const std::string &name) override;
};
} // namespace xrandr

namespace x11
{
// Talks to the X server through libXrandr.
class backend : public display::backend
{
  public:
    std::string query() override;
    bool set_primary(const std::string &name) override;
};
} // namespace x11
