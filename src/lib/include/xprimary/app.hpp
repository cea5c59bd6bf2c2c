#pragma once

#include <xprimary/compositor.hpp>
#include <xprimary/config.hpp>
#include <xprimary/display.hpp>
#include <xprimary/notify.hpp>
#include <xprimary/primary.hpp>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace app
{
// Flags as given on the command line.
struct options
{
    bool status = false;
    bool auto_switch = false;
    bool use_default = false;
    bool verbose = false;
    bool no_notify = false;
    std::string config_path;
    std::string backend;
};

struct environment
{
    std::optional<std::string> home;
    std::optional<std::string> xdg_config_home;
};

struct settings
{
    primary::mode mode = primary::mode::INTERACTIVE;
    std::filesystem::path config_path;
    config::markers markers;
    display::backend_kind backend = display::backend_kind::XRANDR;
    bool notify = true;
    bool verbose = false;
};

struct collaborators
{
    display::backend &display;
    compositor::source &compositor;
    notify::sink &notifier;
    std::istream &in;
    std::ostream &out;
    std::ostream &err;
};

environment read_environment();

// Empty when neither variable is set.
std::filesystem::path default_config_path(const environment &env);

primary::mode select_mode(const options &options);

// Throws std::invalid_argument on an unknown backend name.
display::backend_kind parse_backend(const std::string &name);

settings resolve_settings(const options &options, const environment &env);

// Returns the process exit status.
int run(const settings &settings, collaborators &io);

} // namespace app
