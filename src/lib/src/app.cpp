#include <xprimary/app.hpp>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

static const std::string environment_failure_message =
    "xrandr --query failed. Are you in a Wayland session with XWayland? Is "
    "xrandr installed?";

static std::optional<std::string> get_env(const char *name)
{
    const char *value = std::getenv(name);
    if (!value || !*value)
        return std::nullopt;
    return std::string(value);
}

app::environment app::read_environment()
{
    return {
        .home = get_env("HOME"),
        .xdg_config_home = get_env("XDG_CONFIG_HOME"),
    };
}

std::filesystem::path app::default_config_path(const environment &env)
{
    if (env.xdg_config_home)
        return std::filesystem::path(*env.xdg_config_home) / "sway" / "config";
    if (env.home)
        return std::filesystem::path(*env.home) / ".config" / "sway" /
               "config";
    return {};
}

primary::mode app::select_mode(const options &options)
{
    if (options.status)
        return primary::mode::STATUS;
    if (options.auto_switch)
        return primary::mode::AUTO_SWITCH;
    if (options.use_default)
        return primary::mode::DEFAULT;
    return primary::mode::INTERACTIVE;
}

display::backend_kind app::parse_backend(const std::string &name)
{
    if (name.empty() || name == "xrandr")
        return display::backend_kind::XRANDR;
    if (name == "x11")
        return display::backend_kind::X11;
    throw std::invalid_argument("Unknown backend: " + name);
}

app::settings app::resolve_settings(const options &options,
                                    const environment &env)
{
    settings result;
    result.mode = select_mode(options);
    result.config_path = options.config_path.empty()
                             ? default_config_path(env)
                             : std::filesystem::path(options.config_path);
    result.backend = parse_backend(options.backend);
    result.notify = !options.no_notify;
    result.verbose = options.verbose;
    return result;
}

namespace
{
class runner
{
    const app::settings &settings;
    app::collaborators &io;

  public:
    runner(const app::settings &_settings, app::collaborators &_io)
        : settings(_settings), io(_io)
    {
    }

    void info(const std::string &message)
    {
        if (settings.verbose)
            io.err << "Info: " << message << std::endl;
    }

    int fail(const std::string &message)
    {
        io.err << "Error: " << message << std::endl;
        io.notifier.send(notify::kind::ERROR, message);
        return 1;
    }

    int apply(const std::string &target, const std::string &success_message)
    {
        bool applied = false;
        try
        {
            applied = io.display.set_primary(target);
        }
        catch (const std::runtime_error &e)
        {
            io.err << "Error: " << e.what() << std::endl;
        }

        if (!applied)
            return fail("Failed to set primary to " + target + ".");

        io.notifier.send(notify::kind::OK, success_message);
        return 0;
    }

    int status(const std::vector<display::output> &outputs)
    {
        std::optional<size_t> index = primary::find_primary(outputs);
        if (!index)
        {
            // No primary is reported as a failure so scripts can test for it.
            io.out << "(none)" << std::endl;
            return 1;
        }
        io.out << "Primary monitor: " << outputs[*index].name << "."
               << std::endl;
        return 0;
    }

    int auto_switch(const std::vector<display::output> &outputs)
    {
        primary::resolution next = primary::select_next(outputs);
        return apply(next.target,
                     "Auto-switched primary: " +
                         next.previous.value_or("none") + " -> " +
                         next.target + ".");
    }

    int use_default(const std::vector<display::output> &outputs)
    {
        std::optional<std::string> preference =
            config::read_preference(settings.config_path, settings.markers);

        std::optional<std::string> resolved;
        if (preference)
        {
            info("Preferred output in " + settings.config_path.string() +
                 ": " + *preference);
            resolved = compositor::resolve_hint(*preference, io.compositor);
        }

        primary::resolution chosen =
            primary::select_default(outputs, preference, resolved);

        switch (chosen.reason)
        {
        case primary::reason::NO_PREFERENCE:
            info("No preference found in " + settings.config_path.string());
            io.notifier.send(notify::kind::INFO,
                             "No primary monitor set in Sway config. Choosing "
                             "first monitor.");
            break;
        case primary::reason::RESOLVED_HINT:
            info("Preference resolved to " + chosen.target);
            break;
        case primary::reason::LITERAL_HINT:
            info("Using preference as a connector name: " + chosen.target);
            break;
        case primary::reason::NOT_CONNECTED:
            info("Preferred output is not connected, using " + chosen.target);
            break;
        default:
            break;
        }

        return apply(chosen.target,
                     "Primary set (default mode) -> " + chosen.target);
    }

    int interactive(const std::vector<display::output> &outputs)
    {
        io.out << "Detected X11 outputs:" << std::endl;
        for (size_t i = 0, size = outputs.size(); i < size; i++)
        {
            io.out << "  " << i + 1 << ". " << outputs[i].name;
            if (outputs[i].is_primary)
                io.out << "  (current primary)";
            io.out << std::endl;
        }
        io.out << "Pick a number to set as primary: " << std::flush;

        std::string line;
        if (!std::getline(io.in, line))
            return fail("Failed to read input.");

        std::optional<size_t> index =
            primary::parse_selection(line, outputs.size());
        if (!index)
            return fail("Invalid selection.");

        primary::resolution chosen = primary::select_index(outputs, *index);
        return apply(chosen.target,
                     "Primary set (interactive) -> " + chosen.target + ".");
    }

    int run()
    {
        std::string query_text;
        try
        {
            query_text = io.display.query();
        }
        catch (const std::runtime_error &e)
        {
            io.err << "Error: " << e.what() << std::endl;
            io.notifier.send(notify::kind::ERROR, environment_failure_message);
            return 1;
        }

        std::vector<display::output> outputs =
            display::parse_outputs(query_text);
        if (outputs.empty())
            return fail("No connected X11 outputs found.");

        switch (settings.mode)
        {
        case primary::mode::STATUS:
            return status(outputs);
        case primary::mode::AUTO_SWITCH:
            return auto_switch(outputs);
        case primary::mode::DEFAULT:
            return use_default(outputs);
        case primary::mode::INTERACTIVE:
            return interactive(outputs);
        }
        return 1;
    }
};
} // namespace

int app::run(const settings &settings, collaborators &io)
{
    return runner(settings, io).run();
}
