#include <xprimary/notify.hpp>
#include <xprimary/process.hpp>
#include <iostream>
#include <stdexcept>
#include <vector>

static constexpr const char *app_name = "xprimary";
static constexpr const char *app_summary = "X11 Primary Monitor Switcher";

struct style
{
    const char *summary;
    const char *icon;
    int timeout_ms;
    const char *category;
};

static style style_for(notify::kind kind)
{
    switch (kind)
    {
    case notify::kind::OK:
        return {app_summary, "video-display", 5000, "Device"};
    case notify::kind::INFO:
        return {app_summary, "dialog-information", 6000, nullptr};
    case notify::kind::ERROR:
        return {"X11 Primary Switcher - Error", "dialog-error", 8000, nullptr};
    }
    return {app_summary, "dialog-information", 6000, nullptr};
}

void notify::desktop_sink::send(kind kind, const std::string &body)
{
    style s = style_for(kind);

    std::vector<std::string> argv = {
        "notify-send",
        std::string("--app-name=") + app_name,
        std::string("--icon=") + s.icon,
        "--expire-time=" + std::to_string(s.timeout_ms),
    };
    if (s.category)
        argv.push_back(std::string("--hint=string:category:") + s.category);
    argv.push_back(s.summary);
    argv.push_back(body);

    try
    {
        // Exit status ignored, there may be no notification daemon.
        process::run(argv, process::output_mode::DISCARD);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "Warning: notification failed: " << e.what()
                  << std::endl;
    }
}
