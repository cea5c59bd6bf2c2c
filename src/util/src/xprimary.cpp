#include <xprimary/app.hpp>
#include <xprimary/help.hpp>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <stdexcept>

#ifndef XPRIMARY_VERSION
#define XPRIMARY_VERSION "unknown"
#endif

enum long_only_option : int
{
    NO_NOTIFY = 256,
};

void print_usage(const char *name)
{
    std::cout << "Usage: " << name << " [options]\n";

    std::string help_str(reinterpret_cast<const char *>(help_txt),
                         help_txt_len);

    std::cout << help_str;
}

int main(int argc, char *argv[])
{
    static struct option long_options[] = {
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'V'},
        {"status", no_argument, 0, 's'},
        {"auto-switch", no_argument, 0, 'a'},
        {"default", no_argument, 0, 'd'},
        {"config", required_argument, 0, 'c'},
        {"backend", required_argument, 0, 'b'},
        {"verbose", no_argument, 0, 'v'},
        {"no-notify", no_argument, 0, NO_NOTIFY},
        {0, 0, 0, 0},
    };

    app::options options;
    int option_index = 0;
    int c;
    while ((c = getopt_long(
                argc, argv, "hVsadc:b:v", long_options, &option_index)) != -1)
    {
        switch (c)
        {
        case 'h':
            print_usage(argv[0]);
            return 0;
        case 'V':
            std::cout << "xprimary " << XPRIMARY_VERSION << std::endl;
            return 0;
        case 's':
            options.status = true;
            break;
        case 'a':
            options.auto_switch = true;
            break;
        case 'd':
            options.use_default = true;
            break;
        case 'c':
            options.config_path = optarg;
            break;
        case 'b':
            options.backend = optarg;
            break;
        case 'v':
            options.verbose = true;
            break;
        case NO_NOTIFY:
            options.no_notify = true;
            break;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    if (optind < argc)
    {
        std::cerr << "Error: Unexpected argument: " << argv[optind]
                  << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    app::settings settings;
    try
    {
        settings = app::resolve_settings(options, app::read_environment());
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::unique_ptr<notify::sink> notifier;
    if (settings.notify)
        notifier = std::make_unique<notify::desktop_sink>();
    else
        notifier = std::make_unique<notify::null_sink>();

    try
    {
        std::unique_ptr<display::backend> backend =
            display::make_backend(settings.backend);
        compositor::swaymsg_source compositor;
        app::collaborators io = {
            .display = *backend,
            .compositor = compositor,
            .notifier = *notifier,
            .in = std::cin,
            .out = std::cout,
            .err = std::cerr,
        };
        return app::run(settings, io);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        notifier->send(notify::kind::ERROR, e.what());
        return 1;
    }
}
