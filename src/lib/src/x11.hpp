#pragma once

#include <X11/Xlib.h>
#include <X11/extensions/Xrandr.h>
#include <cstdint>

namespace x11
{

class session
{
  public:
    Display *display;
    RROutput primary_output;

    session();
    ~session();

    session(const session &) = delete;
    session &operator=(const session &) = delete;

    Window default_root_window() const;

    // Flushes pending requests and reports whether any of them failed since
    // the last call.
    bool sync();
};

class screen_resources
{
    XRRScreenResources *contents;

  public:
    explicit screen_resources(session &sess);
    ~screen_resources();

    XRRScreenResources *operator->() const;
    operator XRRScreenResources *() const;

    screen_resources(const screen_resources &) = delete;
    screen_resources &operator=(const screen_resources &) = delete;
};

class output_id
{
    RROutput contents;

  public:
    output_id(screen_resources &resources, uint32_t output_index);
    operator RROutput() const;
};

class output_info
{
    XRROutputInfo *contents;

  public:
    output_info(session &sess,
                screen_resources &resources,
                const output_id &output);
    ~output_info();

    XRROutputInfo *operator->() const;

    output_info(const output_info &) = delete;
    output_info &operator=(const output_info &) = delete;
};

class crtc_info
{
    XRRCrtcInfo *contents;

  public:
    crtc_info(session &sess, screen_resources &resources, RRCrtc crtc);
    ~crtc_info();

    XRRCrtcInfo *operator->() const;
    operator bool() const;

    crtc_info(const crtc_info &) = delete;
    crtc_info &operator=(const crtc_info &) = delete;
};

} // namespace x11
