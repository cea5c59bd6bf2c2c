#include "backends.hpp"
#include "x11.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

static int last_error_code = Success;

static int x_error_handler(Display *dpy, XErrorEvent *ev)
{
    char buf[128];
    XGetErrorText(dpy, ev->error_code, buf, sizeof(buf));
    std::cerr << "Warning: X error " << static_cast<int>(ev->error_code)
              << " (" << buf << ") request="
              << static_cast<int>(ev->request_code)
              << " minor=" << static_cast<int>(ev->minor_code) << std::endl;
    last_error_code = ev->error_code;
    return 0;
}

namespace x11
{
session::session()
{
    XSetErrorHandler(x_error_handler);
    display = XOpenDisplay(nullptr);
    if (!display)
        throw std::runtime_error("Failed to open X display.");
    int event_base, error_base;
    if (!XRRQueryExtension(display, &event_base, &error_base))
    {
        XCloseDisplay(display);
        throw std::runtime_error(
            "X RandR extension not available on this display.");
    }
    int major, minor;
    XRRQueryVersion(display, &major, &minor);
    primary_output = XRRGetOutputPrimary(display, default_root_window());
}
session::~session()
{
    XCloseDisplay(display);
}

Window session::default_root_window() const
{
    return XDefaultRootWindow(display);
}

bool session::sync()
{
    XSync(display, False);
    bool ok = (last_error_code == Success);
    last_error_code = Success;
    return ok;
}

screen_resources::screen_resources(session &sess)
{
    contents = XRRGetScreenResources(sess.display, sess.default_root_window());
    if (!contents)
        throw std::runtime_error("Failed to get XRR screen resources.");
}
screen_resources::~screen_resources()
{
    XRRFreeScreenResources(contents);
}
XRRScreenResources *screen_resources::operator->() const
{
    return contents;
}
screen_resources::operator XRRScreenResources *() const
{
    return contents;
}

output_id::output_id(screen_resources &resources, uint32_t output_index)
{
    if (output_index >= static_cast<uint32_t>(resources->noutput))
        throw std::out_of_range("Output index out of range.");
    contents = resources->outputs[output_index];
    if (contents == None)
        throw std::runtime_error("Output is None.");
}
output_id::operator RROutput() const
{
    return contents;
}

output_info::output_info(session &sess,
                         screen_resources &resources,
                         const output_id &output)
{
    contents = XRRGetOutputInfo(sess.display, resources, output);

    if (!contents)
        throw std::runtime_error("Failed to get XRR output info.");
}
output_info::~output_info()
{
    XRRFreeOutputInfo(contents);
}
XRROutputInfo *output_info::operator->() const
{
    return contents;
}

crtc_info::crtc_info(session &sess, screen_resources &resources, RRCrtc crtc)
{
    contents = XRRGetCrtcInfo(sess.display, resources, crtc);
}
crtc_info::~crtc_info()
{
    if (contents)
        XRRFreeCrtcInfo(contents);
}
XRRCrtcInfo *crtc_info::operator->() const
{
    return contents;
}
crtc_info::operator bool() const
{
    return contents != nullptr;
}

// Same shape as an `xrandr --query` output line, so both backends feed the
// one parser.
static void write_output_line(std::ostream &os,
                              session &sess,
                              screen_resources &resources,
                              const output_id &id,
                              const output_info &info)
{
    os << info->name;
    os << (info->connection == RR_Connected ? " connected" : " disconnected");
    if ((RROutput)id == sess.primary_output)
        os << " primary";

    if (info->crtc)
    {
        crtc_info crtc(sess, resources, info->crtc);
        if (crtc && crtc->mode != None)
        {
            os << " " << crtc->width << "x" << crtc->height << "+" << crtc->x
               << "+" << crtc->y;
        }
    }
    os << " (normal left inverted right x axis y axis)\n";
}

std::string backend::query()
{
    session x11;
    screen_resources resources(x11);
    std::ostringstream os;

    for (uint32_t output_index = 0;
         output_index < static_cast<uint32_t>(resources->noutput);
         ++output_index)
    {
        output_id id(resources, output_index);
        output_info info(x11, resources, id);
        write_output_line(os, x11, resources, id, info);
    }

    return os.str();
}

bool backend::set_primary(const std::string &name)
{
    session x11;
    screen_resources resources(x11);

    for (uint32_t output_index = 0;
         output_index < static_cast<uint32_t>(resources->noutput);
         ++output_index)
    {
        output_id id(resources, output_index);
        output_info info(x11, resources, id);
        if (name != info->name)
            continue;

        XRRSetOutputPrimary(x11.display, x11.default_root_window(), id);
        return x11.sync();
    }

    std::cerr << "Warning: Output " << name << " not found on the X server."
              << std::endl;
    return false;
}

} // namespace x11
