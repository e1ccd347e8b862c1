#include <cctype>
#include <string>

#include "directory/device.hpp"
#include "term/ansi.hpp"
#include "util/constants.hpp"

namespace directory
{
namespace
{

static std::string_view state_color(const Device &d)
{
    if (!d.paired)
        return ansi::DIM;
    if (d.connected)
        return ansi::BOLD_BLUE;
    return ansi::NORMAL;
}

static void append_yes_no(std::string &out, const char *label, bool v, bool color)
{
    out += "\n\t";
    out += label;
    out += ": ";
    if (color)
        out += v ? ansi::GREEN : ansi::RED;
    out += v ? "yes" : "no";
    if (color)
        out += ansi::RESET;
}

}  // namespace

std::size_t name_width(const std::string &name)
{
    std::size_t n = 0;
    for (unsigned char c : name)
    {
        if ((c & 0xC0) != 0x80)
            ++n;
    }
    return n;
}

bool has_whitespace(const std::string &name)
{
    for (unsigned char c : name)
    {
        if (std::isspace(c))
            return true;
    }
    return false;
}

bool valid_device(const Device &d)
{
    return !d.address.empty() && name_width(d.name) <= constants::MAX_NAME_LEN;
}

std::string colored_name(const Device &d, bool color)
{
    if (!color)
        return d.name;
    std::string out(state_color(d));
    out += d.name;
    out += ansi::RESET;
    return out;
}

std::string quoted_name(const Device &d, bool color)
{
    const char *q = has_whitespace(d.name) ? "'" : " ";
    std::string out;
    if (color)
        out += state_color(d);
    out += q;
    out += d.name;
    out += q;
    if (color)
        out += ansi::RESET;
    return out;
}

std::string info_block(const Device &d, bool color)
{
    std::string out = d.address + " " + colored_name(d, color);
    append_yes_no(out, "Paired", d.paired, color);
    append_yes_no(out, "Bonded", d.bonded, color);
    append_yes_no(out, "Trusted", d.trusted, color);
    append_yes_no(out, "Blocked", d.blocked, color);
    append_yes_no(out, "Connected", d.connected, color);
    if (d.remote_name)
        out += "\n\tRemote Name: " + *d.remote_name;
    if (d.battery)
    {
        out += "\n\tBattery Percentage: ";
        if (color)
        {
            if (*d.battery >= 70)
                out += ansi::GREEN;
            else if (*d.battery >= 30)
                out += ansi::YELLOW;
            else
                out += ansi::RED;
        }
        out += std::to_string(static_cast<unsigned>(*d.battery));
        if (color)
            out += ansi::RESET;
    }
    if (d.icon)
        out += "\n\tIcon: " + *d.icon;
    return out;
}

}  // namespace directory
