// include/backend/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

#if BLUELIST_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace backend
{

// "aa:bb:.." -> "AA:BB:.."
[[maybe_unused]] static inline std::string mac_upper(std::string s)
{
    for (auto &c : s)
        c = (char)std::toupper((unsigned char)c);
    return s;
}

[[maybe_unused]] static inline bool mac_eq(const std::string &a, const std::string &b)
{
    return mac_upper(a) == mac_upper(b);
}

// "/org/bluez/hci0" + "AA:BB:CC:DD:EE:FF" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
[[maybe_unused]] static inline std::string dev_path_from(const std::string &adapter_path,
                                                         const std::string &mac)
{
    std::string tail = mac_upper(mac);
    for (auto &c : tail)
        if (c == ':')
            c = '_';
    return adapter_path + "/dev_" + tail;
}

// "/org/bluez/hci0/dev_XX_.." -> "/org/bluez/hci0"
[[maybe_unused]] static inline std::string adapter_of_path(const std::string &dev_path)
{
    auto pos = dev_path.rfind("/dev_");
    if (pos == std::string::npos)
        return std::string{};
    return dev_path.substr(0, pos);
}

#if BLUELIST_HAVE_SDBUS
// ======================================================================
// Function: read_var_basic
// - In: message positioned at a variant
// - Out: reads it into `out` when the variant holds `type`, sets got
// - Note: any other variant type is skipped, got stays false
// ======================================================================
static inline int read_var_basic(sd_bus_message *m, char type, void *out, bool &got)
{
    got                  = false;
    const char *contents = nullptr;
    int         r        = sd_bus_message_peek_type(m, nullptr, &contents);
    if (r < 0)
        return r;
    if (!contents || contents[0] != type || contents[1] != '\0')
        return sd_bus_message_skip(m, "v");

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents);
    if (r < 0)
        return r;
    r      = sd_bus_message_read_basic(m, type, out);
    int r2 = sd_bus_message_exit_container(m);
    if (r < 0)
        return r;
    got = true;
    return r2;
}

[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::optional<std::string> &out)
{
    const char *s   = nullptr;
    bool        got = false;
    int         r   = read_var_basic(m, 's', &s, got);
    if (r >= 0 && got && s)
        out = std::string(s);
    return r;
}

[[maybe_unused]] static inline int read_var_o(sd_bus_message *m, std::optional<std::string> &out)
{
    const char *s   = nullptr;
    bool        got = false;
    int         r   = read_var_basic(m, 'o', &s, got);
    if (r >= 0 && got && s)
        out = std::string(s);
    return r;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, std::optional<bool> &out)
{
    int  b   = 0;  // sd-bus reads 'b' as int
    bool got = false;
    int  r   = read_var_basic(m, 'b', &b, got);
    if (r >= 0 && got)
        out = (b != 0);
    return r;
}

[[maybe_unused]] static inline int read_var_y(sd_bus_message *m, std::optional<uint8_t> &out)
{
    uint8_t y   = 0;
    bool    got = false;
    int     r   = read_var_basic(m, 'y', &y, got);
    if (r >= 0 && got)
        out = y;
    return r;
}
#endif

}  // namespace backend
