#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// BlueZ names
inline constexpr std::string_view BLUEZ_SERVICE     = "org.bluez";
inline constexpr std::string_view ADAPTER_IFACE     = "org.bluez.Adapter1";
inline constexpr std::string_view DEVICE_IFACE      = "org.bluez.Device1";
inline constexpr std::string_view BATTERY_IFACE     = "org.bluez.Battery1";
inline constexpr std::string_view AGENT_IFACE       = "org.bluez.Agent1";
inline constexpr std::string_view AGENT_MANAGER     = "org.bluez.AgentManager1";
inline constexpr std::string_view AGENT_PATH        = "/org/bluelist/agent";
inline constexpr std::string_view AGENT_CAPABILITY  = "KeyboardDisplay";
inline constexpr std::string_view ERR_ALREADY_EXIST = "org.bluez.Error.AlreadyExists";
inline constexpr std::string_view ERR_ALREADY_CONN  = "org.bluez.Error.AlreadyConnected";
inline constexpr std::string_view ERR_REJECTED      = "org.bluez.Error.Rejected";
inline constexpr std::string_view ERR_CANCELED      = "org.bluez.Error.Canceled";

// Broadcast name ceiling (Bluetooth Core Vol 3, Part C, 12.1)
inline constexpr std::size_t MAX_NAME_LEN = 248;

// default timeouts (seconds) when neither -t nor BT_TIMEOUT is given
inline constexpr std::uint32_t DEFAULT_SCAN_SECS    = 30;
inline constexpr std::uint32_t DEFAULT_ACTION_SECS  = 5;
inline constexpr std::uint32_t FALLBACK_TERM_COLS   = 80;
// reply timeout for single bus calls (Connect, RemoveDevice, ...)
inline constexpr std::uint32_t BUS_CALL_SECS        = 60;
// how long a canceled Pair may take to report back
inline constexpr std::uint32_t CANCEL_GRACE_SECS    = 5;

// Timeout for scans and pairing attempts: BT_TIMEOUT, else fallback
[[maybe_unused]] static std::uint32_t timeout_secs(std::uint32_t fallback)
{
    const char *e = std::getenv("BT_TIMEOUT");
    if (!e || !*e)
        return fallback;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    while (p && (*p == ' ' || *p == '\t' || *p == '\n'))
        ++p;
    if (!p || *p != '\0' || p == e || v > 86400)
    {
        LOG_WARN("Ignoring invalid BT_TIMEOUT='%s', using %u", e, fallback);
        return fallback;
    }
    return static_cast<std::uint32_t>(v);
}

// "bluez" (default) or "bluetoothctl"
[[maybe_unused]] static std::string backend_name()
{
    if (const char *p = std::getenv("BLUELIST_BACKEND"); p && *p)
        return std::string(p);
    return "bluez";
}

// Empty means every adapter BlueZ reports
[[maybe_unused]] static std::string adapter_name()
{
    if (const char *p = std::getenv("BLUELIST_ADAPTER"); p && *p)
        return std::string(p);
    return std::string{};
}

[[maybe_unused]] static std::string bluetoothctl_path()
{
    if (const char *p = std::getenv("BLUELIST_BLUETOOTHCTL"); p && *p)
        return std::string(p);
    return "bluetoothctl";
}

}  // namespace constants
