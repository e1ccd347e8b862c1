#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace directory
{

struct Device
{
    std::string address;  // "AA:BB:CC:DD:EE:FF", never changes
    std::string name;     // alias, may be renamed locally

    bool paired    = false;
    bool bonded    = false;
    bool trusted   = false;
    bool blocked   = false;
    bool connected = false;

    std::optional<std::string>  remote_name;  // over-the-air name, never renamed
    std::optional<std::uint8_t> battery;      // 0..100
    std::optional<std::string>  icon;
    std::optional<std::string>  adapter;  // owning adapter object path (bus backend)
};

// Shared record: every view of a directory points at the same cell
struct DeviceCell
{
    explicit DeviceCell(Device d) : dev(std::move(d)) {}

    std::mutex mu;
    Device     dev;
};
using DeviceHandle = std::shared_ptr<DeviceCell>;

inline DeviceHandle make_handle(Device d)
{
    return std::make_shared<DeviceCell>(std::move(d));
}

// Display width in code points (UTF-8 continuation bytes do not count)
std::size_t name_width(const std::string &name);

bool has_whitespace(const std::string &name);

// non-empty address and a name within the broadcast ceiling
bool valid_device(const Device &d);

// ---- presentation ----
std::string colored_name(const Device &d, bool color);

// 'name' when the name has whitespace, otherwise " name " so columns line up
std::string quoted_name(const Device &d, bool color);

// "address name" followed by one tab-indented line per known property
std::string info_block(const Device &d, bool color);

}  // namespace directory
