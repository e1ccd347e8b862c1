/* ======================================================================
 * BlueZ backend: call map
 *
 *  IBackend call             BlueZ / D-Bus
 *  -------------             -------------
 *  refresh_snapshot()  ───▶  ObjectManager.GetManagedObjects on "/"
 *                              Adapter1 objects  -> adapters
 *                              Device1 (+Battery1) objects -> devices
 *  scan(window)        ───▶  Adapter1.StartDiscovery, sleep, Adapter1.StopDiscovery
 *  set_pairable(on)    ───▶  Adapter1.Pairable = on
 *  connect(dev)        ───▶  Device1.Connect    (AlreadyConnected => ok)
 *  disconnect(dev)     ───▶  Device1.Disconnect
 *  unpair(dev)         ───▶  Adapter1.RemoveDevice(dev path)
 *  info(dev)           ───▶  Properties.GetAll(Device1), Properties.GetAll(Battery1)
 *  pair(dev)           ───▶  see bluez_backend_pair.cpp
 *
 *  All sd-bus calls are made under impl_->bus_mu, never while sleeping.
 * ====================================================================== */

#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>
#include <utility>

// clang-format off
#include "backend/bluez_backend.hpp"
#include "backend/bluez_backend_impl.hpp"
#include "backend/bluez_dbus_util.hpp"
#include "term/ansi.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
// clang-format on

#if BLUELIST_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{

using backend::Device;

// Device1 / Battery1 properties as read off the bus, before validation
struct PartialDevice
{
    std::optional<std::string>  address, alias, name, icon, adapter;
    std::optional<bool>         paired, bonded, trusted, blocked, connected;
    std::optional<std::uint8_t> battery;
};

static int read_device_prop(sd_bus_message *m, const char *key, PartialDevice &pd)
{
    using backend::read_var_b;
    using backend::read_var_s;
    if (std::strcmp(key, "Address") == 0)
        return read_var_s(m, pd.address);
    if (std::strcmp(key, "Alias") == 0)
        return read_var_s(m, pd.alias);
    if (std::strcmp(key, "Name") == 0)
        return read_var_s(m, pd.name);
    if (std::strcmp(key, "Icon") == 0)
        return read_var_s(m, pd.icon);
    if (std::strcmp(key, "Adapter") == 0)
        return backend::read_var_o(m, pd.adapter);
    if (std::strcmp(key, "Paired") == 0)
        return read_var_b(m, pd.paired);
    if (std::strcmp(key, "Bonded") == 0)
        return read_var_b(m, pd.bonded);
    if (std::strcmp(key, "Trusted") == 0)
        return read_var_b(m, pd.trusted);
    if (std::strcmp(key, "Blocked") == 0)
        return read_var_b(m, pd.blocked);
    if (std::strcmp(key, "Connected") == 0)
        return read_var_b(m, pd.connected);
    return sd_bus_message_skip(m, "v");
}

// ======================================================================
// Function: read_props
// - In: message positioned at an a{sv} of Device1 or Battery1
// - Out: known keys stored in pd, everything else skipped
// - Note: wrong variant types leave the field unset
// ======================================================================
static int read_props(sd_bus_message *m, PartialDevice &pd, bool battery_iface)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (!key)
            r = sd_bus_message_skip(m, "v");
        else if (battery_iface)
            r = std::strcmp(key, "Percentage") == 0 ? backend::read_var_y(m, pd.battery)
                                                    : sd_bus_message_skip(m, "v");
        else
            r = read_device_prop(m, key, pd);
        if (r < 0)
            return r;

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

// first missing required property, nullptr when complete
static const char *missing_required(const PartialDevice &pd)
{
    if (!pd.address)
        return "Address";
    if (!pd.alias)
        return "Alias";
    if (!pd.paired)
        return "Paired";
    if (!pd.bonded)
        return "Bonded";
    if (!pd.trusted)
        return "Trusted";
    if (!pd.blocked)
        return "Blocked";
    if (!pd.connected)
        return "Connected";
    return nullptr;
}

static Device to_device(const PartialDevice &pd)
{
    Device d;
    d.address     = backend::mac_upper(*pd.address);
    d.name        = *pd.alias;
    d.paired      = *pd.paired;
    d.bonded      = *pd.bonded;
    d.trusted     = *pd.trusted;
    d.blocked     = *pd.blocked;
    d.connected   = *pd.connected;
    d.remote_name = pd.name;
    d.icon        = pd.icon;
    d.adapter     = pd.adapter;
    if (pd.battery && *pd.battery <= 100)
        d.battery = pd.battery;
    return d;
}

static bool adapter_wanted(const std::string &filter, const std::string &adapter_path)
{
    if (filter.empty())
        return true;
    const std::string tail = "/" + filter;
    return adapter_path.size() >= tail.size() &&
           adapter_path.compare(adapter_path.size() - tail.size(), tail.size(), tail) == 0;
}

// ======================================================================
// Function: call_timed_locked
// - In: bus_mu locked, object path, interface, method, optional object
//       path argument
// - Out: sd-bus result, err_name set to the D-Bus error name on failure
// - Note: waits BUS_CALL_SECS for the reply; -t never shortens a call
//         BlueZ is still working on
// ======================================================================
static int call_timed_locked(sd_bus            *bus,
                             const std::string &path,
                             std::string_view   iface,
                             const char        *method,
                             const char        *obj_arg,
                             std::string       &err_name)
{
    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    const uint64_t  usec = static_cast<uint64_t>(constants::BUS_CALL_SECS) * 1000000ULL;

    int r = sd_bus_message_new_method_call(bus, &msg, constants::BLUEZ_SERVICE.data(),
                                           path.c_str(), iface.data(), method);
    if (r < 0)
        goto out;
    if (obj_arg)
    {
        r = sd_bus_message_append(msg, "o", obj_arg);
        if (r < 0)
            goto out;
    }
    r = sd_bus_call(bus, msg, usec, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        err_name = err.name ? err.name : "";
        LOG_DEBUG("[BLUEZ] %s on %s failed: %s", method, path.c_str(),
                  err.message ? err.message : strerror(-r));
    }
    sd_bus_error_free(&err);
    return r;
}

}  // namespace
#endif

namespace backend
{

BluezBackend::BluezBackend() : impl_(std::make_unique<Impl>()) {}

BluezBackend::~BluezBackend()
{
#if BLUELIST_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
#endif
}

std::string BluezBackend::name() const
{
    return "bluez";
}

void BluezBackend::set_pair_timeout(std::chrono::seconds t)
{
    impl_->pair_timeout = t;
}

void BluezBackend::set_interactive(bool on)
{
    impl_->interactive = on;
}

void BluezBackend::set_adapter_filter(std::string name)
{
    impl_->adapter_filter = std::move(name);
}

void BluezBackend::set_prompt(agent::Prompt *p)
{
    impl_->prompt = p ? p : &impl_->stdio_prompt;
}

// ======================================================================
// Function: BluezBackend::open
// - In: none
// - Out: true once connected to the system bus
// - Note: the only place the bus is opened, every other call needs it
// ======================================================================
bool BluezBackend::open()
{
#if !BLUELIST_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] built without sd-bus, use BLUELIST_BACKEND=bluetoothctl");
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->bus)
        return true;
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] sd_bus_open_system failed: %s", strerror(-r));
        impl_->bus = nullptr;
        return false;
    }
    const char *unique = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &unique) >= 0 && unique)
        LOG_DEBUG("[BLUEZ] connected as %s", unique);
    return true;
#endif
}

bool BluezBackend::adopt(sd_bus *bus)
{
#if !BLUELIST_HAVE_SDBUS
    (void)bus;
    LOG_ERROR("[BLUEZ] built without sd-bus");
    return false;
#else
    if (!bus)
        return false;
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->bus)
    {
        LOG_WARN("[BLUEZ] already connected, not adopting another bus");
        return false;
    }
    impl_->bus = bus;
    return true;
#endif
}

std::optional<std::string> BluezBackend::device_path(const Device &d) const
{
    {
        std::lock_guard<std::mutex> lk(impl_->paths_mu);
        auto                        it = impl_->paths.find(mac_upper(d.address));
        if (it != impl_->paths.end())
            return it->second;
        if (!d.adapter && impl_->adapters.size() == 1)
            return dev_path_from(impl_->adapters.front(), d.address);
    }
    if (d.adapter)
        return dev_path_from(*d.adapter, d.address);
    LOG_WARN("[BLUEZ] no object path known for %s", d.address.c_str());
    return std::nullopt;
}

// ======================================================================
// Function: BluezBackend::refresh_snapshot
// - In: none
// - Out: every Device1 with all required properties, every Adapter1
// - Note: an incomplete device is skipped with a warning; only a failed
//         GetManagedObjects call fails the refresh
// ======================================================================
bool BluezBackend::refresh_snapshot(Snapshot &out)
{
#if !BLUELIST_HAVE_SDBUS
    (void)out;
    LOG_ERROR("[BLUEZ] built without sd-bus");
    return false;
#else
    sd_bus_message                              *reply = nullptr;
    sd_bus_error                                 err{};
    Snapshot                                     snap;
    std::unordered_map<std::string, std::string> paths;
    int                                          r = 0;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->bus)
            return false;
        r = sd_bus_call_method(impl_->bus, constants::BLUEZ_SERVICE.data(), "/",
                               "org.freedesktop.DBus.ObjectManager", "GetManagedObjects", &err,
                               &reply, "");
    }
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] GetManagedObjects failed: %s",
                  err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    // Walk a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    // --- Objects
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        if (!obj)
        {
            r = -EINVAL;
            goto out;
        }
        const std::string path(obj);

        PartialDevice pd;
        bool          is_device = false, is_adapter = false;

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;

            if (iface && constants::DEVICE_IFACE == iface)
            {
                is_device = true;
                r         = read_props(reply, pd, false);
            }
            else if (iface && constants::BATTERY_IFACE == iface)
                r = read_props(reply, pd, true);
            else
            {
                if (iface && constants::ADAPTER_IFACE == iface)
                    is_adapter = true;
                r = sd_bus_message_skip(reply, "a{sv}");
            }
            if (r < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;

        if (is_adapter && adapter_wanted(impl_->adapter_filter, path))
            snap.adapters.push_back(path);
        if (!is_device)
            continue;

        if (!pd.adapter)
            pd.adapter = adapter_of_path(path);
        if (!adapter_wanted(impl_->adapter_filter, *pd.adapter))
            continue;
        if (const char *miss = missing_required(pd))
        {
            LOG_WARN("[BLUEZ] skipping %s: no %s property", path.c_str(), miss);
            continue;
        }
        Device d = to_device(pd);
        if (!directory::valid_device(d))
        {
            LOG_WARN("[BLUEZ] skipping %s: name longer than %zu", path.c_str(),
                     constants::MAX_NAME_LEN);
            continue;
        }
        // same device seen through a second adapter: first path wins
        if (!paths.emplace(mac_upper(d.address), path).second)
        {
            LOG_WARN("[BLUEZ] skipping %s: %s already listed", path.c_str(), d.address.c_str());
            continue;
        }
        snap.devices.push_back(std::move(d));
    }
    if (r < 0)
        goto out;
    r = sd_bus_message_exit_container(reply);

out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] malformed GetManagedObjects reply: %s", strerror(-r));
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(impl_->paths_mu);
        impl_->paths.swap(paths);
        impl_->adapters = snap.adapters;
    }
    LOG_DEBUG("[BLUEZ] snapshot: %zu devices, %zu adapters", snap.devices.size(),
              snap.adapters.size());
    out = std::move(snap);
    return true;
#endif
}

// ======================================================================
// Function: BluezBackend::scan
// - In: window to keep discovery running
// - Out: true if discovery started on at least one adapter
// - Note: blocks for the whole window, the bus mutex is not held meanwhile
// ======================================================================
bool BluezBackend::scan(std::chrono::seconds window)
{
#if !BLUELIST_HAVE_SDBUS
    (void)window;
    LOG_ERROR("[BLUEZ] built without sd-bus");
    return false;
#else
    std::vector<std::string> adapters;
    {
        std::lock_guard<std::mutex> lk(impl_->paths_mu);
        adapters = impl_->adapters;
    }
    if (adapters.empty())
    {
        Snapshot s;
        if (!refresh_snapshot(s))
            return false;
        adapters = s.adapters;
    }

    std::vector<std::string> started;
    for (const auto &a : adapters)
    {
        std::string                 ename;
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->bus)
            return false;
        int r = call_timed_locked(impl_->bus, a, constants::ADAPTER_IFACE, "StartDiscovery",
                                  nullptr, ename);
        if (r >= 0 || ename == "org.bluez.Error.InProgress")
            started.push_back(a);
        else
            LOG_WARN("[BLUEZ] StartDiscovery failed on %s", a.c_str());
    }
    if (started.empty())
        return false;

    if (impl_->interactive)
        std::cout << ansi::DIM << "Scanning for devices..." << ansi::RESET << std::flush;
    std::this_thread::sleep_for(window);

    for (const auto &a : started)
    {
        std::string                 ename;
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->bus)
            break;
        if (call_timed_locked(impl_->bus, a, constants::ADAPTER_IFACE, "StopDiscovery", nullptr,
                              ename) < 0)
            LOG_WARN("[BLUEZ] StopDiscovery failed on %s (%s)", a.c_str(), ename.c_str());
    }
    if (impl_->interactive)
        std::cout << ansi::CLEAR_LINE << std::flush;
    return true;
#endif
}

bool BluezBackend::set_pairable(bool on)
{
#if !BLUELIST_HAVE_SDBUS
    (void)on;
    return false;
#else
    std::vector<std::string> adapters;
    {
        std::lock_guard<std::mutex> lk(impl_->paths_mu);
        adapters = impl_->adapters;
    }
    bool ok = !adapters.empty();
    for (const auto &a : adapters)
    {
        sd_bus_error                err{};
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->bus)
            return false;
        int r = sd_bus_set_property(impl_->bus, constants::BLUEZ_SERVICE.data(), a.c_str(),
                                    constants::ADAPTER_IFACE.data(), "Pairable", &err, "b",
                                    on ? 1 : 0);
        if (r < 0)
        {
            LOG_WARN("[BLUEZ] setting Pairable=%d on %s failed: %s", on ? 1 : 0, a.c_str(),
                     err.message ? err.message : strerror(-r));
            ok = false;
        }
        sd_bus_error_free(&err);
    }
    return ok;
#endif
}

// ======================================================================
// Function: BluezBackend::connect
// - In: device record
// - Out: true when connected, or already connected
// - Note: AlreadyConnected from BlueZ also counts as success
// ======================================================================
bool BluezBackend::connect(const Device &d)
{
    if (d.connected)
        return true;
#if !BLUELIST_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] built without sd-bus");
    return false;
#else
    auto path = device_path(d);
    if (!path)
        return false;
    std::string                 ename;
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;
    int r = call_timed_locked(impl_->bus, *path, constants::DEVICE_IFACE, "Connect", nullptr,
                              ename);
    if (r >= 0)
        return true;
    if (constants::ERR_ALREADY_CONN == ename)
    {
        LOG_INFO("[BLUEZ] %s already connected", d.address.c_str());
        return true;
    }
    return false;
#endif
}

bool BluezBackend::disconnect(const Device &d)
{
#if !BLUELIST_HAVE_SDBUS
    (void)d;
    LOG_ERROR("[BLUEZ] built without sd-bus");
    return false;
#else
    auto path = device_path(d);
    if (!path)
        return false;
    std::string                 ename;
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;
    return call_timed_locked(impl_->bus, *path, constants::DEVICE_IFACE, "Disconnect", nullptr,
                             ename) >= 0;
#endif
}

// ======================================================================
// Function: BluezBackend::unpair
// - In: device record
// - Out: true when the owning adapter removed the device
// ======================================================================
bool BluezBackend::unpair(const Device &d)
{
#if !BLUELIST_HAVE_SDBUS
    (void)d;
    LOG_ERROR("[BLUEZ] built without sd-bus");
    return false;
#else
    auto path = device_path(d);
    if (!path)
        return false;
    const std::string adapter = d.adapter ? *d.adapter : adapter_of_path(*path);
    if (adapter.empty())
    {
        LOG_WARN("[BLUEZ] no adapter for %s", d.address.c_str());
        return false;
    }
    std::string                 ename;
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;
    return call_timed_locked(impl_->bus, adapter, constants::ADAPTER_IFACE, "RemoveDevice",
                             path->c_str(), ename) >= 0;
#endif
}

// ======================================================================
// Function: BluezBackend::info
// - In: device record to update in place
// - Out: true when Device1 properties were re-read
// - Note: Battery1 is optional; the record is untouched on failure
// ======================================================================
bool BluezBackend::info(Device &d)
{
#if !BLUELIST_HAVE_SDBUS
    (void)d;
    return false;
#else
    auto path = device_path(d);
    if (!path)
        return false;

    PartialDevice pd;
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    for (const std::string_view iface : {constants::DEVICE_IFACE, constants::BATTERY_IFACE})
    {
        const bool      battery = iface == constants::BATTERY_IFACE;
        sd_bus_message *reply   = nullptr;
        sd_bus_error    err{};
        int r = sd_bus_call_method(impl_->bus, constants::BLUEZ_SERVICE.data(), path->c_str(),
                                   "org.freedesktop.DBus.Properties", "GetAll", &err, &reply,
                                   "s", iface.data());
        if (r >= 0)
            r = read_props(reply, pd, battery);
        if (reply)
            sd_bus_message_unref(reply);
        if (r < 0)
        {
            if (!battery)
                LOG_WARN("[BLUEZ] GetAll(%s) on %s failed: %s", iface.data(), path->c_str(),
                         err.message ? err.message : strerror(-r));
            sd_bus_error_free(&err);
            if (!battery)
                return false;
            continue;
        }
        sd_bus_error_free(&err);
    }

    if (const char *miss = missing_required(pd))
    {
        LOG_WARN("[BLUEZ] %s lost its %s property", path->c_str(), miss);
        return false;
    }
    Device fresh = to_device(pd);
    if (!fresh.adapter)
        fresh.adapter = d.adapter;
    if (!directory::valid_device(fresh))
        return false;
    d = std::move(fresh);
    return true;
#endif
}

}  // namespace backend
