#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "directory/device.hpp"

namespace backend
{

using directory::Device;

struct Snapshot
{
    std::vector<Device>      devices;
    std::vector<std::string> adapters;  // object paths or controller addresses
};

// One instance per process; every call may run on a bulk-action thread
struct IBackend
{
    // false only when the transport itself is unreachable
    virtual bool refresh_snapshot(Snapshot &out) = 0;

    // blocks for up to `window`, not cancellable
    virtual bool scan(std::chrono::seconds window) = 0;
    virtual bool set_pairable(bool on)             = 0;

    virtual bool pair(const Device &d)       = 0;  // already paired => true, no transport call
    virtual bool unpair(const Device &d)     = 0;
    virtual bool connect(const Device &d)    = 0;  // already connected => true, no transport call
    virtual bool disconnect(const Device &d) = 0;

    // re-fetch one device's detail in place
    virtual bool info(Device &d) = 0;

    virtual std::string name() const { return ""; }
    virtual ~IBackend() = default;
};

}  // namespace backend
