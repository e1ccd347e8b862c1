#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "agent/pairing_agent.hpp"
#include "backend/ibackend.hpp"

struct sd_bus;

namespace backend
{

// ======================================================================
// Class: BluezBackend
// - BlueZ over the system bus (sd-bus)
// - Every sd-bus access is serialized by one bus mutex; bulk actions call
//   in from one thread per device
// - pair() drives the bus itself until the Pair reply arrives, answering
//   agent challenges on the same thread
// ======================================================================
class BluezBackend final : public IBackend
{
  public:
    BluezBackend();
    ~BluezBackend() override;

    // connects to the system bus; false when the bus is unreachable
    bool open();
    // takes over an already started connection, e.g. a peer socket;
    // owned (and closed) by the backend once this returns true
    bool adopt(sd_bus *bus);

    bool refresh_snapshot(Snapshot &out) override;
    bool scan(std::chrono::seconds window) override;
    bool set_pairable(bool on) override;
    bool pair(const Device &d) override;
    bool unpair(const Device &d) override;
    bool connect(const Device &d) override;
    bool disconnect(const Device &d) override;
    bool info(Device &d) override;

    std::string name() const override;

    // how long Pair may sit without a reply or a challenge before it is
    // canceled; 0 waits for BlueZ. Other calls use BUS_CALL_SECS
    void set_pair_timeout(std::chrono::seconds t);
    // show the scan hint on stdout
    void set_interactive(bool on);
    // "hci0" keeps adapter-scoped calls on that adapter only
    void set_adapter_filter(std::string name);
    // challenges are answered through this prompt (default stdin/stdout)
    void set_prompt(agent::Prompt *p);

    // object path for an address, from the last refresh or the owning adapter
    std::optional<std::string> device_path(const Device &d) const;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool pair_with_agent(const Device &d, const std::string &path);
};

}  // namespace backend
